#pragma once

#include "config.hpp"
#include "endpoint_resolver.hpp"
#include "events.hpp"
#include "filesystem_view.hpp"
#include "transfer_server.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace pcdrop {

enum class ServerState {
    Stopped,
    Starting,
    Running,
    Stopping
};

const char *state_name(const ServerState &state);

// Owns one server instance: Stopped -> Starting -> Running -> Stopping -> Stopped.
// The connection counter and event channel live here and are handed to the
// server explicitly, so independent controllers never share state.
class LifecycleController {
public:
    // interfaces defaults to the host's real interface list
    explicit LifecycleController(ServerConfig config, std::shared_ptr<const InterfaceSource> interfaces = nullptr, const bool &echo = true);
    ~LifecycleController();

    LifecycleController(const LifecycleController &) = delete;
    LifecycleController &operator=(const LifecycleController &) = delete;

    // throws AlreadyRunning, NoInterface, PortUnavailable, InvalidConfig or IOError; the state is Stopped again after any failure
    ResolvedEndpoint start(const EndpointConfig &endpoint);
    ResolvedEndpoint start() { return this->start(this->base_config.endpoint); }

    // graceful; no-op when already stopped
    void stop();

    ServerState state() const { return this->current.load(); }
    int connections() const { return this->counter.value(); }
    std::optional<ResolvedEndpoint> endpoint() const;
    EventChannel &events() { return this->event_channel; }
    const ServerConfig &config() const { return this->base_config; }

private:
    ServerConfig base_config;
    ServerConfig running_config;
    std::shared_ptr<const InterfaceSource> interfaces;
    EventChannel event_channel;
    ConnectionCounter counter;
    FilesystemView view;
    std::unique_ptr<TransferServer> server;
    std::optional<ResolvedEndpoint> resolved;
    std::atomic<ServerState> current{ServerState::Stopped};
    mutable std::mutex mutex;
};

} // namespace pcdrop
