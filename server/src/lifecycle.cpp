#include "lifecycle.hpp"
#include "pcdrop/errors.hpp"

namespace pcdrop {

const char *state_name(const ServerState &state) {
    switch (state) {
        case ServerState::Stopped:  return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running:  return "running";
        case ServerState::Stopping: return "stopping";
    }
    return "unknown";
}

LifecycleController::LifecycleController(ServerConfig config, std::shared_ptr<const InterfaceSource> interfaces, const bool &echo)
    : base_config(std::move(config)), interfaces(std::move(interfaces)), event_channel(1024, echo),
      counter(&event_channel), view(base_config.uploads_dir, base_config.downloads_dir) {
    if (!this->interfaces) {
        this->interfaces = std::make_shared<SystemInterfaceSource>(this->base_config.hotspot_interface_prefixes);
    }
}

LifecycleController::~LifecycleController() {
    this->stop();
}

ResolvedEndpoint LifecycleController::start(const EndpointConfig &endpoint) {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->current.load() != ServerState::Stopped) {
        TransferError error(ErrorKind::AlreadyRunning, std::string("Server is ") + state_name(this->current.load()));
        this->event_channel.error(error.what());
        throw error;
    }

    this->current = ServerState::Starting;
    try {
        this->running_config = this->base_config;
        this->running_config.endpoint = endpoint;
        validate_config(this->running_config);
        this->view.ensureRoots();

        EndpointResolver resolver(*this->interfaces,
                                  EndpointResolver::hotspotMatchers(this->running_config.hotspot_subnets),
                                  EndpointResolver::lanMatchers());
        BoundEndpoint bound = resolver.bind(endpoint, this->running_config.bind_any);
        for (const auto &warning : bound.warnings) {
            this->event_channel.warning(warning);
        }

        this->counter.reset();
        this->server = std::make_unique<TransferServer>(std::move(bound.socket), this->view, this->running_config,
                                                        this->event_channel, this->counter, endpoint.mode);
        this->server->start();
        this->resolved = bound.endpoint;
    } catch (const std::exception &e) {
        // whatever went wrong, a failed start leaves the controller startable again
        this->server.reset();
        this->resolved.reset();
        this->current = ServerState::Stopped;
        this->event_channel.error(std::string("Failed to start server: ") + e.what());
        throw;
    }

    this->current = ServerState::Running;
    this->event_channel.success(std::string("Server running at ") + this->resolved->url + " (" + mode_name(endpoint.mode) + " mode)");
    return *this->resolved;
}

void LifecycleController::stop() {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->current.load() != ServerState::Running) {
        return;
    }

    this->current = ServerState::Stopping;
    this->event_channel.info("Stopping server");
    this->server->stop(this->running_config.drain_timeout);
    this->server.reset();
    this->resolved.reset();
    this->current = ServerState::Stopped;
    this->event_channel.info("Server stopped");
}

std::optional<ResolvedEndpoint> LifecycleController::endpoint() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->resolved;
}

} // namespace pcdrop
