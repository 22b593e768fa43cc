#pragma once

#include "listen_socket.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace pcdrop {

constexpr std::uint16_t DEFAULT_PORT = 1234;

enum class TransferMode {
    Hotspot,
    Lan
};

const char *mode_name(const TransferMode &mode);
TransferMode parse_mode(const std::string &name);

struct EndpointConfig {
    TransferMode mode = TransferMode::Hotspot;
    std::uint16_t port = DEFAULT_PORT;
};

struct ResolvedEndpoint {
    std::string address;
    std::uint16_t port = 0;
    std::string url;
};

struct NetworkInterface {
    std::string name;
    std::string address;          // dotted IPv4
    bool up = true;
    bool loopback = false;
    bool default_route = false;
    bool hotspot_adapter = false;
};

class InterfaceSource {
public:
    virtual ~InterfaceSource() = default;
    virtual std::vector<NetworkInterface> interfaces() const = 0;
};

// getifaddrs() plus /proc/net/route for the default route
class SystemInterfaceSource : public InterfaceSource {
public:
    explicit SystemInterfaceSource(std::vector<std::string> hotspot_prefixes);

    std::vector<NetworkInterface> interfaces() const override;

private:
    std::vector<std::string> hotspot_prefixes;
};

struct InterfaceMatcher {
    std::string description;
    std::function<bool(const NetworkInterface &)> matches;
};

InterfaceMatcher subnet_matcher(const std::string &cidr);
InterfaceMatcher hotspot_adapter_matcher();
InterfaceMatcher default_route_matcher();

struct InterfaceSelection {
    NetworkInterface iface;
    std::string matched_by;
    bool fallback = false;
};

struct BoundEndpoint {
    ResolvedEndpoint endpoint;
    ListenSocket socket;
    std::vector<std::string> warnings;
};

// Picks the address to advertise for a transfer mode by walking a prioritized
// matcher list over the active interfaces, then binds the requested port there.
class EndpointResolver {
public:
    EndpointResolver(const InterfaceSource &source, std::vector<InterfaceMatcher> hotspot_matchers, std::vector<InterfaceMatcher> lan_matchers);

    static std::vector<InterfaceMatcher> hotspotMatchers(const std::vector<std::string> &subnets);
    static std::vector<InterfaceMatcher> lanMatchers();

    InterfaceSelection select(const TransferMode &mode) const;
    BoundEndpoint bind(const EndpointConfig &config, const bool &bind_any = false) const;

private:
    const InterfaceSource &source;
    std::vector<InterfaceMatcher> hotspot_matchers;
    std::vector<InterfaceMatcher> lan_matchers;
};

} // namespace pcdrop
