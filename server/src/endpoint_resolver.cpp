#include "endpoint_resolver.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace pcdrop {

const char *mode_name(const TransferMode &mode) {
    return mode == TransferMode::Hotspot ? "hotspot" : "lan";
}

TransferMode parse_mode(const std::string &name) {
    std::string lower = to_lower(name);
    if (lower == "hotspot" || lower == "wifi-direct") {
        return TransferMode::Hotspot;
    }
    if (lower == "lan" || lower == "wifi" || lower == "internet") {
        return TransferMode::Lan;
    }
    throw TransferError(ErrorKind::InvalidConfig, "Unknown transfer mode: " + name);
}

namespace {

bool parse_ipv4(const std::string &text, std::uint32_t &out) {
    in_addr addr{};
    if (::inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    out = ntohl(addr.s_addr);
    return true;
}

std::set<std::string> default_route_interfaces() {
    std::set<std::string> names;
    std::ifstream routes("/proc/net/route");
    if (!routes) {
        return names;
    }

    std::string line;
    std::getline(routes, line); // header
    while (std::getline(routes, line)) {
        std::istringstream iss(line);
        std::string iface, destination, gateway;
        unsigned int flags = 0;
        if (!(iss >> iface >> destination >> gateway >> std::hex >> flags)) {
            continue;
        }
        // RTF_UP with a 0.0.0.0 destination
        if (destination == "00000000" && (flags & 0x1)) {
            names.insert(iface);
        }
    }
    return names;
}

}

SystemInterfaceSource::SystemInterfaceSource(std::vector<std::string> hotspot_prefixes)
    : hotspot_prefixes(std::move(hotspot_prefixes)) {}

std::vector<NetworkInterface> SystemInterfaceSource::interfaces() const {
    std::vector<NetworkInterface> result;
    ifaddrs *ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) != 0 || !ifaddr) {
        return result;
    }

    std::set<std::string> defaults = default_route_interfaces();
    for (ifaddrs *ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_name || !ifa->ifa_addr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;

        char buf[INET_ADDRSTRLEN] = {0};
        auto *sin = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr);
        if (!::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.address = buf;
        iface.up = (ifa->ifa_flags & IFF_UP) && (ifa->ifa_flags & IFF_RUNNING);
        iface.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        iface.default_route = defaults.count(iface.name) > 0;
        for (const auto &prefix : this->hotspot_prefixes) {
            if (!prefix.empty() && iface.name.starts_with(prefix)) {
                iface.hotspot_adapter = true;
            }
        }
        result.push_back(iface);
    }
    ::freeifaddrs(ifaddr);
    return result;
}

InterfaceMatcher subnet_matcher(const std::string &cidr) {
    size_t slash = cidr.find('/');
    std::string base = cidr.substr(0, slash);
    int bits = 32;
    if (slash != std::string::npos) {
        try {
            bits = std::stoi(cidr.substr(slash + 1));
        } catch (const std::exception &) {
            bits = -1;
        }
    }
    std::uint32_t network = 0;
    if (!parse_ipv4(base, network) || bits < 0 || bits > 32) {
        throw TransferError(ErrorKind::InvalidConfig, "Invalid subnet: " + cidr);
    }
    std::uint32_t mask = bits == 0 ? 0 : 0xFFFFFFFFu << (32 - bits);

    return InterfaceMatcher{"subnet " + cidr, [network, mask](const NetworkInterface &iface) {
        std::uint32_t addr = 0;
        return parse_ipv4(iface.address, addr) && (addr & mask) == (network & mask);
    }};
}

InterfaceMatcher hotspot_adapter_matcher() {
    return InterfaceMatcher{"hotspot adapter", [](const NetworkInterface &iface) {
        return iface.hotspot_adapter;
    }};
}

InterfaceMatcher default_route_matcher() {
    return InterfaceMatcher{"default route", [](const NetworkInterface &iface) {
        return iface.default_route;
    }};
}

EndpointResolver::EndpointResolver(const InterfaceSource &source, std::vector<InterfaceMatcher> hotspot_matchers, std::vector<InterfaceMatcher> lan_matchers)
    : source(source), hotspot_matchers(std::move(hotspot_matchers)), lan_matchers(std::move(lan_matchers)) {}

std::vector<InterfaceMatcher> EndpointResolver::hotspotMatchers(const std::vector<std::string> &subnets) {
    std::vector<InterfaceMatcher> matchers{hotspot_adapter_matcher()};
    for (const auto &cidr : subnets) {
        matchers.push_back(subnet_matcher(cidr));
    }
    return matchers;
}

std::vector<InterfaceMatcher> EndpointResolver::lanMatchers() {
    return {default_route_matcher()};
}

InterfaceSelection EndpointResolver::select(const TransferMode &mode) const {
    std::vector<NetworkInterface> candidates;
    for (const auto &iface : this->source.interfaces()) {
        if (iface.up && !iface.loopback && !iface.address.empty()) {
            candidates.push_back(iface);
        }
    }
    if (candidates.empty()) {
        throw TransferError(ErrorKind::NoInterface, "No active non-loopback IPv4 interface found");
    }

    // first matcher wins, interfaces keep enumeration order within a matcher
    const auto &matchers = mode == TransferMode::Hotspot ? this->hotspot_matchers : this->lan_matchers;
    for (const auto &matcher : matchers) {
        for (const auto &iface : candidates) {
            if (matcher.matches(iface)) {
                return InterfaceSelection{iface, matcher.description, false};
            }
        }
    }
    return InterfaceSelection{candidates.front(), "first interface", true};
}

BoundEndpoint EndpointResolver::bind(const EndpointConfig &config, const bool &bind_any) const {
    if (config.port == 0) {
        throw TransferError(ErrorKind::InvalidConfig, "Port must be between 1 and 65535");
    }

    InterfaceSelection selection = this->select(config.mode);
    BoundEndpoint bound;
    if (selection.fallback) {
        if (config.mode == TransferMode::Hotspot) {
            bound.warnings.push_back("No hotspot interface detected, advertising " + selection.iface.name + " (" + selection.iface.address + ")");
        } else {
            bound.warnings.push_back("No default-route interface detected, advertising " + selection.iface.name + " (" + selection.iface.address + ")");
        }
    }

    bound.socket = ListenSocket::open(bind_any ? "0.0.0.0" : selection.iface.address, config.port);
    bound.endpoint.address = selection.iface.address;
    bound.endpoint.port = config.port;
    bound.endpoint.url = "http://" + selection.iface.address + ":" + std::to_string(config.port);
    return bound;
}

} // namespace pcdrop
