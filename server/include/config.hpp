#pragma once

#include "endpoint_resolver.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pcdrop {

constexpr std::uintmax_t DEFAULT_MAX_UPLOAD = 500ull * 1000 * 1000; // 500 MB

struct ServerConfig {
    std::string uploads_dir = "uploads";
    std::string downloads_dir = "downloads";
    std::uintmax_t max_upload_bytes = DEFAULT_MAX_UPLOAD;
    std::chrono::milliseconds drain_timeout{5000};
    std::chrono::milliseconds idle_timeout{15000};
    int zip_level = 6;
    bool bind_any = false;
    bool stamp_uploads = false;
    std::vector<std::string> hotspot_subnets{
        "192.168.43.0/24",   // Android tethering
        "192.168.49.0/24",   // Wi-Fi Direct group owner
        "10.42.0.0/24",      // NetworkManager shared connection
        "192.168.137.0/24",  // Windows mobile hotspot
        "172.20.10.0/28",    // iOS personal hotspot
    };
    std::vector<std::string> hotspot_interface_prefixes{"ap", "p2p-", "swlan"};
    EndpointConfig endpoint;
};

// merges keys present in a JSON config file over config; throws InvalidConfig
void load_config_file(const std::string &path, ServerConfig &config);

// checks ranges and subnet syntax; throws InvalidConfig
void validate_config(const ServerConfig &config);

} // namespace pcdrop
