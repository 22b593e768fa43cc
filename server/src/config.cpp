#include "config.hpp"
#include "pcdrop/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace pcdrop {

void load_config_file(const std::string &path, ServerConfig &config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TransferError(ErrorKind::InvalidConfig, "Could not open config file " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception &e) {
        throw TransferError(ErrorKind::InvalidConfig, "Could not parse " + path + ": " + e.what());
    }
    if (!json.is_object()) {
        throw TransferError(ErrorKind::InvalidConfig, "Config file must hold a JSON object");
    }

    try {
        if (json.contains("uploads")) config.uploads_dir = json["uploads"].get<std::string>();
        if (json.contains("downloads")) config.downloads_dir = json["downloads"].get<std::string>();
        if (json.contains("max_upload_bytes")) config.max_upload_bytes = json["max_upload_bytes"].get<std::uintmax_t>();
        if (json.contains("drain_timeout_ms")) config.drain_timeout = std::chrono::milliseconds(json["drain_timeout_ms"].get<std::int64_t>());
        if (json.contains("idle_timeout_ms")) config.idle_timeout = std::chrono::milliseconds(json["idle_timeout_ms"].get<std::int64_t>());
        if (json.contains("zip_level")) config.zip_level = json["zip_level"].get<int>();
        if (json.contains("bind_any")) config.bind_any = json["bind_any"].get<bool>();
        if (json.contains("stamp_uploads")) config.stamp_uploads = json["stamp_uploads"].get<bool>();
        if (json.contains("hotspot_subnets")) config.hotspot_subnets = json["hotspot_subnets"].get<std::vector<std::string>>();
        if (json.contains("hotspot_interface_prefixes")) config.hotspot_interface_prefixes = json["hotspot_interface_prefixes"].get<std::vector<std::string>>();
        if (json.contains("mode")) config.endpoint.mode = parse_mode(json["mode"].get<std::string>());
        if (json.contains("port")) {
            int port = json["port"].get<int>();
            if (port < 1 || port > 65535) {
                throw TransferError(ErrorKind::InvalidConfig, "Port must be between 1 and 65535");
            }
            config.endpoint.port = static_cast<std::uint16_t>(port);
        }
    } catch (const nlohmann::json::exception &e) {
        throw TransferError(ErrorKind::InvalidConfig, "Invalid value in " + path + ": " + e.what());
    }
}

void validate_config(const ServerConfig &config) {
    if (config.endpoint.port == 0) {
        throw TransferError(ErrorKind::InvalidConfig, "Port must be between 1 and 65535");
    }
    if (config.zip_level < -1 || config.zip_level > 9) {
        throw TransferError(ErrorKind::InvalidConfig, "zip level must be between -1 and 9");
    }
    if (config.max_upload_bytes == 0) {
        throw TransferError(ErrorKind::InvalidConfig, "max upload size must be positive");
    }
    if (config.uploads_dir.empty() || config.downloads_dir.empty()) {
        throw TransferError(ErrorKind::InvalidConfig, "uploads and downloads directories are required");
    }
    if (config.drain_timeout.count() < 0 || config.idle_timeout.count() <= 0) {
        throw TransferError(ErrorKind::InvalidConfig, "timeouts must be positive");
    }
    for (const auto &cidr : config.hotspot_subnets) {
        (void)subnet_matcher(cidr);
    }
}

} // namespace pcdrop
