#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "pcdrop/version.hpp"
#include "pcdrop/errors.hpp"
#include "config.hpp"
#include "lifecycle.hpp"

namespace {

volatile std::sig_atomic_t stop_requested = 0;

void on_signal(int) {
    stop_requested = 1;
}

void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --config <file>          JSON config file, applied before the flags below\n"
              << "  --port <n>               port to listen on (default " << pcdrop::DEFAULT_PORT << ")\n"
              << "  --mode hotspot|lan       which interface to advertise (default hotspot)\n"
              << "  --uploads <dir>          where received files are stored (default uploads)\n"
              << "  --downloads <dir>        directory offered to the phone (default downloads)\n"
              << "  --max-upload <bytes>     upload size limit (default 500000000)\n"
              << "  --zip-level <0-9>        archive compression, 0 stores entries (default 6)\n"
              << "  --hotspot-subnet <cidr>  hotspot subnet, repeatable; replaces the defaults\n"
              << "  --bind-any               listen on every interface\n"
              << "  --stamp-uploads          prefix stored uploads with a timestamp\n"
              << "  --drain-timeout <ms>     how long stop waits for running transfers (default 5000)\n";
}

std::uintmax_t parse_number(const std::string &flag, const std::string &value) {
    try {
        size_t used = 0;
        unsigned long long n = std::stoull(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return n;
    } catch (const std::logic_error &) {
        throw pcdrop::TransferError(pcdrop::ErrorKind::InvalidConfig, flag + " expects a number, got " + value);
    }
}

}

int main(int argc, char* argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;

    pcdrop::ServerConfig config;
    try {
        // config file first so flags override it
        for (int i = 1; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") {
                pcdrop::load_config_file(argv[i + 1], config);
            }
        }

        bool subnets_given = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" && has_value) {
                ++i;
            } else if (arg == "--port" && has_value) {
                std::uintmax_t port = parse_number(arg, argv[++i]);
                if (port < 1 || port > 65535) {
                    throw pcdrop::TransferError(pcdrop::ErrorKind::InvalidConfig, "Port must be between 1 and 65535");
                }
                config.endpoint.port = static_cast<std::uint16_t>(port);
            } else if (arg == "--mode" && has_value) {
                config.endpoint.mode = pcdrop::parse_mode(argv[++i]);
            } else if (arg == "--uploads" && has_value) {
                config.uploads_dir = argv[++i];
            } else if (arg == "--downloads" && has_value) {
                config.downloads_dir = argv[++i];
            } else if (arg == "--max-upload" && has_value) {
                config.max_upload_bytes = parse_number(arg, argv[++i]);
            } else if (arg == "--zip-level" && has_value) {
                config.zip_level = static_cast<int>(parse_number(arg, argv[++i]));
            } else if (arg == "--hotspot-subnet" && has_value) {
                if (!subnets_given) {
                    config.hotspot_subnets.clear();
                    subnets_given = true;
                }
                config.hotspot_subnets.push_back(argv[++i]);
            } else if (arg == "--drain-timeout" && has_value) {
                config.drain_timeout = std::chrono::milliseconds(parse_number(arg, argv[++i]));
            } else if (arg == "--bind-any") {
                config.bind_any = true;
            } else if (arg == "--stamp-uploads") {
                config.stamp_uploads = true;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        pcdrop::validate_config(config);
    } catch (const pcdrop::TransferError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "Starting pcdrop (version " << pcdrop::version() << ") in " << pcdrop::mode_name(config.endpoint.mode) << " mode" << std::endl;
    pcdrop::LifecycleController controller(config);
    try {
        pcdrop::ResolvedEndpoint endpoint = controller.start();
        std::cout << "Open " << endpoint.url << " on your phone" << std::endl;
        std::cout << "Uploads are stored in " << config.uploads_dir << ", downloads served from " << config.downloads_dir << std::endl;
    } catch (const std::exception &) {
        // the controller already logged it
        return 2;
    }

    while (!stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    controller.stop();
    std::cout << "Server exited." << std::endl;
    return 0;
}
