#pragma once

#include "config.hpp"
#include "events.hpp"
#include "filesystem_view.hpp"
#include "listen_socket.hpp"
#include "session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <thread>

namespace pcdrop {

// HTTP server over an already bound listening socket. One accept thread,
// one worker thread per client connection.
class TransferServer {
public:
    TransferServer(ListenSocket socket, FilesystemView &view, const ServerConfig &config, EventChannel &events, ConnectionCounter &counter, const TransferMode &mode);
    ~TransferServer();

    TransferServer(const TransferServer &) = delete;
    TransferServer &operator=(const TransferServer &) = delete;

    void start();

    // Stops accepting, waits up to drain_timeout for running requests, then
    // cancels what is left and releases the socket. Safe to call twice.
    void stop(const std::chrono::milliseconds &drain_timeout);

    std::uint16_t port() const { return this->bound_port; }
    bool running() const { return this->accepting.load(); }
    int activeWorkers();

private:
    struct Worker {
        std::thread thread;
        int fd = -1;
        std::atomic<bool> busy{false};
        std::atomic<bool> done{false};
    };

    ListenSocket socket;
    std::uint16_t bound_port;
    const ServerConfig &config;
    EventChannel &events;
    ConnectionCounter &counter;
    std::atomic<bool> stopping{false};
    std::atomic<bool> accepting{false};
    ServerContext context;

    std::thread accept_thread;
    std::mutex workers_mutex;
    std::condition_variable workers_cv;
    std::list<Worker> workers;

    void acceptLoop();
    void serve(Worker &worker, const std::string &peer);
    void linger(const int &fd);
    void reapWorkers();
};

} // namespace pcdrop
