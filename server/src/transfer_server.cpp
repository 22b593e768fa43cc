#include "transfer_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace pcdrop {

namespace {

constexpr size_t MAX_LINGER_BYTES = 1024 * 1024;

}

TransferServer::TransferServer(ListenSocket socket, FilesystemView &view, const ServerConfig &config, EventChannel &events, ConnectionCounter &counter, const TransferMode &mode)
    : socket(std::move(socket)), bound_port(0), config(config), events(events), counter(counter),
      context{view, config, events, stopping, mode} {
    this->bound_port = this->socket.port();
}

TransferServer::~TransferServer() {
    this->stop(this->config.drain_timeout);
}

void TransferServer::start() {
    if (this->accepting.load() || !this->socket.valid()) {
        return;
    }
    this->stopping = false;
    this->accepting = true;
    this->accept_thread = std::thread(&TransferServer::acceptLoop, this);
}

void TransferServer::acceptLoop() {
    int listen_fd = this->socket.fd();

    // main server loop
    while (!this->stopping.load()) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listen_fd, &readfds);

        // wake up regularly to notice stop()
        timeval tv{};
        tv.tv_usec = 200 * 1000;
        int activity = ::select(listen_fd + 1, &readfds, nullptr, nullptr, &tv);
        if (activity < 0) {
            if (errno == EINTR) continue;
            this->events.error(std::string("select failed: ") + std::strerror(errno));
            break;
        }
        this->reapWorkers();
        if (activity == 0 || !FD_ISSET(listen_fd, &readfds)) {
            continue;
        }

        // new client -> accept connection and hand it to a worker
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                this->events.error(std::string("accept failed: ") + std::strerror(errno));
            }
            continue;
        }

        // idle keep-alive connections and stalled clients time out
        auto ms = this->config.idle_timeout.count();
        timeval timeout{};
        timeout.tv_sec = static_cast<time_t>(ms / 1000);
        timeout.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
        ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        ::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        char ipbuf[INET_ADDRSTRLEN] = {0};
        const char *ipstr = ::inet_ntop(AF_INET, &client_addr.sin_addr, ipbuf, sizeof(ipbuf));
        std::string peer = ipstr ? ipstr : "unknown";
        this->events.info("Client connected from " + peer + ":" + std::to_string(ntohs(client_addr.sin_port)));

        std::lock_guard<std::mutex> lock(this->workers_mutex);
        Worker &worker = this->workers.emplace_back();
        worker.fd = client_fd;
        worker.thread = std::thread(&TransferServer::serve, this, std::ref(worker), peer);
    }
    this->accepting = false;
}

void TransferServer::serve(Worker &worker, const std::string &peer) {
    {
        ConnectionGuard guard(this->counter);
        try {
            Session session(worker.fd, peer, this->context, &worker.busy);
            session.run();
        } catch (const std::exception &e) {
            this->events.error("Connection from " + peer + " failed: " + e.what());
        }
    }

    // lingering close: an early error response must not be lost to a reset
    // caused by request bytes we never read
    this->linger(worker.fd);

    // close under the lock so stop() never touches a recycled descriptor
    std::lock_guard<std::mutex> lock(this->workers_mutex);
    ::close(worker.fd);
    worker.fd = -1;
    worker.done = true;
    this->workers_cv.notify_all();
}

void TransferServer::linger(const int &fd) {
    ::shutdown(fd, SHUT_WR);
    if (this->stopping.load()) {
        return;
    }
    timeval timeout{};
    timeout.tv_sec = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    char discard[4096];
    size_t drained = 0;
    while (drained < MAX_LINGER_BYTES) {
        ssize_t n = ::recv(fd, discard, sizeof(discard), 0);
        if (n <= 0) {
            break;
        }
        drained += static_cast<size_t>(n);
    }
}

void TransferServer::reapWorkers() {
    std::lock_guard<std::mutex> lock(this->workers_mutex);
    for (auto it = this->workers.begin(); it != this->workers.end();) {
        if (it->done.load()) {
            it->thread.join();
            it = this->workers.erase(it);
        } else {
            ++it;
        }
    }
}

int TransferServer::activeWorkers() {
    std::lock_guard<std::mutex> lock(this->workers_mutex);
    int count = 0;
    for (const auto &worker : this->workers) {
        if (!worker.done.load()) {
            count++;
        }
    }
    return count;
}

void TransferServer::stop(const std::chrono::milliseconds &drain_timeout) {
    this->stopping = true;
    if (this->accept_thread.joinable()) {
        this->accept_thread.join();
    }
    this->accepting = false;

    // idle connections notice the stop flag on their own; requests that have
    // started get up to drain_timeout to finish
    std::unique_lock<std::mutex> lock(this->workers_mutex);
    bool drained = this->workers_cv.wait_for(lock, drain_timeout, [this]() {
        for (const auto &worker : this->workers) {
            if (!worker.done.load()) return false;
        }
        return true;
    });
    if (!drained) {
        int cancelled = 0;
        for (auto &worker : this->workers) {
            if (!worker.done.load() && worker.fd >= 0) {
                ::shutdown(worker.fd, SHUT_RDWR);
                if (worker.busy.load()) {
                    cancelled++;
                }
            }
        }
        this->events.warning("Cancelling " + std::to_string(cancelled) + " request(s) still running after the drain timeout");
    }
    lock.unlock();

    // no new workers can appear once the accept thread is gone
    for (auto &worker : this->workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    this->workers.clear();
    this->socket.close();
}

} // namespace pcdrop
