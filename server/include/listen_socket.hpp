#pragma once

#include <cstdint>
#include <string>

namespace pcdrop {

// Owns a bound, listening TCP socket. Move-only.
class ListenSocket {
public:
    ListenSocket() = default;
    ~ListenSocket();

    ListenSocket(const ListenSocket &) = delete;
    ListenSocket &operator=(const ListenSocket &) = delete;
    ListenSocket(ListenSocket &&other) noexcept;
    ListenSocket &operator=(ListenSocket &&other) noexcept;

    // throws PortUnavailable when the address is in use, IOError otherwise
    static ListenSocket open(const std::string &address, const std::uint16_t &port, const int &backlog = 16);

    int fd() const { return this->socket_fd; }
    std::uint16_t port() const;
    bool valid() const { return this->socket_fd >= 0; }
    void close();

private:
    explicit ListenSocket(const int &fd) : socket_fd(fd) {}

    int socket_fd = -1;
};

} // namespace pcdrop
