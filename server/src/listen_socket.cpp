#include "listen_socket.hpp"
#include "pcdrop/errors.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace pcdrop {

ListenSocket::~ListenSocket() {
    this->close();
}

ListenSocket::ListenSocket(ListenSocket &&other) noexcept : socket_fd(other.socket_fd) {
    other.socket_fd = -1;
}

ListenSocket &ListenSocket::operator=(ListenSocket &&other) noexcept {
    if (this != &other) {
        this->close();
        this->socket_fd = other.socket_fd;
        other.socket_fd = -1;
    }
    return *this;
}

ListenSocket ListenSocket::open(const std::string &address, const std::uint16_t &port, const int &backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        throw TransferError(ErrorKind::InvalidConfig, "Not an IPv4 address: " + address);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw TransferError(ErrorKind::IOError, std::string("socket: ") + std::strerror(errno));
    }
    ListenSocket sock(fd);

    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        throw TransferError(ErrorKind::IOError, std::string("setsockopt: ") + std::strerror(errno));
    }

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        if (err == EADDRINUSE) {
            throw TransferError(ErrorKind::PortUnavailable, "Port " + std::to_string(port) + " is already in use on " + address);
        }
        if (err == EACCES) {
            throw TransferError(ErrorKind::PortUnavailable, "Port " + std::to_string(port) + " requires elevated privileges");
        }
        throw TransferError(ErrorKind::IOError, "bind " + address + ":" + std::to_string(port) + ": " + std::strerror(err));
    }

    // a small backlog lets several phones queue while workers spin up
    if (::listen(fd, backlog) < 0) {
        throw TransferError(ErrorKind::IOError, std::string("listen: ") + std::strerror(errno));
    }
    return sock;
}

std::uint16_t ListenSocket::port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(this->socket_fd, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

void ListenSocket::close() {
    if (this->socket_fd >= 0) {
        ::close(this->socket_fd);
        this->socket_fd = -1;
    }
}

} // namespace pcdrop
