#include "pcdrop/helpers.hpp"
#include "pcdrop/errors.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace pcdrop {

const std::vector<std::string> split(const std::string &str, const char &delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= str.size()) {
        size_t pos = str.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string trim(const std::string &str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return str.substr(begin, end - begin);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

bool iequals(const std::string &a, const std::string &b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

namespace {

int hex_value(const char &c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

std::string url_decode(const std::string &str, const bool &plus_as_space) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string url_encode(const std::string &str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string format_time(const std::time_t &t, const char *format) {
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf, n);
}

size_t recv_some(const int &fd, char *buf, const size_t &len) {
    while (true) {
        ssize_t recvd = ::recv(fd, buf, len, 0);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw TransferError(ErrorKind::ConnectionClosed, "Timed out waiting for client data");
            }
            throw TransferError(ErrorKind::ConnectionClosed, std::string("recv: ") + std::strerror(errno));
        }
        return static_cast<size_t>(recvd);
    }
}

void send_all(const int &fd, const char *data, const size_t &len) {
    size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = ::send(fd, data + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw TransferError(ErrorKind::ConnectionClosed, std::string("send: ") + std::strerror(errno));
        }
        total_sent += static_cast<size_t>(sent);
    }
}

void send_all(const int &fd, const std::string &data) {
    send_all(fd, data.data(), data.size());
}

} // namespace pcdrop
