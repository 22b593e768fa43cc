#include "test_support.hpp"
#include "listen_socket.hpp"
#include "pcdrop/helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pcdrop::test {

namespace fs = std::filesystem;

namespace {

std::uint16_t get16(const std::string &s, const size_t &at) {
    if (at + 2 > s.size()) throw std::runtime_error("zip: truncated");
    return static_cast<std::uint16_t>(static_cast<unsigned char>(s[at]) | (static_cast<unsigned char>(s[at + 1]) << 8));
}

std::uint32_t get32(const std::string &s, const size_t &at) {
    return static_cast<std::uint32_t>(get16(s, at)) | (static_cast<std::uint32_t>(get16(s, at + 2)) << 16);
}

std::string inflate_raw(const std::string &compressed, const size_t &expected) {
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw std::runtime_error("zip: inflateInit2 failed");
    }
    std::string out(expected, '\0');
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());
    zs.next_out = reinterpret_cast<Bytef *>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = inflate(&zs, Z_FINISH);
    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("zip: inflate failed");
    }
    return out;
}

}

TempDir::TempDir(const std::string &tag) {
    static std::atomic<int> counter{0};
    this->root = fs::temp_directory_path() / ("pcdrop_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(this->root);
    fs::create_directories(this->root);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(this->root, ec);
}

void write_file(const fs::path &path, const std::string &content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

size_t count_files(const fs::path &dir) {
    size_t n = 0;
    for (const auto &entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) n++;
    }
    return n;
}

size_t StringSource::read(char *buf, const size_t &len) {
    size_t n = std::min({len, this->max_chunk, this->data.size() - this->pos});
    std::memcpy(buf, this->data.data() + this->pos, n);
    this->pos += n;
    return n;
}

std::map<std::string, ZipMember> read_zip(const std::string &archive) {
    if (archive.size() < 22) throw std::runtime_error("zip: too short");
    size_t eocd = archive.size() - 22;
    while (get32(archive, eocd) != 0x06054b50) {
        if (eocd == 0) throw std::runtime_error("zip: no end of central directory");
        eocd--;
    }
    std::uint16_t count = get16(archive, eocd + 10);
    size_t at = get32(archive, eocd + 16);

    std::map<std::string, ZipMember> members;
    for (std::uint16_t i = 0; i < count; ++i) {
        if (get32(archive, at) != 0x02014b50) throw std::runtime_error("zip: bad central header");
        ZipMember member;
        member.method = get16(archive, at + 10);
        member.crc = get32(archive, at + 16);
        std::uint32_t compressed = get32(archive, at + 20);
        std::uint32_t uncompressed = get32(archive, at + 24);
        std::uint16_t name_len = get16(archive, at + 28);
        std::uint16_t extra_len = get16(archive, at + 30);
        std::uint16_t comment_len = get16(archive, at + 32);
        std::uint32_t local = get32(archive, at + 42);
        std::string name = archive.substr(at + 46, name_len);

        if (get32(archive, local) != 0x04034b50) throw std::runtime_error("zip: bad local header");
        size_t data = local + 30 + get16(archive, local + 26) + get16(archive, local + 28);
        std::string raw = archive.substr(data, compressed);
        member.content = member.method == 8 ? inflate_raw(raw, uncompressed) : raw;

        std::uint32_t crc = static_cast<std::uint32_t>(::crc32(0L, reinterpret_cast<const Bytef *>(member.content.data()), static_cast<uInt>(member.content.size())));
        if (crc != member.crc) throw std::runtime_error("zip: crc mismatch for " + name);

        members[name] = member;
        at += 46 + name_len + extra_len + comment_len;
    }
    return members;
}

std::vector<std::string> zip_names(const std::string &archive) {
    std::vector<std::string> names;
    size_t eocd = archive.size() - 22;
    while (get32(archive, eocd) != 0x06054b50) eocd--;
    std::uint16_t count = get16(archive, eocd + 10);
    size_t at = get32(archive, eocd + 16);
    for (std::uint16_t i = 0; i < count; ++i) {
        std::uint16_t name_len = get16(archive, at + 28);
        names.push_back(archive.substr(at + 46, name_len));
        at += 46 + name_len + get16(archive, at + 30) + get16(archive, at + 32);
    }
    return names;
}

NetworkInterface make_interface(const std::string &name, const std::string &address, const bool &default_route) {
    NetworkInterface out;
    out.name = name;
    out.address = address;
    out.default_route = default_route;
    return out;
}

std::uint16_t free_port() {
    ListenSocket probe = ListenSocket::open("127.0.0.1", 0);
    return probe.port();
}

int connect_local(const std::uint16_t &port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) throw std::runtime_error("socket failed");
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        throw std::runtime_error("connect failed");
    }
    timeval timeout{10, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    return fd;
}

std::string read_until_close(const int &fd) {
    std::string raw;
    try {
        char buf[16 * 1024];
        size_t n = 0;
        while ((n = recv_some(fd, buf, sizeof(buf))) > 0) {
            raw.append(buf, n);
        }
    } catch (const std::exception &) {
        // a reset after the response is still a readable response
        if (raw.empty()) {
            throw;
        }
    }
    return raw;
}

std::string http_raw(const std::uint16_t &port, const std::string &raw_request) {
    int fd = connect_local(port);
    std::string raw;
    try {
        send_all(fd, raw_request);
        raw = read_until_close(fd);
    } catch (const std::exception &) {
        ::close(fd);
        throw;
    }
    ::close(fd);
    return raw;
}

HttpResponse http_request(const std::uint16_t &port, const std::string &raw_request) {
    return parse_response(http_raw(port, raw_request));
}

HttpResponse parse_response(const std::string &raw) {
    HttpResponse response;
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) throw std::runtime_error("incomplete response");
    std::vector<std::string> lines = split(raw.substr(0, head_end), '\n');
    response.status = std::stoi(split(lines[0], ' ')[1]);
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) continue;
        response.headers[to_lower(trim(lines[i].substr(0, colon)))] = trim(lines[i].substr(colon + 1));
    }

    std::string body = raw.substr(head_end + 4);
    if (iequals(response.headers["transfer-encoding"], "chunked")) {
        size_t at = 0;
        while (true) {
            size_t eol = body.find("\r\n", at);
            if (eol == std::string::npos) throw std::runtime_error("truncated chunked body");
            size_t size = std::stoul(body.substr(at, eol - at), nullptr, 16);
            if (size == 0) break;
            response.body += body.substr(eol + 2, size);
            at = eol + 2 + size + 2;
        }
    } else {
        response.body = body;
    }
    return response;
}

HttpResponse http_get(const std::uint16_t &port, const std::string &target) {
    return http_request(port, "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n");
}

std::string multipart_body(const std::string &boundary, const std::vector<std::pair<std::string, std::string>> &files) {
    std::string body;
    for (const auto &file : files) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"files\"; filename=\"" + file.first + "\"\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body += file.second + "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

} // namespace pcdrop::test
