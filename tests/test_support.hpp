#pragma once

#include "endpoint_resolver.hpp"
#include "pcdrop/streams.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pcdrop::test {

// unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string &tag);
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return this->root; }
    std::filesystem::path operator/(const std::string &child) const { return this->root / child; }

private:
    std::filesystem::path root;
};

void write_file(const std::filesystem::path &path, const std::string &content);
std::string read_file(const std::filesystem::path &path);
size_t count_files(const std::filesystem::path &dir);

// hands out a string in pieces of at most max_chunk bytes
class StringSource : public ByteSource {
public:
    explicit StringSource(std::string data, const size_t &max_chunk = 1 << 20) : data(std::move(data)), max_chunk(max_chunk) {}
    size_t read(char *buf, const size_t &len) override;

private:
    std::string data;
    size_t max_chunk;
    size_t pos = 0;
};

class StringSink : public ByteSink {
public:
    void write(const char *data, const size_t &len) override { this->data.append(data, len); }
    std::string data;
};

struct ZipMember {
    std::string content;
    std::uint16_t method = 0;
    std::uint32_t crc = 0;
};

// reads a complete archive through its central directory; throws std::runtime_error on malformed input
std::map<std::string, ZipMember> read_zip(const std::string &archive);
std::vector<std::string> zip_names(const std::string &archive);

// fixed interface list in place of the host's
class FakeInterfaces : public InterfaceSource {
public:
    explicit FakeInterfaces(std::vector<NetworkInterface> list) : list(std::move(list)) {}
    std::vector<NetworkInterface> interfaces() const override { return this->list; }

private:
    std::vector<NetworkInterface> list;
};

NetworkInterface make_interface(const std::string &name, const std::string &address, const bool &default_route = false);

// port the kernel reports free right now
std::uint16_t free_port();

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;                            // de-chunked
};

// blocking loopback client socket with a 10 s receive timeout
int connect_local(const std::uint16_t &port);
// everything the server sends until it closes; a reset after some data still counts
std::string read_until_close(const int &fd);

// sends raw bytes over a fresh loopback connection and reads until the server closes
std::string http_raw(const std::uint16_t &port, const std::string &raw_request);

// one request over a fresh loopback connection with Connection: close
HttpResponse http_request(const std::uint16_t &port, const std::string &raw_request);
HttpResponse http_get(const std::uint16_t &port, const std::string &target);
HttpResponse parse_response(const std::string &raw);

// multipart/form-data body with one "files" part per (filename, content) pair
std::string multipart_body(const std::string &boundary, const std::vector<std::pair<std::string, std::string>> &files);

} // namespace pcdrop::test
