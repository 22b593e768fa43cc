#pragma once

#include "pcdrop/streams.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pcdrop {

constexpr size_t MAX_REQUEST_HEAD = 16 * 1024;

struct HttpRequest {
    std::string method;
    std::string target;      // raw request target
    std::string path;        // percent-decoded path without the query
    std::string query;       // raw query string
    std::string version;
    std::map<std::string, std::string> headers; // lower-case names

    std::string header(const std::string &name) const;
    std::optional<std::uint64_t> contentLength() const;
    bool chunked() const;
    bool keepAlive() const;

    // all values of a query parameter, percent-decoded
    std::vector<std::string> queryValues(const std::string &name) const;
    std::string queryValue(const std::string &name) const;
};

// Buffered reader over a connected socket. Bytes read past the request head
// stay buffered and are handed to the body source.
class Connection {
public:
    explicit Connection(const int &fd) : client_fd(fd) {}

    // Waits between requests. True once a byte of the next request is available;
    // false when the server stops or the connection stays idle for idle_timeout.
    bool awaitRequest(const std::atomic<bool> &stopping, const std::chrono::milliseconds &idle_timeout);

    // false on a clean close before any byte of a new request
    bool readRequest(HttpRequest &request);
    size_t readSome(char *buf, const size_t &len);
    std::string readLine(const size_t &max_len);

    int fd() const { return this->client_fd; }

private:
    int client_fd;
    std::string buffer;
    size_t pos = 0;

    bool fill();
};

// request body framed by Content-Length
class ContentLengthSource : public ByteSource {
public:
    ContentLengthSource(Connection &conn, const std::uint64_t &length) : conn(conn), remaining(length) {}
    size_t read(char *buf, const size_t &len) override;
    std::uint64_t left() const { return this->remaining; }

private:
    Connection &conn;
    std::uint64_t remaining;
};

// request body framed by chunked transfer encoding
class ChunkedSource : public ByteSource {
public:
    explicit ChunkedSource(Connection &conn) : conn(conn) {}
    size_t read(char *buf, const size_t &len) override;
    bool finished() const { return this->done; }

private:
    Connection &conn;
    std::uint64_t chunk_left = 0;
    bool done = false;
};

// Buffers up to one chunk and writes it to the socket with chunked framing.
// Sends block, so a slow client slows the producer down.
class ChunkedSink : public ByteSink {
public:
    explicit ChunkedSink(const int &fd, const size_t &chunk_size = 64 * 1024);
    void write(const char *data, const size_t &len) override;
    void finish();

private:
    int client_fd;
    size_t chunk_size;
    std::string pending;

    void flush();
};

// writes straight to the socket; used when the client cannot take chunked framing
class SocketSink : public ByteSink {
public:
    explicit SocketSink(const int &fd) : client_fd(fd) {}
    void write(const char *data, const size_t &len) override;

private:
    int client_fd;
};

const char *status_text(const int &status);

// response head helpers; headers are written in the given order
std::string response_head(const int &status, const std::vector<std::pair<std::string, std::string>> &headers);
void send_response(const int &fd, const int &status, const std::string &content_type, const std::string &body, const bool &keep_alive, const std::vector<std::pair<std::string, std::string>> &extra = {});
void send_json(const int &fd, const int &status, const std::string &json, const bool &keep_alive);
void send_error(const int &fd, const int &status, const std::string &code, const std::string &message, const bool &keep_alive);

std::string content_disposition(const std::string &filename);

} // namespace pcdrop
