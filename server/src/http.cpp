#include "http.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"
#include "pcdrop/version.hpp"

#include <nlohmann/json.hpp>

#include <poll.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace pcdrop {

std::string HttpRequest::header(const std::string &name) const {
    auto it = this->headers.find(to_lower(name));
    return it == this->headers.end() ? "" : it->second;
}

std::optional<std::uint64_t> HttpRequest::contentLength() const {
    std::string value = this->header("content-length");
    if (value.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw TransferError(ErrorKind::BadRequest, "Invalid Content-Length: " + value);
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(value));
    } catch (const std::exception &) {
        throw TransferError(ErrorKind::BadRequest, "Invalid Content-Length: " + value);
    }
}

bool HttpRequest::chunked() const {
    return to_lower(this->header("transfer-encoding")).find("chunked") != std::string::npos;
}

bool HttpRequest::keepAlive() const {
    std::string connection = to_lower(this->header("connection"));
    if (this->version == "HTTP/1.0") {
        return connection == "keep-alive";
    }
    return connection != "close";
}

std::vector<std::string> HttpRequest::queryValues(const std::string &name) const {
    std::vector<std::string> values;
    if (this->query.empty()) {
        return values;
    }
    for (const auto &pair : split(this->query, '&')) {
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq), true);
        if (key != name) {
            continue;
        }
        values.push_back(eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1), true));
    }
    return values;
}

std::string HttpRequest::queryValue(const std::string &name) const {
    std::vector<std::string> values = this->queryValues(name);
    return values.empty() ? "" : values.front();
}

bool Connection::fill() {
    if (this->pos > 0) {
        this->buffer.erase(0, this->pos);
        this->pos = 0;
    }
    char temp[TMP_BUFF_SIZE];
    size_t n = recv_some(this->client_fd, temp, sizeof(temp));
    if (n == 0) {
        return false;
    }
    this->buffer.append(temp, n);
    return true;
}

bool Connection::awaitRequest(const std::atomic<bool> &stopping, const std::chrono::milliseconds &idle_timeout) {
    // pipelined bytes are already here
    if (this->pos < this->buffer.size()) {
        return true;
    }

    // wake up regularly to notice stop(); bytes that arrived before it still count
    constexpr int slice_ms = 200;
    auto waited = std::chrono::milliseconds(0);
    while (true) {
        pollfd pfd{};
        pfd.fd = this->client_fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, stopping.load() ? 0 : slice_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ready > 0) {
            // data, or a close that readRequest reports as such
            return true;
        }
        if (stopping.load()) {
            return false;
        }
        waited += std::chrono::milliseconds(slice_ms);
        if (waited >= idle_timeout) {
            return false;
        }
    }
}

bool Connection::readRequest(HttpRequest &request) {
    // tolerate stray CRLFs between pipelined requests
    size_t end = std::string::npos;
    while (true) {
        while (this->pos + 1 < this->buffer.size() && this->buffer.compare(this->pos, 2, "\r\n") == 0) {
            this->pos += 2;
        }
        end = this->buffer.find("\r\n\r\n", this->pos);
        if (end != std::string::npos) {
            break;
        }
        if (this->buffer.size() - this->pos > MAX_REQUEST_HEAD) {
            throw TransferError(ErrorKind::BadRequest, "Request head too large");
        }
        if (!this->fill()) {
            if (this->buffer.size() == this->pos) {
                return false;
            }
            throw TransferError(ErrorKind::ConnectionClosed, "Connection closed mid-request");
        }
    }

    std::string head = this->buffer.substr(this->pos, end - this->pos);
    this->pos = end + 4;

    std::vector<std::string> lines = split(head, '\n');
    std::vector<std::string> request_line = split(trim(lines[0]), ' ');
    if (request_line.size() != 3 || !request_line[2].starts_with("HTTP/")) {
        throw TransferError(ErrorKind::BadRequest, "Malformed request line");
    }

    request = HttpRequest{};
    request.method = request_line[0];
    request.target = request_line[1];
    request.version = request_line[2];

    size_t q = request.target.find('?');
    request.path = url_decode(request.target.substr(0, q));
    request.query = q == std::string::npos ? "" : request.target.substr(q + 1);

    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw TransferError(ErrorKind::BadRequest, "Malformed header line");
        }
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        auto it = request.headers.find(name);
        if (it == request.headers.end()) {
            request.headers.emplace(name, value);
        } else {
            it->second += ", " + value;
        }
    }
    return true;
}

size_t Connection::readSome(char *buf, const size_t &len) {
    if (this->pos < this->buffer.size()) {
        size_t n = std::min(len, this->buffer.size() - this->pos);
        std::memcpy(buf, this->buffer.data() + this->pos, n);
        this->pos += n;
        return n;
    }
    return recv_some(this->client_fd, buf, len);
}

std::string Connection::readLine(const size_t &max_len) {
    while (true) {
        size_t end = this->buffer.find("\r\n", this->pos);
        if (end != std::string::npos) {
            std::string line = this->buffer.substr(this->pos, end - this->pos);
            this->pos = end + 2;
            return line;
        }
        if (this->buffer.size() - this->pos > max_len) {
            throw TransferError(ErrorKind::BadRequest, "Line too long in request body");
        }
        if (!this->fill()) {
            throw TransferError(ErrorKind::ConnectionClosed, "Connection closed mid-body");
        }
    }
}

size_t ContentLengthSource::read(char *buf, const size_t &len) {
    if (this->remaining == 0) {
        return 0;
    }
    size_t want = static_cast<size_t>(std::min<std::uint64_t>(len, this->remaining));
    size_t n = this->conn.readSome(buf, want);
    if (n == 0) {
        throw TransferError(ErrorKind::ConnectionClosed, "Client closed the connection mid-body");
    }
    this->remaining -= n;
    return n;
}

size_t ChunkedSource::read(char *buf, const size_t &len) {
    if (this->done) {
        return 0;
    }
    if (this->chunk_left == 0) {
        std::string line = this->conn.readLine(1024);
        std::string size_field = trim(line.substr(0, line.find(';')));
        char *end = nullptr;
        unsigned long long size = std::strtoull(size_field.c_str(), &end, 16);
        if (size_field.empty() || (end && *end != '\0')) {
            throw TransferError(ErrorKind::BadRequest, "Malformed chunk size");
        }
        if (size == 0) {
            // trailers end with an empty line
            while (!this->conn.readLine(MAX_REQUEST_HEAD).empty()) {
            }
            this->done = true;
            return 0;
        }
        this->chunk_left = size;
    }

    size_t want = static_cast<size_t>(std::min<std::uint64_t>(len, this->chunk_left));
    size_t n = this->conn.readSome(buf, want);
    if (n == 0) {
        throw TransferError(ErrorKind::ConnectionClosed, "Client closed the connection mid-chunk");
    }
    this->chunk_left -= n;
    if (this->chunk_left == 0 && !this->conn.readLine(2).empty()) {
        throw TransferError(ErrorKind::BadRequest, "Missing CRLF after chunk");
    }
    return n;
}

ChunkedSink::ChunkedSink(const int &fd, const size_t &chunk_size) : client_fd(fd), chunk_size(chunk_size) {
    this->pending.reserve(chunk_size);
}

void ChunkedSink::write(const char *data, const size_t &len) {
    this->pending.append(data, len);
    if (this->pending.size() >= this->chunk_size) {
        this->flush();
    }
}

void ChunkedSink::flush() {
    if (this->pending.empty()) {
        return;
    }
    char size_line[32];
    int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", this->pending.size());
    send_all(this->client_fd, size_line, static_cast<size_t>(n));
    send_all(this->client_fd, this->pending);
    send_all(this->client_fd, "\r\n", 2);
    this->pending.clear();
}

void ChunkedSink::finish() {
    this->flush();
    send_all(this->client_fd, "0\r\n\r\n", 5);
}

void SocketSink::write(const char *data, const size_t &len) {
    send_all(this->client_fd, data, len);
}

const char *status_text(const int &status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string response_head(const int &status, const std::vector<std::pair<std::string, std::string>> &headers) {
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
    head += std::string("Server: pcdrop/") + version() + "\r\n";
    for (const auto &header : headers) {
        head += header.first + ": " + header.second + "\r\n";
    }
    head += "\r\n";
    return head;
}

void send_response(const int &fd, const int &status, const std::string &content_type, const std::string &body, const bool &keep_alive, const std::vector<std::pair<std::string, std::string>> &extra) {
    std::vector<std::pair<std::string, std::string>> headers{
        {"Content-Type", content_type},
        {"Content-Length", std::to_string(body.size())},
        {"Connection", keep_alive ? "keep-alive" : "close"},
    };
    headers.insert(headers.end(), extra.begin(), extra.end());
    send_all(fd, response_head(status, headers) + body);
}

void send_json(const int &fd, const int &status, const std::string &json, const bool &keep_alive) {
    send_response(fd, status, "application/json", json, keep_alive, {
        {"Access-Control-Allow-Origin", "*"},
        {"Cache-Control", "no-store"},
    });
}

void send_error(const int &fd, const int &status, const std::string &code, const std::string &message, const bool &keep_alive) {
    nlohmann::json body = {{"error", code}, {"message", message}};
    send_json(fd, status, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), keep_alive);
}

std::string content_disposition(const std::string &filename) {
    // plain ASCII fallback plus the RFC 5987 form for non-ASCII names
    std::string ascii;
    for (unsigned char c : filename) {
        ascii.push_back(c < 0x20 || c >= 0x7F || c == '"' || c == '\\' ? '_' : static_cast<char>(c));
    }
    return "attachment; filename=\"" + ascii + "\"; filename*=UTF-8''" + url_encode(filename);
}

} // namespace pcdrop
