#include "session.hpp"
#include "web_client.hpp"
#include "pcdrop/errors.hpp"

#include <nlohmann/json.hpp>

namespace pcdrop {

// constructor
Session::Session(const int &fd, const std::string &peer, ServerContext &context, std::atomic<bool> *busy)
    : client_fd(fd), peer(peer), context(context), busy(busy), conn(fd) {}

// main request loop
void Session::run() {
    HttpRequest request;
    while (this->keep_alive) {
        if (!this->conn.awaitRequest(this->context.stopping, this->context.config.idle_timeout)) {
            break; // idle connection: timed out or the server is stopping
        }
        // from the first byte on, stop() lets this request finish
        if (this->busy != nullptr) {
            *this->busy = true;
        }

        try {
            if (!this->conn.readRequest(request)) {
                break; // client closed an idle connection
            }
        } catch (const TransferError &e) {
            if (e.kind() == ErrorKind::BadRequest) {
                try {
                    send_error(this->client_fd, 400, error_code(e.kind()), e.message(), false);
                } catch (const TransferError &) {
                    // client already gone
                }
            }
            break;
        }

        this->keep_alive = request.keepAlive() && !this->context.stopping.load();
        this->response_started = false;

        try {
            // a body nobody reads would desync the next request
            bool has_body = request.chunked() || request.contentLength().value_or(0) > 0;
            if (has_body && !(request.method == "POST" && request.path == "/upload")) {
                this->keep_alive = false;
            }
            this->handle(request);
        } catch (const TransferError &e) {
            if (this->response_started || e.kind() == ErrorKind::ConnectionClosed) {
                // mid-stream failure: the only honest signal left is closing the connection
                this->context.events.error(this->peer + " - " + request.method + " " + request.target + " aborted: " + e.what());
                break;
            }
            try {
                this->respondError(request, e);
            } catch (const TransferError &) {
                break;
            }
        } catch (const std::exception &e) {
            this->context.events.error(this->peer + " - " + request.method + " " + request.target + " failed: " + e.what());
            if (!this->response_started) {
                try {
                    send_error(this->client_fd, 500, "internal_error", "Internal server error", false);
                } catch (const TransferError &) {
                    // client already gone
                }
            }
            break;
        }
        if (this->busy != nullptr) {
            *this->busy = false;
        }
    }
}

void Session::handle(const HttpRequest &request) {
    const std::string &path = request.path;

    if (request.method == "OPTIONS") {
        send_response(this->client_fd, 204, "text/plain", "", this->keep_alive, {
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
            {"Access-Control-Allow-Headers", "Content-Type"},
        });
        this->logRequest(request, 204);
        return;
    }

    if (request.method == "POST") {
        if (path == "/upload") {
            this->upload(request);
            return;
        }
    } else if (request.method == "GET") {
        if (path == "/" || path == "/index.html" || path == "/upload") {
            this->serveIndex(request);
            return;
        } else if (path == "/api/files") {
            this->listFiles(request);
            return;
        } else if (path.starts_with("/download/")) {
            this->downloadFile(request, path.substr(std::string("/download/").size()));
            return;
        } else if (path.starts_with("/download-folder/")) {
            this->downloadFolder(request, path.substr(std::string("/download-folder/").size()));
            return;
        } else if (path == "/download-selected") {
            this->downloadSelected(request);
            return;
        }
    } else {
        send_error(this->client_fd, 405, "method_not_allowed", "Method not allowed: " + request.method, this->keep_alive);
        this->logRequest(request, 405);
        return;
    }

    send_error(this->client_fd, 404, "not_found", "No such endpoint: " + path, this->keep_alive);
    this->logRequest(request, 404);
}

void Session::respondError(const HttpRequest &request, const TransferError &error) {
    int status = http_status(error.kind());
    std::string message = error.message();
    if (error.kind() == ErrorKind::PathEscape) {
        // never describe where the path would have led
        message = "Path is outside the shared folders";
    }
    send_error(this->client_fd, status, error_code(error.kind()), message, this->keep_alive);
    this->logRequest(request, status);
}

void Session::logRequest(const HttpRequest &request, const int &status) {
    std::string line = this->peer + " - " + request.method + " " + request.target + " " + std::to_string(status);
    if (status >= 500) {
        this->context.events.error(line);
    } else if (status >= 400) {
        this->context.events.warning(line);
    } else {
        this->context.events.info(line);
    }
}

void Session::serveIndex(const HttpRequest &request) {
    send_response(this->client_fd, 200, "text/html; charset=utf-8", render_web_client(this->context.mode), this->keep_alive, {
        {"Cache-Control", "no-store"},
    });
    this->logRequest(request, 200);
}

void Session::listFiles(const HttpRequest &request) {
    VirtualPath dir = FilesystemView::parse(request.queryValue("path"));
    std::vector<FileEntry> entries = this->context.view.list(dir);

    nlohmann::json out = nlohmann::json::array();
    for (const auto &entry : entries) {
        out.push_back({
            {"name", entry.name},
            {"isDirectory", entry.is_directory},
            {"size", entry.size},
            {"modifiedTime", static_cast<std::int64_t>(entry.modified_time)},
            {"virtualPath", entry.virtual_path},
        });
    }
    send_json(this->client_fd, 200, out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), this->keep_alive);
    this->logRequest(request, 200);
}

} // namespace pcdrop
