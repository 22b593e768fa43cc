#pragma once

#include "archive_builder.hpp"
#include "config.hpp"
#include "events.hpp"
#include "filesystem_view.hpp"
#include "http.hpp"
#include "pcdrop/errors.hpp"

#include <atomic>
#include <string>

namespace pcdrop {

// state shared by every connection of one running server
struct ServerContext {
    FilesystemView &view;
    const ServerConfig &config;
    EventChannel &events;
    const std::atomic<bool> &stopping;
    TransferMode mode = TransferMode::Hotspot;
};

// One client connection. Serves HTTP requests back to back until the client
// closes, an error leaves the stream unusable, or the server is stopping.
class Session {
public:
    // busy, when given, is true while a request is being handled
    Session(const int &fd, const std::string &peer, ServerContext &context, std::atomic<bool> *busy = nullptr);

    void run();

    const int &getClientFD() const { return this->client_fd; }
    const std::string &getPeer() const { return this->peer; }

private:
    const int client_fd;
    const std::string peer;
    ServerContext &context;
    std::atomic<bool> *busy;
    Connection conn;
    bool keep_alive = true;
    bool response_started = false;

    void handle(const HttpRequest &request);
    void respondError(const HttpRequest &request, const TransferError &error);
    void logRequest(const HttpRequest &request, const int &status);

    // routes
    void serveIndex(const HttpRequest &request);
    void listFiles(const HttpRequest &request);
    void upload(const HttpRequest &request);
    void downloadFile(const HttpRequest &request, const std::string &path);
    void downloadFolder(const HttpRequest &request, const std::string &path);
    void downloadSelected(const HttpRequest &request);
    void sendArchive(const HttpRequest &request, const ArchivePlan &plan);
};

} // namespace pcdrop
