#include "session.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

namespace pcdrop {

void Session::downloadFile(const HttpRequest &request, const std::string &path) {
    VirtualPath target = FilesystemView::parse(path);
    ReadHandle handle;
    try {
        handle = this->context.view.openForRead(target);
    } catch (const TransferError &e) {
        if (e.kind() == ErrorKind::IsADirectory) {
            throw TransferError(ErrorKind::IsADirectory, "Use /download-folder/ to fetch a directory");
        }
        throw;
    }

    send_all(this->client_fd, response_head(200, {
        {"Content-Type", "application/octet-stream"},
        {"Content-Length", std::to_string(handle.size)},
        {"Content-Disposition", content_disposition(handle.name)},
        {"Access-Control-Allow-Origin", "*"},
        {"Connection", this->keep_alive ? "keep-alive" : "close"},
    }));
    this->response_started = true;

    // send file data
    char buffer[TMP_BUFF_SIZE];
    std::uintmax_t sent = 0;
    while (sent < handle.size) {
        std::uintmax_t left = handle.size - sent;
        size_t to_read = left < TMP_BUFF_SIZE ? static_cast<size_t>(left) : TMP_BUFF_SIZE;
        handle.stream.read(buffer, static_cast<std::streamsize>(to_read));
        std::streamsize got = handle.stream.gcount();
        if (got <= 0) {
            break;
        }
        send_all(this->client_fd, buffer, static_cast<size_t>(got));
        sent += static_cast<std::uintmax_t>(got);
    }
    if (sent != handle.size) {
        // the file shrank under us; the advertised length can no longer be honoured
        throw TransferError(ErrorKind::IOError, "Short read on " + target.str() + ": sent " + std::to_string(sent) + " of " + std::to_string(handle.size) + " bytes");
    }

    this->logRequest(request, 200);
    this->context.events.success("Downloaded: " + target.str() + " (" + std::to_string(sent) + " bytes)");
}

void Session::downloadFolder(const HttpRequest &request, const std::string &path) {
    VirtualPath target = FilesystemView::parse(path);
    FileEntry entry = this->context.view.stat(target);
    if (!entry.is_directory) {
        throw TransferError(ErrorKind::NotADirectory, target.str() + " is not a directory");
    }

    ArchiveBuilder builder(this->context.view, this->context.config.zip_level);
    ArchivePlan plan = builder.plan({entry.virtual_path});
    this->sendArchive(request, plan);
}

void Session::downloadSelected(const HttpRequest &request) {
    // paths=a,b&paths=c: split the raw value first so encoded commas survive inside names
    std::vector<std::string> paths;
    for (const auto &pair : split(request.query, '&')) {
        size_t eq = pair.find('=');
        if (eq == std::string::npos || url_decode(pair.substr(0, eq), true) != "paths") {
            continue;
        }
        for (const auto &piece : split(pair.substr(eq + 1), ',')) {
            std::string decoded = url_decode(piece, true);
            if (!decoded.empty()) {
                paths.push_back(decoded);
            }
        }
    }
    if (paths.empty()) {
        throw TransferError(ErrorKind::BadRequest, "No paths selected");
    }

    ArchiveBuilder builder(this->context.view, this->context.config.zip_level);
    ArchivePlan plan = builder.plan(paths);
    this->sendArchive(request, plan);
}

void Session::sendArchive(const HttpRequest &request, const ArchivePlan &plan) {
    ArchiveBuilder builder(this->context.view, this->context.config.zip_level);
    for (const auto &skipped : plan.skipped) {
        this->context.events.warning("Skipped archive member outside its root: " + skipped);
    }
    bool chunked = request.version != "HTTP/1.0";
    if (!chunked) {
        // no framing available: the end of the archive is the end of the connection
        this->keep_alive = false;
    }

    std::vector<std::pair<std::string, std::string>> headers{
        {"Content-Type", "application/zip"},
        {"Content-Disposition", content_disposition(plan.suggested_name)},
        {"Access-Control-Allow-Origin", "*"},
        {"Connection", this->keep_alive ? "keep-alive" : "close"},
    };
    if (chunked) {
        headers.push_back({"Transfer-Encoding", "chunked"});
    }
    send_all(this->client_fd, response_head(200, headers));
    this->response_started = true;

    std::uint64_t bytes = 0;
    if (chunked) {
        ChunkedSink sink(this->client_fd);
        bytes = builder.stream(plan, sink);
        sink.finish();
    } else {
        SocketSink sink(this->client_fd);
        bytes = builder.stream(plan, sink);
    }

    this->logRequest(request, 200);
    this->context.events.success("Downloaded archive: " + plan.suggested_name + " (" + std::to_string(plan.items.size()) + " entries, " + std::to_string(bytes) + " bytes)");
}

} // namespace pcdrop
