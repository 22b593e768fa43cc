#include "session.hpp"
#include "upload_receiver.hpp"
#include "multipart.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

#include <nlohmann/json.hpp>

#include <memory>

namespace pcdrop {

void Session::upload(const HttpRequest &request) {
    // check framing before touching the body
    std::string boundary = multipart_boundary(request.header("content-type"));
    if (boundary.empty()) {
        this->keep_alive = false;
        throw TransferError(ErrorKind::BadRequest, "Expected a multipart/form-data body");
    }

    std::optional<std::uint64_t> length = request.contentLength();
    if (length && *length > this->context.config.max_upload_bytes) {
        // refuse without reading; the unread body makes the connection unusable
        this->keep_alive = false;
        throw TransferError(ErrorKind::OversizeUpload, "Upload exceeds the limit of " + std::to_string(this->context.config.max_upload_bytes) + " bytes");
    }
    if (!length && !request.chunked()) {
        this->keep_alive = false;
        send_error(this->client_fd, 411, "length_required", "Upload needs Content-Length or chunked encoding", false);
        this->logRequest(request, 411);
        return;
    }

    if (iequals(request.header("expect"), "100-continue")) {
        send_all(this->client_fd, "HTTP/1.1 100 Continue\r\n\r\n");
    }

    std::unique_ptr<ByteSource> body;
    ContentLengthSource *framed = nullptr;
    if (length) {
        auto source = std::make_unique<ContentLengthSource>(this->conn, *length);
        framed = source.get();
        body = std::move(source);
    } else {
        body = std::make_unique<ChunkedSource>(this->conn);
    }

    UploadOptions options;
    options.max_bytes = this->context.config.max_upload_bytes;
    options.stamp_names = this->context.config.stamp_uploads;

    UploadResult result;
    try {
        MultipartReader reader(*body, boundary);
        result = receive_uploads(reader, this->context.view, options, &this->context.events);
    } catch (const TransferError &) {
        // whatever is left of the body is still on the wire
        this->keep_alive = false;
        throw;
    }

    // swallow an epilogue so the next request starts on a clean boundary
    char sink[TMP_BUFF_SIZE];
    if (framed != nullptr) {
        while (framed->left() > 0 && body->read(sink, sizeof(sink)) > 0) {
        }
    } else {
        while (body->read(sink, sizeof(sink)) > 0) {
        }
    }

    nlohmann::json files = nlohmann::json::array();
    for (const auto &stored : result.stored) {
        files.push_back(stored);
    }
    nlohmann::json out = {
        {"succeeded", result.succeeded},
        {"failed", result.failed},
        {"bytes", result.bytes},
        {"files", files},
    };
    send_json(this->client_fd, 200, out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), this->keep_alive);
    this->logRequest(request, 200);
    this->context.events.success("Upload finished: " + std::to_string(result.succeeded) + " stored, " + std::to_string(result.failed) + " failed");
}

} // namespace pcdrop
