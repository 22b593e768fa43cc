#include "upload_receiver.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

#include <algorithm>

namespace pcdrop {

std::string upload_relative_path(const std::string &filename, const bool &stamp, const std::time_t &now) {
    std::string name = filename;
    std::replace(name.begin(), name.end(), '\\', '/');

    // absolute client paths (old browsers send them) keep only the basename
    bool absolute = (!name.empty() && name[0] == '/') || (name.size() >= 2 && name[1] == ':');
    if (absolute) {
        name = name.substr(name.find_last_of('/') + 1);
    }

    if (stamp && !name.empty()) {
        size_t slash = name.find_last_of('/');
        size_t insert_at = slash == std::string::npos ? 0 : slash + 1;
        name.insert(insert_at, format_time(now, "%Y%m%d_%H%M%S") + "_");
    }
    return name;
}

UploadResult receive_uploads(MultipartReader &reader, FilesystemView &view, const UploadOptions &options, EventChannel *events) {
    UploadResult result;
    std::time_t now = std::time(nullptr);

    MultipartPart part;
    while (reader.nextPart(part)) {
        // plain form fields and empty file inputs carry nothing to store
        if (!part.has_filename || part.filename.empty()) {
            continue;
        }

        VirtualPath target{Root::Uploads, upload_relative_path(part.filename, options.stamp_names, now)};
        if (target.relative.empty()) {
            result.failed++;
            continue;
        }

        std::uintmax_t budget = options.max_bytes > result.bytes ? options.max_bytes - result.bytes : 0;
        try {
            size_t n = view.write(target, reader, budget);
            result.succeeded++;
            result.bytes += n;
            result.stored.push_back(target.str());
            if (events) {
                events->success("Uploaded: " + target.relative + " (" + std::to_string(n) + " bytes)");
            }
        } catch (const TransferError &e) {
            // a broken or oversize body cannot be resynchronised, give up on the request
            if (e.kind() == ErrorKind::OversizeUpload || e.kind() == ErrorKind::ConnectionClosed || e.kind() == ErrorKind::BadRequest) {
                if (events) {
                    events->error("Upload aborted: " + std::string(e.what()));
                }
                throw;
            }
            result.failed++;
            if (events) {
                events->error("Upload failed: " + part.filename + " (" + e.what() + ")");
            }
        }
    }
    return result;
}

} // namespace pcdrop
