#pragma once

#include "events.hpp"
#include "filesystem_view.hpp"
#include "multipart.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pcdrop {

struct UploadOptions {
    std::uintmax_t max_bytes = 0;
    bool stamp_names = false;   // prefix stored names with YYYYmmdd_HHMMSS_
};

struct UploadResult {
    int succeeded = 0;
    int failed = 0;
    std::uint64_t bytes = 0;
    std::vector<std::string> stored;   // virtual paths of stored files
};

// Stores every file part of a multipart body under the uploads root.
// A failing part is counted and skipped; oversize parts and broken bodies abort the whole request.
UploadResult receive_uploads(MultipartReader &reader, FilesystemView &view, const UploadOptions &options, EventChannel *events = nullptr);

// relative path an uploaded filename is stored under (browsers may send "dir/name" for folder uploads)
std::string upload_relative_path(const std::string &filename, const bool &stamp, const std::time_t &now);

} // namespace pcdrop
