#include "filesystem_view.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace pcdrop {

namespace fs = std::filesystem;

const char *root_name(const Root &root) {
    return root == Root::Uploads ? "uploads" : "downloads";
}

std::string VirtualPath::str() const {
    std::string out = root_name(this->root);
    if (!this->relative.empty()) {
        out += "/" + this->relative;
    }
    return out;
}

FilesystemView::FilesystemView(const fs::path &uploads_dir, const fs::path &downloads_dir)
    : uploads_dir(uploads_dir), downloads_dir(downloads_dir) {}

VirtualPath FilesystemView::parse(const std::string &virtual_path) {
    std::string normalized = virtual_path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    bool absolute = !normalized.empty() && normalized[0] == '/';

    // drop empty and "." segments, keep ".." so resolve() can reject it
    std::vector<std::string> segments;
    for (const auto &segment : split(normalized, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        segments.push_back(segment);
    }

    VirtualPath out;
    size_t first = 0;
    if (!absolute && !segments.empty()) {
        if (segments[0] == "uploads") {
            out.root = Root::Uploads;
            first = 1;
        } else if (segments[0] == "downloads") {
            out.root = Root::Downloads;
            first = 1;
        }
    }

    for (size_t i = first; i < segments.size(); ++i) {
        if (!out.relative.empty()) {
            out.relative += "/";
        }
        out.relative += segments[i];
    }
    if (absolute) {
        out.relative = "/" + out.relative;
    }
    return out;
}

fs::path FilesystemView::resolve(const std::string &virtual_path, const Root &root) const {
    // absolute paths and drive letters never name something inside a root
    if (!virtual_path.empty() && (virtual_path[0] == '/' || virtual_path[0] == '\\')) {
        throw TransferError(ErrorKind::PathEscape, "Absolute paths are not allowed: " + virtual_path);
    }
    if (virtual_path.size() >= 2 && virtual_path[1] == ':') {
        throw TransferError(ErrorKind::PathEscape, "Absolute paths are not allowed: " + virtual_path);
    }

    fs::path relative;
    std::string normalized = virtual_path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    for (const auto &segment : split(normalized, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            throw TransferError(ErrorKind::PathEscape, "Parent segments are not allowed: " + virtual_path);
        }
        relative /= segment;
    }

    // ensure the canonical result stays within the canonical root (catches symlinks)
    std::error_code ec;
    fs::path abs_root = fs::weakly_canonical(this->rootDirectory(root), ec);
    if (ec) {
        throw TransferError(ErrorKind::IOError, std::string("Cannot resolve ") + root_name(root) + " root");
    }
    fs::path abs_path = fs::weakly_canonical(abs_root / relative, ec);
    if (ec) {
        throw TransferError(ErrorKind::IOError, "Cannot resolve path: " + virtual_path);
    }
    if (!(std::mismatch(abs_root.begin(), abs_root.end(), abs_path.begin(), abs_path.end()).first == abs_root.end())) {
        throw TransferError(ErrorKind::PathEscape, "Path leaves the " + std::string(root_name(root)) + " root: " + virtual_path);
    }
    return abs_path;
}

fs::path FilesystemView::resolve(const VirtualPath &path) const {
    return this->resolve(path.relative, path.root);
}

std::vector<FileEntry> FilesystemView::list(const VirtualPath &dir) const {
    fs::path real = this->resolve(dir);
    std::error_code ec;
    if (!fs::is_directory(real, ec)) {
        throw TransferError(ErrorKind::NotFound, "Directory does not exist: " + dir.str());
    }

    std::vector<FileEntry> entries;
    fs::directory_iterator it(real, ec);
    if (ec) {
        throw TransferError(ErrorKind::IOError, "Cannot read directory: " + dir.str());
    }
    for (const auto &entry : it) {
        VirtualPath child{dir.root, dir.relative.empty() ? entry.path().filename().string() : dir.relative + "/" + entry.path().filename().string()};
        entries.push_back(this->entryFor(entry.path(), child));
    }

    // directories first, then by name
    std::sort(entries.begin(), entries.end(), [](const FileEntry &a, const FileEntry &b) {
        if (a.is_directory != b.is_directory) {
            return a.is_directory;
        }
        return a.name < b.name;
    });
    return entries;
}

FileEntry FilesystemView::stat(const VirtualPath &path) const {
    fs::path real = this->resolve(path);
    std::error_code ec;
    if (!fs::exists(real, ec)) {
        throw TransferError(ErrorKind::NotFound, "Path does not exist: " + path.str());
    }
    return this->entryFor(real, path);
}

ReadHandle FilesystemView::openForRead(const VirtualPath &path) const {
    fs::path real = this->resolve(path);
    std::error_code ec;
    if (!fs::exists(real, ec)) {
        throw TransferError(ErrorKind::NotFound, "File does not exist: " + path.str());
    }
    if (fs::is_directory(real, ec)) {
        throw TransferError(ErrorKind::IsADirectory, "Path is a directory: " + path.str());
    }

    ReadHandle handle;
    handle.size = fs::file_size(real, ec);
    if (ec) {
        throw TransferError(ErrorKind::IOError, "Cannot read file size: " + path.str());
    }
    handle.name = real.filename().string();
    handle.stream.open(real, std::ios::binary);
    if (!handle.stream) {
        throw TransferError(ErrorKind::IOError, "Failed to open file for reading: " + path.str());
    }
    return handle;
}

size_t FilesystemView::write(const VirtualPath &path, ByteSource &source, const std::uintmax_t &max_bytes) {
    fs::path target = this->resolve(path);
    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        throw TransferError(ErrorKind::IsADirectory, "Path is a directory: " + path.str());
    }

    // ensure parent directory exists
    fs::path parent_dir = target.parent_path();
    if (!parent_dir.empty() && !fs::exists(parent_dir, ec)) {
        fs::create_directories(parent_dir, ec);
        if (ec) {
            throw TransferError(ErrorKind::IOError, "Failed to create parent directory for " + path.str());
        }
    }

    fs::path temp = target;
    temp += ".part";
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TransferError(ErrorKind::IOError, "Failed to open file for writing: " + path.str());
    }

    size_t total = 0;
    try {
        char temp_buf[TMP_BUFF_SIZE];
        while (true) {
            size_t n = source.read(temp_buf, sizeof(temp_buf));
            if (n == 0) {
                break;
            }
            total += n;
            if (total > max_bytes) {
                throw TransferError(ErrorKind::OversizeUpload, "Upload exceeds the limit of " + std::to_string(max_bytes) + " bytes");
            }
            this->writeChunk(out, temp_buf, n, target);
        }
        out.close();
        if (!out) {
            throw TransferError(ErrorKind::IOError, "Failed to flush file: " + path.str());
        }
        fs::rename(temp, target, ec);
        if (ec) {
            throw TransferError(ErrorKind::IOError, "Failed to move upload into place: " + path.str());
        }
    } catch (...) {
        // never leave a half-written file behind
        out.close();
        fs::remove(temp, ec);
        throw;
    }
    return total;
}

void FilesystemView::writeChunk(std::ostream &out, const char *data, const size_t &len, const fs::path &target) {
    out.write(data, static_cast<std::streamsize>(len));
    if (!out) {
        if (errno == ENOSPC || errno == EDQUOT) {
            throw TransferError(ErrorKind::DiskFull, "No space left while writing " + target.filename().string());
        }
        throw TransferError(ErrorKind::IOError, "Failed to write " + target.filename().string());
    }
}

const fs::path &FilesystemView::rootDirectory(const Root &root) const {
    return root == Root::Uploads ? this->uploads_dir : this->downloads_dir;
}

void FilesystemView::ensureRoots() const {
    for (const auto &dir : {this->uploads_dir, this->downloads_dir}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw TransferError(ErrorKind::IOError, "Failed to create directory " + dir.string() + ": " + ec.message());
        }
    }
}

FileEntry FilesystemView::entryFor(const fs::path &real, const VirtualPath &path) const {
    FileEntry entry;
    entry.name = real.filename().string();
    entry.virtual_path = path.str();

    struct ::stat st{};
    if (::stat(real.c_str(), &st) == 0) {
        entry.is_directory = S_ISDIR(st.st_mode);
        entry.size = entry.is_directory ? 0 : static_cast<std::uintmax_t>(st.st_size);
        entry.modified_time = st.st_mtime;
    } else {
        // dangling symlink or a race with deletion
        std::error_code ec;
        entry.is_directory = fs::is_directory(real, ec);
    }
    return entry;
}

} // namespace pcdrop
