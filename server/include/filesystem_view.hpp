#pragma once

#include "pcdrop/streams.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace pcdrop {

enum class Root {
    Uploads,
    Downloads
};

const char *root_name(const Root &root);

struct FileEntry {
    std::string name;
    bool is_directory = false;
    std::uintmax_t size = 0;     // files only
    std::time_t modified_time = 0;
    std::string virtual_path;    // always carries the root segment
};

// root-qualified virtual path, e.g. {Uploads, "photos/a.jpg"}
struct VirtualPath {
    Root root = Root::Downloads;
    std::string relative;

    std::string str() const;
};

struct ReadHandle {
    std::ifstream stream;
    std::uintmax_t size = 0;
    std::string name;
};

// Maps virtual paths under the uploads/downloads roots to real storage.
// This is the only place raw storage paths are built; every lookup goes through resolve().
class FilesystemView {
public:
    FilesystemView(const std::filesystem::path &uploads_dir, const std::filesystem::path &downloads_dir);
    virtual ~FilesystemView() = default;

    // splits an optional leading "uploads/" or "downloads/" segment; defaults to downloads
    static VirtualPath parse(const std::string &virtual_path);

    std::filesystem::path resolve(const std::string &virtual_path, const Root &root) const;
    std::filesystem::path resolve(const VirtualPath &path) const;

    std::vector<FileEntry> list(const VirtualPath &dir) const;
    FileEntry stat(const VirtualPath &path) const;
    ReadHandle openForRead(const VirtualPath &path) const;

    // streams source to disk through a temporary ".part" file; the partial file is removed on failure
    size_t write(const VirtualPath &path, ByteSource &source, const std::uintmax_t &max_bytes);

    const std::filesystem::path &rootDirectory(const Root &root) const;
    void ensureRoots() const;

protected:
    virtual void writeChunk(std::ostream &out, const char *data, const size_t &len, const std::filesystem::path &target);

private:
    std::filesystem::path uploads_dir;
    std::filesystem::path downloads_dir;

    FileEntry entryFor(const std::filesystem::path &real, const VirtualPath &path) const;
};

} // namespace pcdrop
