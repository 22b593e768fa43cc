#pragma once

#include "filesystem_view.hpp"
#include "pcdrop/streams.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace pcdrop {

struct ArchiveItem {
    std::string entry_name;   // name inside the archive, relative to the common ancestor
    VirtualPath source;
    bool is_directory = false;
    std::uintmax_t size = 0;
};

struct ArchivePlan {
    std::string suggested_name;   // download filename, e.g. "photos.zip"
    std::vector<ArchiveItem> items;
    std::vector<std::string> skipped;   // links under a selected folder that leave the root
};

// Turns a selection of virtual paths into a ZIP stream.
// plan() resolves and orders the whole selection before any byte is produced;
// stream() then reads each member chunk by chunk into the sink.
class ArchiveBuilder {
public:
    ArchiveBuilder(const FilesystemView &view, const int &level);

    ArchivePlan plan(const std::vector<std::string> &paths) const;
    std::uint64_t stream(const ArchivePlan &plan, ByteSink &sink) const;

    // convenience for callers that need both steps at once
    std::uint64_t build(const std::vector<std::string> &paths, ByteSink &sink) const;

private:
    const FilesystemView &view;
    int level;

    void collect(const VirtualPath &dir, const std::string &prefix, ArchivePlan &plan, std::set<std::string> &names, std::set<std::string> &ancestors) const;
};

} // namespace pcdrop
