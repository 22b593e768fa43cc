#include "archive_builder.hpp"
#include "zip_writer.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

namespace pcdrop {

namespace {

std::vector<std::string> components(const VirtualPath &path) {
    std::vector<std::string> parts{root_name(path.root)};
    if (!path.relative.empty()) {
        for (const auto &segment : split(path.relative, '/')) {
            parts.push_back(segment);
        }
    }
    return parts;
}

std::string join(const std::vector<std::string> &parts, const size_t &from) {
    std::string out;
    for (size_t i = from; i < parts.size(); ++i) {
        if (!out.empty()) {
            out += "/";
        }
        out += parts[i];
    }
    return out;
}

}

ArchiveBuilder::ArchiveBuilder(const FilesystemView &view, const int &level) : view(view), level(level) {}

ArchivePlan ArchiveBuilder::plan(const std::vector<std::string> &paths) const {
    if (paths.empty()) {
        throw TransferError(ErrorKind::BadRequest, "Selection is empty");
    }

    // stat every selected path up front so a missing one fails before streaming
    std::vector<VirtualPath> selected;
    std::vector<FileEntry> stats;
    for (const auto &raw : paths) {
        VirtualPath path = FilesystemView::parse(raw);
        stats.push_back(this->view.stat(path));
        selected.push_back(path);
    }

    // common ancestor of the parents of all selected paths
    std::vector<std::string> ancestor;
    for (size_t i = 0; i < selected.size(); ++i) {
        std::vector<std::string> parent = components(selected[i]);
        parent.pop_back();
        if (i == 0) {
            ancestor = parent;
            continue;
        }
        size_t n = 0;
        while (n < ancestor.size() && n < parent.size() && ancestor[n] == parent[n]) {
            n++;
        }
        ancestor.resize(n);
    }

    ArchivePlan plan;
    std::set<std::string> names;
    std::set<std::string> ancestors;
    for (size_t i = 0; i < selected.size(); ++i) {
        std::string base = join(components(selected[i]), ancestor.size());
        if (stats[i].is_directory) {
            this->collect(selected[i], base + "/", plan, names, ancestors);
        } else if (names.insert(base).second) {
            plan.items.push_back(ArchiveItem{base, selected[i], false, stats[i].size});
        }
    }

    if (selected.size() == 1) {
        std::vector<std::string> parts = components(selected[0]);
        plan.suggested_name = parts.back() + ".zip";
    } else {
        plan.suggested_name = "selected_files.zip";
    }
    return plan;
}

void ArchiveBuilder::collect(const VirtualPath &dir, const std::string &prefix, ArchivePlan &plan, std::set<std::string> &names, std::set<std::string> &ancestors) const {
    // a symlinked directory may point back at one of its own ancestors
    std::string real = this->view.resolve(dir).string();
    if (!ancestors.insert(real).second) {
        return;
    }

    std::vector<FileEntry> children = this->view.list(dir);
    if (children.empty()) {
        if (names.insert(prefix).second) {
            plan.items.push_back(ArchiveItem{prefix, dir, true, 0});
        }
        ancestors.erase(real);
        return;
    }

    for (const auto &child : children) {
        VirtualPath child_path = FilesystemView::parse(child.virtual_path);
        // symlinks below a selected folder may lead out of the root
        try {
            this->view.resolve(child_path);
        } catch (const TransferError &e) {
            if (e.kind() != ErrorKind::PathEscape) {
                throw;
            }
            plan.skipped.push_back(child.virtual_path);
            continue;
        }

        if (child.is_directory) {
            this->collect(child_path, prefix + child.name + "/", plan, names, ancestors);
        } else if (names.insert(prefix + child.name).second) {
            plan.items.push_back(ArchiveItem{prefix + child.name, child_path, false, child.size});
        }
    }
    ancestors.erase(real);
}

std::uint64_t ArchiveBuilder::stream(const ArchivePlan &plan, ByteSink &sink) const {
    ZipWriter writer(sink, this->level);
    for (const auto &item : plan.items) {
        if (item.is_directory) {
            writer.addDirectory(item.entry_name);
            continue;
        }

        ReadHandle handle;
        try {
            handle = this->view.openForRead(item.source);
        } catch (const TransferError &e) {
            if (e.kind() == ErrorKind::NotFound || e.kind() == ErrorKind::IsADirectory) {
                throw TransferError(ErrorKind::IOError, "Archive member disappeared: " + item.entry_name);
            }
            throw;
        }
        writer.addFile(item.entry_name, handle.stream, handle.size);
    }
    writer.finish();
    return writer.bytesWritten();
}

std::uint64_t ArchiveBuilder::build(const std::vector<std::string> &paths, ByteSink &sink) const {
    return this->stream(this->plan(paths), sink);
}

} // namespace pcdrop
