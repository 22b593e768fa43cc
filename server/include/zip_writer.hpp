#pragma once

#include "pcdrop/streams.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace pcdrop {

// Streams a ZIP archive into a sink entry by entry.
// Members are written with data descriptors so nothing is buffered beyond one chunk;
// timestamps are pinned to 1980-01-01 so identical inputs give identical archives.
class ZipWriter {
public:
    // level follows zlib (Z_DEFAULT_COMPRESSION, 0-9); 0 stores entries uncompressed
    ZipWriter(ByteSink &sink, const int &level);

    void addFile(const std::string &name, std::istream &in, const std::uint64_t &size_hint);
    void addDirectory(const std::string &name);
    void finish();

    std::uint64_t bytesWritten() const { return this->offset; }
    size_t entryCount() const { return this->entries.size(); }

private:
    struct CentralEntry {
        std::string name;
        std::uint32_t crc = 0;
        std::uint64_t compressed_size = 0;
        std::uint64_t uncompressed_size = 0;
        std::uint64_t local_header_offset = 0;
        std::uint16_t method = 0;
        bool is_directory = false;
        bool zip64 = false;
    };

    ByteSink &sink;
    int level;
    std::uint64_t offset = 0;
    bool finished = false;
    std::vector<CentralEntry> entries;

    void emit(const std::string &bytes);
    void writeLocalHeader(const CentralEntry &entry);
    void writeDataDescriptor(const CentralEntry &entry);
    void writeCentralDirectory();
    void storeData(CentralEntry &entry, std::istream &in);
    void deflateData(CentralEntry &entry, std::istream &in);
};

} // namespace pcdrop
