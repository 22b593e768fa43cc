#include "zip_writer.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

#include <zlib.h>

#include <stdexcept>

namespace pcdrop {

namespace {

constexpr std::uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr std::uint32_t DATA_DESCRIPTOR_SIG = 0x08074b50;
constexpr std::uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr std::uint32_t ZIP64_EOCD_SIG = 0x06064b50;
constexpr std::uint32_t ZIP64_LOCATOR_SIG = 0x07064b50;
constexpr std::uint32_t EOCD_SIG = 0x06054b50;

constexpr std::uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
constexpr std::uint16_t FLAG_UTF8 = 0x0800;
constexpr std::uint16_t METHOD_STORE = 0;
constexpr std::uint16_t METHOD_DEFLATE = 8;
constexpr std::uint16_t VERSION_DEFAULT = 20;
constexpr std::uint16_t VERSION_ZIP64 = 45;
constexpr std::uint16_t MADE_BY_UNIX = 3 << 8;
constexpr std::uint16_t ZIP64_EXTRA_ID = 0x0001;

// 1980-01-01 00:00:00, the earliest DOS timestamp
constexpr std::uint16_t DOS_TIME = 0;
constexpr std::uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1;

constexpr std::uint64_t MAX_32 = 0xFFFFFFFFull;
constexpr std::uint64_t MAX_16 = 0xFFFFull;
// leaves headroom for deflate expansion of incompressible members
constexpr std::uint64_t ZIP64_THRESHOLD = 0xF0000000ull;

void put16(std::string &out, const std::uint16_t &v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string &out, const std::uint32_t &v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void put64(std::string &out, const std::uint64_t &v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

std::uint32_t clamp32(const std::uint64_t &v) {
    return v >= MAX_32 ? static_cast<std::uint32_t>(MAX_32) : static_cast<std::uint32_t>(v);
}

// releases the zlib stream on every exit path
struct DeflateGuard {
    z_stream *stream;
    ~DeflateGuard() { deflateEnd(this->stream); }
};

size_t read_chunk(std::istream &in, char *buf, const size_t &len) {
    in.read(buf, static_cast<std::streamsize>(len));
    if (in.bad()) {
        throw TransferError(ErrorKind::IOError, "Failed to read archive member");
    }
    return static_cast<size_t>(in.gcount());
}

}

ZipWriter::ZipWriter(ByteSink &sink, const int &level) : sink(sink), level(level) {}

void ZipWriter::emit(const std::string &bytes) {
    this->sink.write(bytes.data(), bytes.size());
    this->offset += bytes.size();
}

void ZipWriter::addFile(const std::string &name, std::istream &in, const std::uint64_t &size_hint) {
    if (this->finished) {
        throw std::logic_error("ZipWriter: archive already finished");
    }

    CentralEntry entry;
    entry.name = name;
    entry.method = this->level == 0 ? METHOD_STORE : METHOD_DEFLATE;
    entry.local_header_offset = this->offset;
    entry.zip64 = size_hint >= ZIP64_THRESHOLD;

    this->writeLocalHeader(entry);
    if (entry.method == METHOD_STORE) {
        this->storeData(entry, in);
    } else {
        this->deflateData(entry, in);
    }

    if (!entry.zip64 && (entry.compressed_size >= MAX_32 || entry.uncompressed_size >= MAX_32)) {
        throw TransferError(ErrorKind::IOError, "Member grew past the announced size: " + name);
    }
    this->writeDataDescriptor(entry);
    this->entries.push_back(entry);
}

void ZipWriter::addDirectory(const std::string &name) {
    if (this->finished) {
        throw std::logic_error("ZipWriter: archive already finished");
    }

    CentralEntry entry;
    entry.name = name.empty() || name.back() == '/' ? name : name + "/";
    entry.method = METHOD_STORE;
    entry.is_directory = true;
    entry.local_header_offset = this->offset;

    this->writeLocalHeader(entry);
    this->entries.push_back(entry);
}

void ZipWriter::finish() {
    if (this->finished) {
        return;
    }
    this->writeCentralDirectory();
    this->finished = true;
}

void ZipWriter::writeLocalHeader(const CentralEntry &entry) {
    std::string out;
    put32(out, LOCAL_HEADER_SIG);
    put16(out, entry.zip64 ? VERSION_ZIP64 : VERSION_DEFAULT);
    put16(out, entry.is_directory ? FLAG_UTF8 : static_cast<std::uint16_t>(FLAG_UTF8 | FLAG_DATA_DESCRIPTOR));
    put16(out, entry.method);
    put16(out, DOS_TIME);
    put16(out, DOS_DATE);
    put32(out, 0); // crc, sizes follow in the data descriptor
    put32(out, entry.zip64 ? static_cast<std::uint32_t>(MAX_32) : 0);
    put32(out, entry.zip64 ? static_cast<std::uint32_t>(MAX_32) : 0);
    put16(out, static_cast<std::uint16_t>(entry.name.size()));
    put16(out, entry.zip64 ? 20 : 0);
    out += entry.name;
    if (entry.zip64) {
        put16(out, ZIP64_EXTRA_ID);
        put16(out, 16);
        put64(out, 0);
        put64(out, 0);
    }
    this->emit(out);
}

void ZipWriter::writeDataDescriptor(const CentralEntry &entry) {
    std::string out;
    put32(out, DATA_DESCRIPTOR_SIG);
    put32(out, entry.crc);
    if (entry.zip64) {
        put64(out, entry.compressed_size);
        put64(out, entry.uncompressed_size);
    } else {
        put32(out, static_cast<std::uint32_t>(entry.compressed_size));
        put32(out, static_cast<std::uint32_t>(entry.uncompressed_size));
    }
    this->emit(out);
}

void ZipWriter::storeData(CentralEntry &entry, std::istream &in) {
    char temp[TMP_BUFF_SIZE];
    uLong crc = ::crc32(0L, Z_NULL, 0);
    while (true) {
        size_t n = read_chunk(in, temp, sizeof(temp));
        if (n == 0) {
            break;
        }
        crc = ::crc32(crc, reinterpret_cast<const Bytef *>(temp), static_cast<uInt>(n));
        this->sink.write(temp, n);
        this->offset += n;
        entry.uncompressed_size += n;
        entry.compressed_size += n;
    }
    entry.crc = static_cast<std::uint32_t>(crc);
}

void ZipWriter::deflateData(CentralEntry &entry, std::istream &in) {
    z_stream zs{};
    if (deflateInit2(&zs, this->level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw TransferError(ErrorKind::IOError, "deflateInit2 failed");
    }
    DeflateGuard guard{&zs};

    char in_buf[TMP_BUFF_SIZE];
    char out_buf[TMP_BUFF_SIZE];
    uLong crc = ::crc32(0L, Z_NULL, 0);
    int flush = Z_NO_FLUSH;
    while (flush != Z_FINISH) {
        size_t n = read_chunk(in, in_buf, sizeof(in_buf));
        flush = in.eof() || n == 0 ? Z_FINISH : Z_NO_FLUSH;
        crc = ::crc32(crc, reinterpret_cast<const Bytef *>(in_buf), static_cast<uInt>(n));
        entry.uncompressed_size += n;

        zs.next_in = reinterpret_cast<Bytef *>(in_buf);
        zs.avail_in = static_cast<uInt>(n);
        do {
            zs.next_out = reinterpret_cast<Bytef *>(out_buf);
            zs.avail_out = sizeof(out_buf);
            int ret = deflate(&zs, flush);
            if (ret == Z_STREAM_ERROR) {
                throw TransferError(ErrorKind::IOError, "deflate failed");
            }
            size_t produced = sizeof(out_buf) - zs.avail_out;
            if (produced > 0) {
                this->sink.write(out_buf, produced);
                this->offset += produced;
                entry.compressed_size += produced;
            }
        } while (zs.avail_out == 0);
    }
    entry.crc = static_cast<std::uint32_t>(crc);
}

void ZipWriter::writeCentralDirectory() {
    std::uint64_t cd_offset = this->offset;
    for (const auto &entry : this->entries) {
        // zip64 extra carries only the fields that overflow, in this fixed order
        std::string extra;
        if (entry.uncompressed_size >= MAX_32) put64(extra, entry.uncompressed_size);
        if (entry.compressed_size >= MAX_32) put64(extra, entry.compressed_size);
        if (entry.local_header_offset >= MAX_32) put64(extra, entry.local_header_offset);
        bool zip64 = entry.zip64 || !extra.empty();

        std::string out;
        put32(out, CENTRAL_HEADER_SIG);
        put16(out, static_cast<std::uint16_t>(MADE_BY_UNIX | (zip64 ? VERSION_ZIP64 : VERSION_DEFAULT)));
        put16(out, zip64 ? VERSION_ZIP64 : VERSION_DEFAULT);
        put16(out, entry.is_directory ? FLAG_UTF8 : static_cast<std::uint16_t>(FLAG_UTF8 | FLAG_DATA_DESCRIPTOR));
        put16(out, entry.method);
        put16(out, DOS_TIME);
        put16(out, DOS_DATE);
        put32(out, entry.crc);
        put32(out, clamp32(entry.compressed_size));
        put32(out, clamp32(entry.uncompressed_size));
        put16(out, static_cast<std::uint16_t>(entry.name.size()));
        put16(out, static_cast<std::uint16_t>(extra.empty() ? 0 : extra.size() + 4));
        put16(out, 0); // comment
        put16(out, 0); // disk number
        put16(out, 0); // internal attributes
        // unix mode in the high word, MS-DOS directory bit in the low word
        put32(out, entry.is_directory ? ((040755u << 16) | 0x10u) : (0100644u << 16));
        put32(out, clamp32(entry.local_header_offset));
        out += entry.name;
        if (!extra.empty()) {
            put16(out, ZIP64_EXTRA_ID);
            put16(out, static_cast<std::uint16_t>(extra.size()));
            out += extra;
        }
        this->emit(out);
    }
    std::uint64_t cd_size = this->offset - cd_offset;
    std::uint64_t count = this->entries.size();

    if (count >= MAX_16 || cd_size >= MAX_32 || cd_offset >= MAX_32) {
        std::uint64_t zip64_eocd_offset = this->offset;
        std::string rec;
        put32(rec, ZIP64_EOCD_SIG);
        put64(rec, 44);
        put16(rec, static_cast<std::uint16_t>(MADE_BY_UNIX | VERSION_ZIP64));
        put16(rec, VERSION_ZIP64);
        put32(rec, 0);
        put32(rec, 0);
        put64(rec, count);
        put64(rec, count);
        put64(rec, cd_size);
        put64(rec, cd_offset);

        put32(rec, ZIP64_LOCATOR_SIG);
        put32(rec, 0);
        put64(rec, zip64_eocd_offset);
        put32(rec, 1);
        this->emit(rec);
    }

    std::string eocd;
    put32(eocd, EOCD_SIG);
    put16(eocd, 0);
    put16(eocd, 0);
    put16(eocd, static_cast<std::uint16_t>(count >= MAX_16 ? MAX_16 : count));
    put16(eocd, static_cast<std::uint16_t>(count >= MAX_16 ? MAX_16 : count));
    put32(eocd, clamp32(cd_size));
    put32(eocd, clamp32(cd_offset));
    put16(eocd, 0);
    this->emit(eocd);
}

} // namespace pcdrop
