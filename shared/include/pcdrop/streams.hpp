#pragma once

#include <cstddef>

namespace pcdrop {

// pull side of a byte stream; read() returns 0 once the stream is exhausted
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(char *buf, const size_t &len) = 0;
};

// push side of a byte stream; write() blocks until the bytes are accepted
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const char *data, const size_t &len) = 0;
};

} // namespace pcdrop
