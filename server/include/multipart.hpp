#pragma once

#include "pcdrop/streams.hpp"

#include <map>
#include <string>

namespace pcdrop {

struct MultipartPart {
    std::string name;       // form field name
    std::string filename;   // empty for plain fields
    bool has_filename = false;
    std::string content_type;
    std::map<std::string, std::string> headers;
};

// extracts the boundary parameter of a multipart/form-data Content-Type
std::string multipart_boundary(const std::string &content_type);

// Streaming multipart/form-data reader. nextPart() advances to the next part
// (draining whatever is left of the current one); read() then yields that
// part's body until the next delimiter. Only a bounded window is buffered.
class MultipartReader : public ByteSource {
public:
    MultipartReader(ByteSource &source, const std::string &boundary);

    bool nextPart(MultipartPart &part);
    size_t read(char *buf, const size_t &len) override;

private:
    enum class State {
        Body,
        AfterDelimiter,
        Done
    };

    ByteSource &source;
    std::string delimiter;
    std::string buffer;
    size_t pos = 0;
    State state = State::Body;

    bool fill();
    void parseHeaders(MultipartPart &part);
};

} // namespace pcdrop
