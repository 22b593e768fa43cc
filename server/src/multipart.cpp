#include "multipart.hpp"
#include "pcdrop/errors.hpp"
#include "pcdrop/helpers.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

namespace pcdrop {

namespace {

constexpr size_t MAX_PART_HEADERS = 16 * 1024;

// splits "a; b=\"x;y\"; c" on semicolons outside quotes
std::vector<std::string> split_params(const std::string &value) {
    std::vector<std::string> params;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\\' && quoted && i + 1 < value.size()) {
            current.push_back(c);
            current.push_back(value[++i]);
            continue;
        }
        if (c == '"') {
            quoted = !quoted;
        }
        if (c == ';' && !quoted) {
            params.push_back(trim(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    params.push_back(trim(current));
    return params;
}

std::string unquote(const std::string &value) {
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return value;
    }
    std::string out;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        if (value[i] == '\\' && i + 2 < value.size()) {
            ++i;
        }
        out.push_back(value[i]);
    }
    return out;
}

}

std::string multipart_boundary(const std::string &content_type) {
    std::vector<std::string> params = split_params(content_type);
    if (params.empty() || to_lower(params[0]) != "multipart/form-data") {
        return "";
    }
    for (size_t i = 1; i < params.size(); ++i) {
        size_t eq = params[i].find('=');
        if (eq != std::string::npos && to_lower(trim(params[i].substr(0, eq))) == "boundary") {
            return unquote(trim(params[i].substr(eq + 1)));
        }
    }
    return "";
}

MultipartReader::MultipartReader(ByteSource &source, const std::string &boundary)
    : source(source), delimiter("\r\n--" + boundary), buffer("\r\n") {
    if (boundary.empty() || boundary.size() > 70) {
        throw TransferError(ErrorKind::BadRequest, "Invalid multipart boundary");
    }
}

bool MultipartReader::fill() {
    if (this->pos > 0) {
        this->buffer.erase(0, this->pos);
        this->pos = 0;
    }
    char temp[TMP_BUFF_SIZE];
    size_t n = this->source.read(temp, sizeof(temp));
    if (n == 0) {
        return false;
    }
    this->buffer.append(temp, n);
    return true;
}

size_t MultipartReader::read(char *buf, const size_t &len) {
    if (this->state != State::Body || len == 0) {
        return 0;
    }

    while (true) {
        size_t idx = this->buffer.find(this->delimiter, this->pos);
        if (idx != std::string::npos) {
            if (idx > this->pos) {
                size_t n = std::min(len, idx - this->pos);
                std::memcpy(buf, this->buffer.data() + this->pos, n);
                this->pos += n;
                return n;
            }
            this->pos = idx + this->delimiter.size();
            this->state = State::AfterDelimiter;
            return 0;
        }

        // everything but a possible delimiter prefix at the tail is part data
        size_t avail = this->buffer.size() - this->pos;
        size_t keep = this->delimiter.size() - 1;
        if (avail > keep) {
            size_t n = std::min(len, avail - keep);
            std::memcpy(buf, this->buffer.data() + this->pos, n);
            this->pos += n;
            return n;
        }
        if (!this->fill()) {
            throw TransferError(ErrorKind::BadRequest, "Multipart body ended before the closing boundary");
        }
    }
}

bool MultipartReader::nextPart(MultipartPart &part) {
    if (this->state == State::Done) {
        return false;
    }

    // skip the rest of the current part (or the preamble)
    if (this->state == State::Body) {
        char temp[4096];
        while (this->read(temp, sizeof(temp)) > 0) {
        }
    }

    while (this->buffer.size() - this->pos < 2) {
        if (!this->fill()) {
            throw TransferError(ErrorKind::BadRequest, "Multipart body ended after a boundary");
        }
    }
    if (this->buffer.compare(this->pos, 2, "--") == 0) {
        this->state = State::Done;
        return false;
    }

    // rest of the boundary line (transport padding) up to CRLF
    while (true) {
        size_t eol = this->buffer.find("\r\n", this->pos);
        if (eol != std::string::npos) {
            this->pos = eol + 2;
            break;
        }
        if (this->buffer.size() - this->pos > 1024 || !this->fill()) {
            throw TransferError(ErrorKind::BadRequest, "Malformed multipart boundary line");
        }
    }

    // part headers end with an empty line
    std::string head;
    while (true) {
        if (this->buffer.size() - this->pos >= 2 && this->buffer.compare(this->pos, 2, "\r\n") == 0) {
            this->pos += 2;
            break;
        }
        size_t end = this->buffer.find("\r\n\r\n", this->pos);
        if (end != std::string::npos) {
            head = this->buffer.substr(this->pos, end - this->pos);
            this->pos = end + 4;
            break;
        }
        if (this->buffer.size() - this->pos > MAX_PART_HEADERS) {
            throw TransferError(ErrorKind::BadRequest, "Multipart part headers too large");
        }
        if (!this->fill()) {
            throw TransferError(ErrorKind::BadRequest, "Multipart body ended inside part headers");
        }
    }

    part = MultipartPart{};
    for (const auto &raw : split(head, '\n')) {
        std::string line = trim(raw);
        size_t colon = line.find(':');
        if (line.empty() || colon == std::string::npos) {
            continue;
        }
        part.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    this->parseHeaders(part);
    this->state = State::Body;
    return true;
}

void MultipartReader::parseHeaders(MultipartPart &part) {
    auto type = part.headers.find("content-type");
    if (type != part.headers.end()) {
        part.content_type = type->second;
    }

    auto disposition = part.headers.find("content-disposition");
    if (disposition == part.headers.end()) {
        return;
    }
    std::vector<std::string> params = split_params(disposition->second);
    std::string extended_filename;
    for (size_t i = 1; i < params.size(); ++i) {
        size_t eq = params[i].find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = to_lower(trim(params[i].substr(0, eq)));
        std::string value = trim(params[i].substr(eq + 1));
        if (key == "name") {
            part.name = unquote(value);
        } else if (key == "filename") {
            part.filename = unquote(value);
            part.has_filename = true;
        } else if (key == "filename*") {
            // RFC 5987: charset'language'percent-encoded
            size_t quote = value.find('\'', value.find('\'') + 1);
            extended_filename = url_decode(quote == std::string::npos ? value : value.substr(quote + 1));
        }
    }
    if (!extended_filename.empty()) {
        part.filename = extended_filename;
        part.has_filename = true;
    }
}

} // namespace pcdrop
