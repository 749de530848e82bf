#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace sandpool {

// A single part of a multipart/form-data body
struct MultipartPart {
    std::map<std::string, std::string> headers;
    std::string name;
    std::string filename;
    std::vector<uint8_t> data;

    std::string text() const { return std::string(data.begin(), data.end()); }
};

// multipart/form-data parser. Binary safe: part bodies may contain NUL
// bytes and bare "--" runs, only a CRLF followed by the delimiter ends a part.
class MultipartParser {
public:
    // Returns the named parts in order; empty if the body is not multipart
    static std::vector<MultipartPart> parse(
        const std::string& content_type,
        const std::string& body
    );

    static std::string extract_boundary(const std::string& content_type);

private:
    static MultipartPart parse_part(const std::string& part_data);
    static std::string disposition_param(const std::string& value, const std::string& param);
};

} // namespace sandpool
