#include "multipart.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace sandpool {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // namespace

std::vector<MultipartPart> MultipartParser::parse(
    const std::string& content_type,
    const std::string& body
) {
    std::vector<MultipartPart> parts;

    if (to_lower(content_type).find("multipart/form-data") == std::string::npos) return parts;

    std::string boundary = extract_boundary(content_type);
    if (boundary.empty()) return parts;

    std::string delimiter = "--" + boundary;

    // First delimiter may open the body without a leading CRLF
    size_t start = body.find(delimiter);
    if (start == std::string::npos) return parts;
    start += delimiter.length();

    std::string separator = "\r\n" + delimiter;
    while (start < body.size()) {
        // "--" right after a delimiter closes the body
        if (body.compare(start, 2, "--") == 0) break;

        // Skip transport padding and the CRLF ending the delimiter line
        size_t line_end = body.find("\r\n", start);
        if (line_end == std::string::npos) break;
        start = line_end + 2;

        size_t end = body.find(separator, start);
        if (end == std::string::npos) break;

        MultipartPart part = parse_part(body.substr(start, end - start));
        if (!part.name.empty()) {
            parts.push_back(std::move(part));
        }

        start = end + separator.length();
    }

    return parts;
}

std::string MultipartParser::extract_boundary(const std::string& content_type) {
    std::string lowered = to_lower(content_type);
    std::string boundary_prefix = "boundary=";
    size_t pos = lowered.find(boundary_prefix);
    if (pos == std::string::npos) return "";

    pos += boundary_prefix.length();
    size_t end = content_type.find(';', pos);
    if (end == std::string::npos) end = content_type.length();

    std::string boundary = trim(content_type.substr(pos, end - pos));

    // Remove quotes if present
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.length() - 2);
    }

    return boundary;
}

std::string MultipartParser::disposition_param(const std::string& value, const std::string& param) {
    std::string lowered = to_lower(value);
    std::string needle = param + "=";

    size_t pos = 0;
    while ((pos = lowered.find(needle, pos)) != std::string::npos) {
        // Reject matches inside another parameter, e.g. name= inside filename=
        if (pos > 0 && lowered[pos - 1] != ' ' && lowered[pos - 1] != ';') {
            pos += needle.length();
            continue;
        }

        size_t value_start = pos + needle.length();
        if (value_start < value.size() && value[value_start] == '"') {
            size_t close = value.find('"', value_start + 1);
            if (close == std::string::npos) return value.substr(value_start + 1);
            return value.substr(value_start + 1, close - value_start - 1);
        }

        size_t close = value.find(';', value_start);
        if (close == std::string::npos) close = value.size();
        return trim(value.substr(value_start, close - value_start));
    }
    return "";
}

MultipartPart MultipartParser::parse_part(const std::string& part_data) {
    MultipartPart part;

    size_t headers_end = part_data.find("\r\n\r\n");
    size_t content_start;
    if (headers_end != std::string::npos) {
        content_start = headers_end + 4;
    } else if (part_data.compare(0, 2, "\r\n") == 0) {
        // No headers at all
        headers_end = 0;
        content_start = 2;
    } else {
        return part;
    }

    std::istringstream headers_stream(part_data.substr(0, headers_end));
    std::string line;
    while (std::getline(headers_stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        part.headers[key] = value;

        if (to_lower(key) == "content-disposition") {
            part.name = disposition_param(value, "name");
            part.filename = disposition_param(value, "filename");
        }
    }

    part.data.assign(part_data.begin() + content_start, part_data.end());
    return part;
}

} // namespace sandpool
