#pragma once

#include <string>
#include <vector>
#include "multipart.h"

namespace sandpool {

// A single user script to run inside a sandbox
struct Payload {
    std::string filename;   // e.g. "main.py", written to /code/<filename>
    std::string content;

    // Throws InvalidPayloadError unless this is a plausible Python script
    void validate() const;

    // Digest recorded on the session for log correlation
    std::string sha256() const;

    // Build from an upload; the script is expected in the "file" part
    static Payload from_upload(const std::vector<MultipartPart>& parts);
};

} // namespace sandpool
