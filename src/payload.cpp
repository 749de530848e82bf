#include "payload.h"
#include "constants.h"
#include "crypto_utils.h"
#include "errors.h"

#include <algorithm>
#include <cctype>

namespace sandpool {

namespace {

bool is_safe_filename(const std::string& name) {
    if (name.empty() || name[0] == '.') return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

void Payload::validate() const {
    if (!is_safe_filename(filename)) {
        throw InvalidPayloadError("Invalid filename: " + filename);
    }
    if (!ends_with(filename, ".py") || filename.size() == 3) {
        throw InvalidPayloadError("Only Python scripts (.py) are accepted");
    }
    if (content.empty()) {
        throw InvalidPayloadError("Script is empty");
    }
    if (content.size() > MAX_SCRIPT_SIZE) {
        throw InvalidPayloadError("Script exceeds " + std::to_string(MAX_SCRIPT_SIZE) + " bytes");
    }
    // Binary uploads are not scripts
    if (content.find('\0') != std::string::npos) {
        throw InvalidPayloadError("Script contains binary data");
    }
}

std::string Payload::sha256() const {
    return CryptoUtils::sha256_string(content);
}

Payload Payload::from_upload(const std::vector<MultipartPart>& parts) {
    const MultipartPart* file_part = nullptr;
    for (const auto& part : parts) {
        if (part.name == "file") {
            if (file_part) {
                throw InvalidPayloadError("Exactly one file must be uploaded");
            }
            file_part = &part;
        }
    }

    if (!file_part || file_part->filename.empty()) {
        throw InvalidPayloadError("No file provided");
    }

    Payload payload;
    payload.filename = file_part->filename;
    payload.content.assign(file_part->data.begin(), file_part->data.end());
    payload.validate();
    return payload;
}

} // namespace sandpool
