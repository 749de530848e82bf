#pragma once

#include <string>
#include <cstddef>

namespace sandpool {

class CryptoUtils {
public:
    // Hex SHA-256 of a buffer
    static std::string sha256_string(const std::string& data);

    // Random RFC 4122 version-4 UUID, e.g. "3f2c...-4...-a...-..."
    static std::string random_uuid();

    static std::string bytes_to_hex(const unsigned char* data, size_t len);
};

} // namespace sandpool
