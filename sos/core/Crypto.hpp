#pragma once

#include <string>

namespace sos {
namespace core {

// OpenSSL-backed primitives. All functions throw std::runtime_error when
// the underlying OpenSSL call fails.
class Crypto {
public:
    // RFC 4122 version 4 UUID from RAND_bytes.
    static std::string random_uuid();

    static std::string sha256_hex(const std::string& data);

    static std::string hmac_sha256_hex(const std::string& key,
                                       const std::string& data);

    // Length-independent timing for equal-length inputs (CRYPTO_memcmp).
    static bool constant_time_equals(const std::string& a, const std::string& b);

private:
    static std::string to_hex(const unsigned char* data, size_t len);
};

} // namespace core
} // namespace sos
