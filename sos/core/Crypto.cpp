#include "Crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace sos {
namespace core {

std::string Crypto::to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string Crypto::random_uuid() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1)
        throw std::runtime_error("RAND_bytes failed");

    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = to_hex(b, sizeof(b));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4)
         + "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string Crypto::sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha256) failed");

    return to_hex(digest, len);
}

std::string Crypto::hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    unsigned char* out = HMAC(EVP_sha256(),
                              key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              data.size(),
                              mac, &len);
    if (!out)
        throw std::runtime_error("HMAC(sha256) failed");

    return to_hex(mac, len);
}

bool Crypto::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size())
        return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace core
} // namespace sos
