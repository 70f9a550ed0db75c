#include "DeviceIdentityGateway.hpp"
#include "../core/Crypto.hpp"
#include "../core/Errors.hpp"

#include <iostream>

namespace sos {
namespace identity {

HmacDeviceGateway::HmacDeviceGateway(std::string secret,
                                     std::unordered_map<std::string, std::string> owners)
    : m_secret(std::move(secret)), m_owners(std::move(owners)) {}

std::string HmacDeviceGateway::issue_token(const std::string& secret, const std::string& device_id) {
    return core::Crypto::hmac_sha256_hex(secret, device_id);
}

std::string HmacDeviceGateway::authenticate(const std::string& device_id,
                                            const std::string& token) const {
    if (m_secret.empty())
        throw core::AuthorizationError("device authentication is not configured");

    auto it = m_owners.find(device_id);
    if (device_id.empty() || it == m_owners.end())
        throw core::AuthorizationError("unknown device");

    if (!core::Crypto::constant_time_equals(issue_token(m_secret, device_id), token)) {
        std::cerr << "[DeviceAuth] Rejected token for device=" << device_id << "\n";
        throw core::AuthorizationError("invalid device token");
    }
    return it->second;
}

} // namespace identity
} // namespace sos
