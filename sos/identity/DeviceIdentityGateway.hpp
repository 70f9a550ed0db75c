#pragma once

#include <string>
#include <unordered_map>

namespace sos {
namespace identity {

// Verifies a device's credentials and answers which user it is bound to.
class DeviceIdentityGateway {
public:
    virtual ~DeviceIdentityGateway() = default;

    // Returns the bound user id. Throws core::AuthorizationError for an
    // unknown device or a bad token.
    virtual std::string authenticate(const std::string& device_id,
                                     const std::string& token) const = 0;
};

// Token = hex(HMAC-SHA256(secret, device_id)). Bindings come from the
// [devices] config section.
class HmacDeviceGateway final : public DeviceIdentityGateway {
public:
    HmacDeviceGateway(std::string secret,
                      std::unordered_map<std::string, std::string> owners);

    std::string authenticate(const std::string& device_id,
                             const std::string& token) const override;

    static std::string issue_token(const std::string& secret, const std::string& device_id);

private:
    std::string m_secret;
    std::unordered_map<std::string, std::string> m_owners;
};

} // namespace identity
} // namespace sos
