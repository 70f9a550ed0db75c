#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "NotificationTypes.hpp"

namespace sos {
namespace notify {

class ContactDirectory {
public:
    virtual ~ContactDirectory() = default;

    // Contacts to alert at `tier`, highest priority first.
    virtual std::vector<ContactRoute> prioritized_contacts(const std::string& user_id,
                                                           uint32_t tier) const = 0;

    // Any contact of the user, whatever its tier.
    virtual std::optional<ContactRoute> find_contact(const std::string& user_id,
                                                     const std::string& contact_id) const = 0;
};

// Directory read from a JSON file:
//   {"users": {"<userId>": {"tiers": [[contact, ...], [contact, ...]]}}}
// with contact = {"contact_id", "name", "channels": ["PUSH", ...],
//                 "phone"?, "email"?, "push_token"?}.
// Tiers past the last list reuse the last list.
class JsonContactDirectory final : public ContactDirectory {
public:
    static JsonContactDirectory load(const std::string& path);
    static JsonContactDirectory from_json(const nlohmann::json& doc);

    std::vector<ContactRoute> prioritized_contacts(const std::string& user_id,
                                                   uint32_t tier) const override;

    std::optional<ContactRoute> find_contact(const std::string& user_id,
                                             const std::string& contact_id) const override;

    size_t user_count() const { return m_tiers.size(); }

private:
    std::unordered_map<std::string, std::vector<std::vector<ContactRoute>>> m_tiers;
};

} // namespace notify
} // namespace sos
