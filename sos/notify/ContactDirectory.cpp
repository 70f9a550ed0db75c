#include "ContactDirectory.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace sos {
namespace notify {

static ContactRoute parse_contact(const nlohmann::json& c) {
    ContactRoute r;
    r.contact_id = c.at("contact_id").get<std::string>();
    r.name = c.value("name", r.contact_id);

    for (const auto& ch : c.value("channels", nlohmann::json::array())) {
        auto parsed = parse_channel(ch.get<std::string>());
        if (!parsed)
            throw core::ValidationError("contact " + r.contact_id + ": unknown channel " + ch.dump());
        r.channels.push_back(*parsed);
    }

    if (c.contains("phone"))      r.phone = c["phone"].get<std::string>();
    if (c.contains("email"))      r.email = c["email"].get<std::string>();
    if (c.contains("push_token")) r.push_token = c["push_token"].get<std::string>();
    return r;
}

JsonContactDirectory JsonContactDirectory::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("cannot open contact directory " + path);

    nlohmann::json doc = nlohmann::json::parse(f, nullptr, false);
    if (doc.is_discarded())
        throw core::ValidationError("contact directory " + path + " is not valid JSON");

    JsonContactDirectory dir = from_json(doc);
    std::cout << "[Directory] Loaded " << dir.user_count() << " users from " << path << "\n";
    return dir;
}

JsonContactDirectory JsonContactDirectory::from_json(const nlohmann::json& doc) {
    JsonContactDirectory dir;
    try {
        for (const auto& [user_id, entry] : doc.at("users").items()) {
            auto& tiers = dir.m_tiers[user_id];
            for (const auto& tier : entry.at("tiers")) {
                std::vector<ContactRoute> contacts;
                for (const auto& c : tier)
                    contacts.push_back(parse_contact(c));
                tiers.push_back(std::move(contacts));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::ValidationError(std::string("malformed contact directory: ") + e.what());
    }
    return dir;
}

std::vector<ContactRoute> JsonContactDirectory::prioritized_contacts(const std::string& user_id,
                                                                     uint32_t tier) const {
    auto it = m_tiers.find(user_id);
    if (it == m_tiers.end() || it->second.empty() || tier == 0)
        return {};

    size_t index = std::min<size_t>(tier, it->second.size()) - 1;
    return it->second[index];
}

std::optional<ContactRoute> JsonContactDirectory::find_contact(const std::string& user_id,
                                                               const std::string& contact_id) const {
    auto it = m_tiers.find(user_id);
    if (it == m_tiers.end())
        return std::nullopt;

    for (const auto& tier : it->second)
        for (const auto& c : tier)
            if (c.contact_id == contact_id)
                return c;
    return std::nullopt;
}

} // namespace notify
} // namespace sos
