#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "HttpServer.hpp"
#include "../core/Errors.hpp"
#include "../emergency/EmergencyEngine.hpp"
#include "../notify/ContactDirectory.hpp"
#include "../notify/NotificationDispatcher.hpp"

namespace sos {
namespace api {

// Routes HTTP requests onto the engine and maps EngineError kinds to status
// codes. Identity comes from gateway-set headers: X-User-Id for the owner,
// X-Contact-Id for a contact, X-Device-Id/X-Device-Token for devices.
class EmergencyApi {
public:
    EmergencyApi(emergency::EmergencyEngine& engine,
                 notify::NotificationDispatcher& dispatcher,
                 const notify::ContactDirectory& directory);

    HttpResponse handle(const HttpRequest& req);

private:
    HttpResponse route(const HttpRequest& req, const std::vector<std::string>& parts);

    HttpResponse trigger(const HttpRequest& req);
    HttpResponse auto_trigger(const HttpRequest& req);
    HttpResponse cancel(const HttpRequest& req, const std::string& id);
    HttpResponse resolve(const HttpRequest& req, const std::string& id);
    HttpResponse acknowledge(const HttpRequest& req, const std::string& id);
    HttpResponse get(const HttpRequest& req, const std::string& id);
    HttpResponse history(const HttpRequest& req);
    HttpResponse delivered(const std::string& job_id);
    HttpResponse health();

    static HttpResponse json_response(int status, const nlohmann::json& body);
    static HttpResponse error_response(const core::EngineError& e);

    emergency::EmergencyEngine& m_engine;
    notify::NotificationDispatcher& m_dispatcher;
    const notify::ContactDirectory& m_directory;
};

} // namespace api
} // namespace sos
