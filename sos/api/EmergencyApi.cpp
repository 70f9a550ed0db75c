#include "EmergencyApi.hpp"
#include "../core/JsonCodec.hpp"

#include <iostream>
#include <sstream>

namespace sos {
namespace api {

using nlohmann::json;

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/'))
        if (!item.empty())
            parts.push_back(item);
    return parts;
}

static json parse_body(const HttpRequest& req) {
    if (req.body.empty())
        return json::object();
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        throw core::ValidationError("request body must be a JSON object");
    return body;
}

static std::string require_header(const HttpRequest& req, const char* name) {
    std::string v = req.header(name);
    if (v.empty())
        throw core::AuthorizationError(std::string("missing ") + name + " header");
    return v;
}

template<typename T>
static std::optional<T> optional_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
        return std::nullopt;
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        throw core::ValidationError(std::string("field ") + key + " has the wrong type");
    }
}

static core::EmergencyType require_type(const json& body, core::EmergencyType fallback, bool required) {
    auto raw = optional_field<std::string>(body, "emergency_type");
    if (!raw) {
        if (required)
            throw core::ValidationError("emergency_type is required");
        return fallback;
    }
    auto t = core::parse_emergency_type(*raw);
    if (!t)
        throw core::ValidationError("unknown emergency_type " + *raw);
    return *t;
}

static core::Location require_location(const json& body) {
    if (!body.contains("location"))
        throw core::ValidationError("location is required");
    return core::location_from_json(body["location"]);
}

static size_t parse_page_number(const std::optional<std::string>& raw, size_t fallback, const char* name) {
    if (!raw)
        return fallback;
    try {
        size_t used = 0;
        long long v = std::stoll(*raw, &used);
        if (used != raw->size() || v < 0)
            throw std::invalid_argument(*raw);
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        throw core::ValidationError(std::string(name) + " must be a positive integer");
    }
}

static json view_json(const emergency::EmergencyView& v) {
    json j = core::to_json(v.emergency);
    j["acknowledgments"] = json::array();
    for (const auto& a : v.acknowledgments)
        j["acknowledgments"].push_back(core::to_json(a));
    if (v.escalation)
        j["escalation"] = core::to_json(*v.escalation);
    return j;
}

EmergencyApi::EmergencyApi(emergency::EmergencyEngine& engine,
                           notify::NotificationDispatcher& dispatcher,
                           const notify::ContactDirectory& directory)
    : m_engine(engine), m_dispatcher(dispatcher), m_directory(directory) {}

HttpResponse EmergencyApi::json_response(int status, const json& body) {
    HttpResponse res;
    res.status = status;
    res.body = body.dump();
    return res;
}

HttpResponse EmergencyApi::error_response(const core::EngineError& e) {
    json body = {
        {"error", core::to_string(e.kind())},
        {"message", e.what()}
    };
    if (auto* conflict = dynamic_cast<const core::StateConflict*>(&e))
        body["current_status"] = core::to_string(conflict->current_status());
    return json_response(core::http_status_for(e.kind()), body);
}

HttpResponse EmergencyApi::handle(const HttpRequest& req) {
    try {
        return route(req, split_path(req.path));
    } catch (const core::EngineError& e) {
        if (e.kind() == core::ErrorKind::TRANSIENT_STORE)
            std::cerr << "[Api] " << req.method << " " << req.path << " store unavailable: " << e.what() << "\n";
        return error_response(e);
    } catch (const std::exception& e) {
        std::cerr << "[Api] " << req.method << " " << req.path << " failed: " << e.what() << "\n";
        return json_response(500, {{"error", "InternalError"}, {"message", "internal error"}});
    }
}

HttpResponse EmergencyApi::route(const HttpRequest& req, const std::vector<std::string>& parts) {
    const std::string& m = req.method;

    if (parts.size() == 1 && parts[0] == "health") {
        if (m == "GET") return health();
    }
    else if (parts.size() == 3 && parts[0] == "notifications" && parts[2] == "delivered") {
        if (m == "POST") return delivered(parts[1]);
    }
    else if (!parts.empty() && parts[0] == "emergency") {
        if (parts.size() == 2 && parts[1] == "trigger") {
            if (m == "POST") return trigger(req);
        }
        else if (parts.size() == 2 && parts[1] == "auto-trigger") {
            if (m == "POST") return auto_trigger(req);
        }
        else if (parts.size() == 2 && parts[1] == "history") {
            if (m == "GET") return history(req);
        }
        else if (parts.size() == 2) {
            if (m == "GET") return get(req, parts[1]);
        }
        else if (parts.size() == 3 && parts[2] == "cancel") {
            if (m == "PUT") return cancel(req, parts[1]);
        }
        else if (parts.size() == 3 && parts[2] == "resolve") {
            if (m == "PUT") return resolve(req, parts[1]);
        }
        else if (parts.size() == 3 && parts[2] == "acknowledge") {
            if (m == "POST") return acknowledge(req, parts[1]);
        }
        else {
            return json_response(404, {{"error", "NotFound"}, {"message", "no route for " + req.path}});
        }
    }
    else {
        return json_response(404, {{"error", "NotFound"}, {"message", "no route for " + req.path}});
    }

    return json_response(405, {{"error", "MethodNotAllowed"}, {"message", m + " not allowed on " + req.path}});
}

HttpResponse EmergencyApi::trigger(const HttpRequest& req) {
    json body = parse_body(req);

    emergency::TriggerRequest t;
    t.user_id = require_header(req, "X-User-Id");
    t.type = require_type(body, core::EmergencyType::OTHER, true);
    t.location = require_location(body);
    t.countdown_seconds = optional_field<int>(body, "countdown_seconds");
    t.initial_message = optional_field<std::string>(body, "initial_message");

    core::Emergency e = m_engine.trigger(t);
    json out = core::to_json(e);
    out["emergency_id"] = e.id;
    return json_response(201, out);
}

HttpResponse EmergencyApi::auto_trigger(const HttpRequest& req) {
    json body = parse_body(req);

    emergency::AutoTriggerRequest t;
    t.device_id = require_header(req, "X-Device-Id");
    t.device_token = require_header(req, "X-Device-Token");
    t.user_id = optional_field<std::string>(body, "user_id");
    t.type = require_type(body, core::EmergencyType::FALL, false);
    t.location = require_location(body);
    t.confidence = optional_field<double>(body, "confidence");
    t.initial_message = optional_field<std::string>(body, "initial_message");

    core::Emergency e = m_engine.auto_trigger(t);
    json out = core::to_json(e);
    out["emergency_id"] = e.id;
    return json_response(201, out);
}

HttpResponse EmergencyApi::cancel(const HttpRequest& req, const std::string& id) {
    std::string user = require_header(req, "X-User-Id");
    return json_response(200, core::to_json(m_engine.cancel(id, user)));
}

HttpResponse EmergencyApi::resolve(const HttpRequest& req, const std::string& id) {
    std::string user = require_header(req, "X-User-Id");
    json body = parse_body(req);
    auto notes = optional_field<std::string>(body, "resolution_notes");
    return json_response(200, core::to_json(m_engine.resolve(id, user, notes)));
}

HttpResponse EmergencyApi::acknowledge(const HttpRequest& req, const std::string& id) {
    std::string contact_id = require_header(req, "X-Contact-Id");
    json body = parse_body(req);

    emergency::EmergencyView view = m_engine.get(id);
    auto contact = m_directory.find_contact(view.emergency.user_id, contact_id);
    if (!contact)
        throw core::AuthorizationError("contact " + contact_id + " is not an emergency contact of this user");

    emergency::AcknowledgeRequest a;
    a.emergency_id = id;
    a.contact_id = contact_id;
    a.contact_name = optional_field<std::string>(body, "contact_name").value_or(contact->name);
    if (body.contains("location") && !body["location"].is_null())
        a.location = core::location_from_json(body["location"]);
    a.message = optional_field<std::string>(body, "message");

    emergency::AckResponse r = m_engine.acknowledge(a);
    json out = core::to_json(r.ack);
    out["duplicate"] = r.outcome == emergency::AckOutcome::DUPLICATE;
    return json_response(r.outcome == emergency::AckOutcome::DUPLICATE ? 200 : 201, out);
}

// The owner always; a contact only while the emergency is ACTIVE.
HttpResponse EmergencyApi::get(const HttpRequest& req, const std::string& id) {
    std::string user = req.header("X-User-Id");
    std::string contact_id = req.header("X-Contact-Id");
    if (user.empty() && contact_id.empty())
        throw core::AuthorizationError("missing X-User-Id or X-Contact-Id header");

    emergency::EmergencyView view = m_engine.get(id);

    bool allowed = !user.empty() && user == view.emergency.user_id;
    if (!allowed && !contact_id.empty()) {
        allowed = view.emergency.status == core::EmergencyStatus::ACTIVE &&
                  m_directory.find_contact(view.emergency.user_id, contact_id).has_value();
    }
    if (!allowed)
        throw core::AuthorizationError("not allowed to view emergency " + id);

    return json_response(200, view_json(view));
}

HttpResponse EmergencyApi::history(const HttpRequest& req) {
    store::HistoryQuery q;
    q.user_id = require_header(req, "X-User-Id");
    q.page = parse_page_number(req.query_param("page"), 1, "page");
    q.page_size = parse_page_number(req.query_param("page_size"), 20, "page_size");

    if (auto s = req.query_param("status")) {
        q.status = core::parse_emergency_status(*s);
        if (!q.status)
            throw core::ValidationError("unknown status " + *s);
    }
    if (auto t = req.query_param("type")) {
        q.type = core::parse_emergency_type(*t);
        if (!q.type)
            throw core::ValidationError("unknown type " + *t);
    }

    store::HistoryPage page = m_engine.history(q);

    json items = json::array();
    for (const auto& e : page.items)
        items.push_back(core::to_json(e));

    return json_response(200, {
        {"items", items},
        {"total", page.total},
        {"page", page.page},
        {"page_size", page.page_size}
    });
}

HttpResponse EmergencyApi::delivered(const std::string& job_id) {
    bool updated = m_dispatcher.mark_delivered(job_id);
    auto job = m_dispatcher.job(job_id);
    json out = job ? notify::to_json(*job) : json::object();
    if (!updated) {
        out["error"] = core::to_string(core::ErrorKind::STATE_CONFLICT);
        out["message"] = "only SENT jobs can be marked delivered";
        return json_response(409, out);
    }
    return json_response(200, out);
}

HttpResponse EmergencyApi::health() {
    return json_response(200, {
        {"status", "ok"},
        {"live_countdowns", m_engine.live_countdowns()},
        {"live_escalations", m_engine.live_escalations()},
        {"queued_notifications", m_dispatcher.queued()},
        {"unpublished_events", m_engine.unpublished_events()}
    });
}

} // namespace api
} // namespace sos
