#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>

#include "platform/platform.hpp"

namespace sos {
namespace api {

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;

    std::string header(const std::string& name) const;
    std::optional<std::string> query_param(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 listener: one accept thread, one request per
// connection, Content-Length bodies only.
class HttpServer {
public:
    explicit HttpServer(HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts accepting. Returns false if the port cannot be bound.
    bool start(int port, int recv_timeout_ms);
    void stop();

    // Parses the request line, headers and body of a complete request.
    static bool parse_request(const std::string& raw, HttpRequest& out);
    static std::string serialize(const HttpResponse& res);

private:
    void run();
    void handle_client(plat::socket_t c);

    HttpHandler m_handler;
    std::atomic<bool> m_running{false};
    plat::socket_t m_server_fd = plat::INVALID_SOCK;
    int m_recv_timeout_ms = 5'000;
    std::thread m_thread;
};

} // namespace api
} // namespace sos
