#include "HttpServer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace sos {
namespace api {

static constexpr size_t MAX_REQUEST_BYTES = 64 * 1024;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
        default:  return status < 500 ? "Error" : "Internal Server Error";
    }
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::optional<std::string> HttpRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end())
        return std::nullopt;
    return it->second;
}

HttpServer::HttpServer(HttpHandler handler) : m_handler(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(int port, int recv_timeout_ms) {
    if (m_running.load(std::memory_order_acquire))
        return true;

    if (!plat::init()) {
        std::cerr << "[HttpServer] Socket layer init failed" << std::endl;
        return false;
    }

    m_server_fd = plat::create_tcp();
    if (m_server_fd == plat::INVALID_SOCK) {
        std::cerr << "[HttpServer] Failed to create socket" << std::endl;
        return false;
    }

    plat::set_reuseaddr(m_server_fd);

    if (!plat::bind_any(m_server_fd, port)) {
        std::cerr << "[HttpServer] Failed to bind port " << port
                  << " (errno " << plat::last_error() << ")" << std::endl;
        plat::socket_close(m_server_fd);
        m_server_fd = plat::INVALID_SOCK;
        return false;
    }

    if (!plat::listen_on(m_server_fd, 64)) {
        std::cerr << "[HttpServer] Failed to listen" << std::endl;
        plat::socket_close(m_server_fd);
        m_server_fd = plat::INVALID_SOCK;
        return false;
    }

    m_recv_timeout_ms = recv_timeout_ms;
    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&HttpServer::run, this);

    std::cout << "[HttpServer] Listening on port " << port << std::endl;
    return true;
}

void HttpServer::stop() {
    if (!m_running.exchange(false))
        return;

    if (m_server_fd != plat::INVALID_SOCK) {
        plat::socket_shutdown(m_server_fd);
        plat::socket_close(m_server_fd);
        m_server_fd = plat::INVALID_SOCK;
    }
    if (m_thread.joinable())
        m_thread.join();
    plat::cleanup();
}

void HttpServer::run() {
    while (m_running.load(std::memory_order_acquire)) {
        plat::socket_t c = plat::accept_client(m_server_fd);
        if (c == plat::INVALID_SOCK) {
            if (m_running.load(std::memory_order_acquire))
                std::cerr << "[HttpServer] Accept failed" << std::endl;
            break;
        }

        plat::set_recv_timeout(c, m_recv_timeout_ms);
        handle_client(c);
        plat::socket_close(c);
    }
}

void HttpServer::handle_client(plat::socket_t c) {
    std::string raw;
    char buf[4096];
    size_t header_end = std::string::npos;
    size_t content_length = 0;

    while (true) {
        int n = plat::socket_recv(c, buf, sizeof(buf));
        if (n <= 0)
            break;
        raw.append(buf, static_cast<size_t>(n));

        if (header_end == std::string::npos) {
            header_end = raw.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                std::string head = lower(raw.substr(0, header_end));
                size_t cl = head.find("content-length:");
                if (cl != std::string::npos) {
                    size_t eol = head.find("\r\n", cl);
                    std::string v = trim(head.substr(cl + 15, eol - cl - 15));
                    content_length = std::strtoul(v.c_str(), nullptr, 10);
                }
            }
        }

        if (raw.size() > MAX_REQUEST_BYTES || content_length > MAX_REQUEST_BYTES)
            break;
        if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length)
            break;
    }

    HttpResponse res;
    HttpRequest req;
    if (raw.size() > MAX_REQUEST_BYTES || content_length > MAX_REQUEST_BYTES) {
        res.status = 413;
        res.body = "{\"error\":\"PayloadTooLarge\"}";
    } else if (!parse_request(raw, req)) {
        if (raw.empty())
            return;
        res.status = 400;
        res.body = "{\"error\":\"BadRequest\",\"message\":\"malformed HTTP request\"}";
    } else {
        try {
            res = m_handler(req);
        } catch (const std::exception& e) {
            std::cerr << "[HttpServer] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
            res.status = 500;
            res.body = "{\"error\":\"InternalError\"}";
        }
    }

    std::string out = serialize(res);
    size_t sent = 0;
    while (sent < out.size()) {
        int n = plat::socket_send(c, out.data() + sent, static_cast<int>(out.size() - sent));
        if (n <= 0) {
            std::cerr << "[HttpServer] Send failed (errno " << plat::last_error() << ")" << std::endl;
            break;
        }
        sent += static_cast<size_t>(n);
    }
}

bool HttpServer::parse_request(const std::string& raw, HttpRequest& out) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos)
        return false;

    std::istringstream head(raw.substr(0, header_end));
    std::string line;
    if (!std::getline(head, line))
        return false;

    std::istringstream request_line(trim(line));
    std::string target, version;
    if (!(request_line >> out.method >> target >> version))
        return false;
    if (version.rfind("HTTP/", 0) != 0)
        return false;

    size_t q = target.find('?');
    out.path = url_decode(target.substr(0, q));
    if (q != std::string::npos) {
        std::stringstream qs(target.substr(q + 1));
        std::string pair;
        while (std::getline(qs, pair, '&')) {
            if (pair.empty()) continue;
            size_t eq = pair.find('=');
            std::string k = url_decode(pair.substr(0, eq));
            std::string v = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            out.query[k] = v;
        }
    }

    while (std::getline(head, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        out.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    out.body = raw.substr(header_end + 4);
    auto cl = out.headers.find("content-length");
    if (cl != out.headers.end()) {
        size_t len = std::strtoul(cl->second.c_str(), nullptr, 10);
        if (out.body.size() < len)
            return false;
        out.body.resize(len);
    }
    return true;
}

std::string HttpServer::serialize(const HttpResponse& res) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << res.status << " " << reason_phrase(res.status) << "\r\n"
       << "Content-Type: " << res.content_type << "\r\n"
       << "Content-Length: " << res.body.size() << "\r\n"
       << "Connection: close\r\n"
       << "\r\n"
       << res.body;
    return ss.str();
}

} // namespace api
} // namespace sos
