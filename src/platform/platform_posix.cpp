#ifndef _WIN32

#include "platform/platform.hpp"

#include <sys/file.h>
#include <sys/time.h>
#include <cerrno>

namespace plat {

bool init() {
    return true;
}

void cleanup() {
}

int last_error() {
    return errno;
}

socket_t create_tcp() {
    return socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
}

bool set_reuseaddr(socket_t s) {
    int flag = 1;
    return setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)) == 0;
}

bool set_recv_timeout(socket_t s, int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool bind_any(socket_t s, int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    return bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
}

bool listen_on(socket_t s, int backlog) {
    return listen(s, backlog) == 0;
}

socket_t accept_client(socket_t s) {
    return accept(s, nullptr, nullptr);
}

int socket_send(socket_t s, const void* buf, int len) {
    return static_cast<int>(send(s, buf, static_cast<size_t>(len), MSG_NOSIGNAL));
}

int socket_recv(socket_t s, void* buf, int len) {
    return static_cast<int>(recv(s, buf, static_cast<size_t>(len), 0));
}

bool socket_shutdown(socket_t s) {
    return shutdown(s, SHUT_RDWR) == 0;
}

void socket_close(socket_t s) {
    close(s);
}

int acquire_file_lock(const std::string& path) {
    int fd = open(path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd == -1)
        return -1;
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

void release_file_lock(int fd) {
    if (fd == -1)
        return;
    flock(fd, LOCK_UN);
    close(fd);
}

}

#endif
