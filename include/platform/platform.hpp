#pragma once

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <winsock2.h>
#include <ws2tcpip.h>
#include <windows.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#endif

#include <cstdint>
#include <string>

namespace plat {

#ifdef _WIN32
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCK = INVALID_SOCKET;
#else
    using socket_t = int;
    constexpr socket_t INVALID_SOCK = -1;
#endif

    bool init();
    void cleanup();
    int last_error();

    socket_t create_tcp();
    bool set_reuseaddr(socket_t s);
    bool set_recv_timeout(socket_t s, int timeout_ms);
    bool bind_any(socket_t s, int port);
    bool listen_on(socket_t s, int backlog);
    socket_t accept_client(socket_t s);

    int socket_send(socket_t s, const void* buf, int len);
    int socket_recv(socket_t s, void* buf, int len);
    bool socket_shutdown(socket_t s);
    void socket_close(socket_t s);

    // Exclusive advisory lock on a file, held until release_file_lock.
    // Returns -1 if another process holds it.
    int acquire_file_lock(const std::string& path);
    void release_file_lock(int fd);
}
