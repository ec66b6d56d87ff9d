#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <mutex>
#ifndef _WIN32
    #include <fcntl.h>    // for O_NONBLOCK
    #include <errno.h>    // for errno
    #include <poll.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#ifdef _WIN32
    #define SOCKET_POLL WSAPoll
    #define SEND_FLAGS 0
#else
    #define SOCKET_POLL poll
    #define SEND_FLAGS MSG_NOSIGNAL
#endif

namespace blockshare {

static bool socket_library_initialized = false;
static std::mutex socket_init_mutex;

namespace {

std::string last_socket_error() {
#ifdef _WIN32
    return std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

bool last_error_is_timeout() {
#ifdef _WIN32
    int error = WSAGetLastError();
    return error == WSAETIMEDOUT || error == WSAEWOULDBLOCK;
#else
    return errno == EAGAIN || errno == EWOULDBLOCK;
#endif
}

} // anonymous namespace

// Socket Library Initialization
bool init_socket_library() {
    std::lock_guard<std::mutex> lock(socket_init_mutex);

    if (socket_library_initialized) {
        return true;
    }

#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
    LOG_SOCKET_INFO("Windows Socket API initialized");
#endif

    socket_library_initialized = true;
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
    std::lock_guard<std::mutex> lock(socket_init_mutex);

    if (!socket_library_initialized) {
        return;
    }

#ifdef _WIN32
    WSACleanup();
    LOG_SOCKET_INFO("Windows Socket API cleaned up");
#endif

    socket_library_initialized = false;
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    if (!set_socket_nonblocking(socket, true)) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode for timeout connection");
        return false;
    }

    int result = connect(socket, addr, addr_len);
    if (result != 0) {
#ifdef _WIN32
        int error = WSAGetLastError();
        if (error != WSAEWOULDBLOCK) {
            LOG_SOCKET_DEBUG("Connect failed immediately with error: " << error);
            return false;
        }
#else
        int error = errno;
        if (error != EINPROGRESS) {
            LOG_SOCKET_DEBUG("Connect failed immediately with error: " << std::strerror(error));
            return false;
        }
#endif

        pollfd pfd;
        pfd.fd = socket;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        LOG_SOCKET_DEBUG("Waiting for connection with timeout " << timeout_ms << "ms");
        int poll_result = SOCKET_POLL(&pfd, 1, timeout_ms);
        if (poll_result == 0) {
            LOG_SOCKET_DEBUG("Connection timeout after " << timeout_ms << "ms");
            return false;
        }
        if (poll_result < 0) {
            LOG_SOCKET_ERROR("Poll error during connect: " << last_socket_error());
            return false;
        }

        // Writable does not mean connected, check SO_ERROR
        int sock_error = 0;
        socklen_t len = sizeof(sock_error);
        if (getsockopt(socket, SOL_SOCKET, SO_ERROR, (char*)&sock_error, &len) < 0) {
            LOG_SOCKET_ERROR("Failed to get socket error status");
            return false;
        }
        if (sock_error != 0) {
#ifdef _WIN32
            LOG_SOCKET_DEBUG("Connection failed with error: " << sock_error);
#else
            LOG_SOCKET_DEBUG("Connection failed: " << std::strerror(sock_error));
#endif
            return false;
        }
    }

    if (!set_socket_nonblocking(socket, false)) {
        LOG_SOCKET_ERROR("Failed to restore blocking mode after connect");
        return false;
    }
    return true;
}

// TCP Socket Functions
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_storage server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    socklen_t addr_len = 0;
    int family = AF_INET;

    if (network_utils::is_valid_ipv6(host)) {
        family = AF_INET6;
        sockaddr_in6* addr6 = reinterpret_cast<sockaddr_in6*>(&server_addr);
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET6, host.c_str(), &addr6->sin6_addr);
        addr_len = sizeof(sockaddr_in6);
    } else {
        std::string resolved_ip = network_utils::resolve_hostname(host);
        if (resolved_ip.empty()) {
            LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
            return INVALID_SOCKET_VALUE;
        }
        sockaddr_in* addr4 = reinterpret_cast<sockaddr_in*>(&server_addr);
        addr4->sin_family = AF_INET;
        addr4->sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, resolved_ip.c_str(), &addr4->sin_addr) <= 0) {
            LOG_SOCKET_ERROR("Invalid address: " << resolved_ip);
            return INVALID_SOCKET_VALUE;
        }
        addr_len = sizeof(sockaddr_in);
    }

    socket_t client_socket = socket(family, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }

    bool connected;
    if (timeout_ms > 0) {
        connected = connect_with_timeout(client_socket, reinterpret_cast<sockaddr*>(&server_addr), addr_len, timeout_ms);
    } else {
        connected = connect(client_socket, reinterpret_cast<sockaddr*>(&server_addr), addr_len) != SOCKET_ERROR_VALUE;
    }

    if (!connected) {
        LOG_SOCKET_DEBUG("Connection to " << host << ":" << port << " failed");
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Connected to " << host << ":" << port << " (socket " << client_socket << ")");
    return client_socket;
}

socket_t create_tcp_server(const std::string& bind_address, int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on " << bind_address << ":" << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    bool ipv6 = network_utils::is_valid_ipv6(bind_address);
    socket_t server_socket = socket(ipv6 ? AF_INET6 : AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR,
                   (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    int bind_result;
    if (ipv6) {
        sockaddr_in6 server_addr;
        memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin6_family = AF_INET6;
        server_addr.sin6_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET6, bind_address.c_str(), &server_addr.sin6_addr);
        bind_result = bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr));
    } else {
        sockaddr_in server_addr;
        memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin_family = AF_INET;
        server_addr.sin_port = htons(static_cast<uint16_t>(port));
        if (bind_address.empty() || bind_address == "0.0.0.0") {
            server_addr.sin_addr.s_addr = INADDR_ANY;
        } else {
            std::string resolved_ip = network_utils::resolve_hostname(bind_address);
            if (resolved_ip.empty() || inet_pton(AF_INET, resolved_ip.c_str(), &server_addr.sin_addr) <= 0) {
                LOG_SOCKET_ERROR("Invalid bind address: " << bind_address);
                close_socket(server_socket);
                return INVALID_SOCKET_VALUE;
            }
        }
        bind_result = bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr));
    }

    if (bind_result == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to " << bind_address << ":" << port << ": " << last_socket_error());
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket: " << last_socket_error());
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on " << bind_address << ":" << get_bound_port(server_socket)
                    << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket, int timeout_ms, bool* timed_out) {
    if (timed_out) {
        *timed_out = false;
    }

    pollfd pfd;
    pfd.fd = server_socket;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int poll_result = SOCKET_POLL(&pfd, 1, timeout_ms);
    if (poll_result == 0) {
        if (timed_out) {
            *timed_out = true;
        }
        return INVALID_SOCKET_VALUE;
    }
    if (poll_result < 0) {
#ifndef _WIN32
        if (errno == EINTR) {
            if (timed_out) {
                *timed_out = true;
            }
            return INVALID_SOCKET_VALUE;
        }
#endif
        LOG_SOCKET_ERROR("Poll error on server socket: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }
    // A listener shut down by its owner reports POLLHUP
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        LOG_SOCKET_DEBUG("Server socket " << server_socket << " is no longer listening");
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to accept client connection: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Client connected from " << get_peer_address(client_socket));
    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, (struct sockaddr*)&peer_addr, &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_DEBUG("Failed to get peer address for socket " << socket);
        return "";
    }

    if (peer_addr.ss_family == AF_INET) {
        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)&peer_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        return std::string(ip_str) + ":" + std::to_string(ntohs(addr_in->sin_port));
    }
    if (peer_addr.ss_family == AF_INET6) {
        char ip_str[INET6_ADDRSTRLEN];
        struct sockaddr_in6* addr_in6 = (struct sockaddr_in6*)&peer_addr;
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, INET6_ADDRSTRLEN);
        return "[" + std::string(ip_str) + "]:" + std::to_string(ntohs(addr_in6->sin6_port));
    }

    LOG_SOCKET_ERROR("Unknown address family for socket " << socket);
    return "";
}

int get_bound_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, (struct sockaddr*)&addr, &addr_len) == SOCKET_ERROR_VALUE) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(((sockaddr_in*)&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(((sockaddr_in6*)&addr)->sin6_port);
    }
    return 0;
}

bool send_tcp_all(socket_t socket, const uint8_t* data, size_t size) {
    size_t total_sent = 0;
    while (total_sent < size) {
        int sent = send(socket, reinterpret_cast<const char*>(data + total_sent),
                        static_cast<int>(size - total_sent), SEND_FLAGS);
        if (sent == SOCKET_ERROR_VALUE) {
#ifndef _WIN32
            if (errno == EINTR) {
                continue;
            }
#endif
            LOG_SOCKET_DEBUG("Failed to send on socket " << socket << ": " << last_socket_error());
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

int receive_tcp_bytes(socket_t socket, uint8_t* buffer, size_t size) {
    while (true) {
        int received = recv(socket, reinterpret_cast<char*>(buffer), static_cast<int>(size), 0);
        if (received > 0) {
            return received;
        }
        if (received == 0) {
            return RECEIVE_CLOSED;
        }
#ifndef _WIN32
        if (errno == EINTR) {
            continue;
        }
#endif
        if (last_error_is_timeout()) {
            return RECEIVE_TIMEOUT;
        }
        LOG_SOCKET_DEBUG("Receive failed on socket " << socket << ": " << last_socket_error());
        return RECEIVE_ERROR;
    }
}

bool set_socket_timeouts(socket_t socket, int receive_timeout_ms, int send_timeout_ms) {
#ifdef _WIN32
    DWORD recv_tv = static_cast<DWORD>(receive_timeout_ms);
    DWORD send_tv = static_cast<DWORD>(send_timeout_ms);
#else
    timeval recv_tv;
    recv_tv.tv_sec = receive_timeout_ms / 1000;
    recv_tv.tv_usec = (receive_timeout_ms % 1000) * 1000;
    timeval send_tv;
    send_tv.tv_sec = send_timeout_ms / 1000;
    send_tv.tv_usec = (send_timeout_ms % 1000) * 1000;
#endif
    if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, (char*)&recv_tv, sizeof(recv_tv)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set receive timeout on socket " << socket);
        return false;
    }
    if (setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, (char*)&send_tv, sizeof(send_tv)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set send timeout on socket " << socket);
        return false;
    }
    return true;
}

// Common Socket Functions
void shutdown_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
#ifdef _WIN32
        shutdown(socket, SD_BOTH);
#else
        shutdown(socket, SHUT_RDWR);
#endif
    }
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket, bool nonblocking) {
#ifdef _WIN32
    unsigned long mode = nonblocking ? 1 : 0;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    int new_flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(socket, F_SETFL, new_flags) == -1) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#endif
    return true;
}

} // namespace blockshare
