#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace blockshare {

/**
 * Result codes of receive_tcp_bytes() besides a positive byte count
 */
constexpr int RECEIVE_CLOSED = 0;
constexpr int RECEIVE_ERROR = -1;
constexpr int RECEIVE_TIMEOUT = -2;

// Socket Library Initialization
/**
 * Initialize the socket library (idempotent)
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to a server.
 * IPv6 literals connect over IPv6, anything else is resolved to IPv4.
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @param timeout_ms Connection timeout in milliseconds (0 for blocking)
 * @return Connected blocking socket, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms = 0);

/**
 * Create a TCP server socket bound to an address and port.
 * @param bind_address Address to bind ("" or "0.0.0.0" for any IPv4, "::" for any IPv6)
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Listening socket, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server(const std::string& bind_address, int port, int backlog = 16);

/**
 * Wait up to timeout_ms for a pending connection and accept it.
 * @param server_socket The server socket handle
 * @param timeout_ms Maximum wait in milliseconds (-1 waits forever)
 * @param timed_out Optional output, set to true when the wait expired without a connection
 * @return Client socket handle, or INVALID_SOCKET_VALUE on timeout or error
 */
socket_t accept_client(socket_t server_socket, int timeout_ms = -1, bool* timed_out = nullptr);

/**
 * Get the peer address (IP:port) from a connected socket
 * @param socket The connected socket handle
 * @return Peer address string in format "IP:port", or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * Get the local port a socket is bound to
 * @param socket The socket handle
 * @return The bound port, or 0 on error
 */
int get_bound_port(socket_t socket);

/**
 * Send the whole buffer, looping over partial sends
 * @param socket The socket handle
 * @param data Bytes to send
 * @param size Number of bytes
 * @return true if every byte was sent
 */
bool send_tcp_all(socket_t socket, const uint8_t* data, size_t size);

/**
 * Receive up to size bytes with a single recv call
 * @param socket The socket handle
 * @param buffer Destination buffer
 * @param size Capacity of the buffer
 * @return Bytes received (> 0), RECEIVE_CLOSED, RECEIVE_TIMEOUT or RECEIVE_ERROR
 */
int receive_tcp_bytes(socket_t socket, uint8_t* buffer, size_t size);

/**
 * Set receive and send timeouts on a blocking socket
 * @param socket The socket handle
 * @param receive_timeout_ms Receive timeout (0 disables)
 * @param send_timeout_ms Send timeout (0 disables)
 * @return true if both options were applied
 */
bool set_socket_timeouts(socket_t socket, int receive_timeout_ms, int send_timeout_ms);

// Common Socket Functions
/**
 * Shut down both directions so that a thread blocked on the socket wakes up
 * @param socket The socket handle
 */
void shutdown_socket(socket_t socket);

/**
 * Close a socket
 * @param socket The socket handle to close
 */
void close_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

/**
 * Switch a socket between blocking and non-blocking mode
 * @param socket The socket handle
 * @param nonblocking true for non-blocking
 * @return true if successful, false otherwise
 */
bool set_socket_nonblocking(socket_t socket, bool nonblocking = true);

/**
 * Connect to a socket address with timeout. The socket is left in blocking mode.
 * @param socket The socket handle
 * @param addr The socket address structure
 * @param addr_len Length of the address structure
 * @param timeout_ms Connection timeout in milliseconds
 * @return true if connected successfully, false on timeout or error
 */
bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms);

/**
 * RAII owner of a socket handle, closes it on destruction
 */
class SocketGuard {
public:
    SocketGuard() : socket_(INVALID_SOCKET_VALUE) {}
    explicit SocketGuard(socket_t socket) : socket_(socket) {}
    ~SocketGuard() { reset(); }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : socket_(other.release()) {}
    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    socket_t get() const { return socket_; }
    bool valid() const { return is_valid_socket(socket_); }

    socket_t release() {
        socket_t s = socket_;
        socket_ = INVALID_SOCKET_VALUE;
        return s;
    }

    void reset(socket_t socket = INVALID_SOCKET_VALUE) {
        if (is_valid_socket(socket_)) {
            close_socket(socket_);
        }
        socket_ = socket;
    }

private:
    socket_t socket_;
};

} // namespace blockshare
