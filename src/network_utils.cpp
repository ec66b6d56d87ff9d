#ifdef _WIN32
    // Include winsock2.h first to avoid conflicts with windows.h
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
#endif

#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <cerrno>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_INFO(message)  LOG_INFO("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace blockshare {

std::string PeerAddress::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

namespace network_utils {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool parse_port(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    int value = std::atoi(text.c_str());
    if (value < 1 || value > 65535) {
        return false;
    }
    port = value;
    return true;
}

} // anonymous namespace

std::string resolve_hostname(const std::string& hostname) {
    LOG_NETUTILS_DEBUG("Resolving hostname: " << hostname);

    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    // Check if it's already an IP address
    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << WSAGetLastError());
#else
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
#endif
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)result->ai_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);

    freeaddrinfo(result);

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip_str);
    return std::string(ip_str);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_valid_ipv6(const std::string& ip_str) {
    struct sockaddr_in6 sa;
    return inet_pton(AF_INET6, ip_str.c_str(), &sa.sin6_addr) == 1;
}

bool parse_address(const std::string& text, PeerAddress& out) {
    std::string s = trim(text);
    std::string host;
    std::string port_text;

    if (!s.empty() && s[0] == '[') {
        size_t close = s.find(']');
        if (close == std::string::npos || close + 1 >= s.size() || s[close + 1] != ':') {
            return false;
        }
        host = s.substr(1, close - 1);
        port_text = s.substr(close + 2);
        if (!is_valid_ipv6(host)) {
            return false;
        }
    } else {
        size_t colon = s.rfind(':');
        if (colon == std::string::npos || s.find(':') != colon) {
            return false;
        }
        host = s.substr(0, colon);
        port_text = s.substr(colon + 1);
    }

    int port = 0;
    if (host.empty() || !parse_port(port_text, port)) {
        return false;
    }

    out.host = host;
    out.port = port;
    return true;
}

bool parse_address_list(const std::string& text, std::vector<PeerAddress>& out, std::string& bad_entry) {
    std::vector<PeerAddress> parsed;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string entry = trim(text.substr(start, comma - start));
        if (!entry.empty()) {
            PeerAddress address;
            if (!parse_address(entry, address)) {
                LOG_NETUTILS_WARN("Invalid neighbor address: '" << entry << "'");
                bad_entry = entry;
                return false;
            }
            parsed.push_back(address);
        }
        start = comma + 1;
    }
    out = parsed;
    return true;
}

} // namespace network_utils
} // namespace blockshare
