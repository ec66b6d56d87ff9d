#pragma once

#include <string>
#include <vector>

namespace blockshare {

/**
 * A neighbor endpoint as given on the command line ("host:port")
 */
struct PeerAddress {
    std::string host;
    int port;

    PeerAddress() : port(0) {}
    PeerAddress(const std::string& h, int p) : host(h), port(p) {}

    std::string to_string() const;

    bool operator==(const PeerAddress& other) const {
        return host == other.host && port == other.port;
    }
};

namespace network_utils {

/**
 * Resolve hostname to IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 *
 * Example usage:
 *   std::string ip = network_utils::resolve_hostname("localhost");       // "127.0.0.1"
 *   std::string ip2 = network_utils::resolve_hostname("192.168.1.1");    // returns same IP
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Check if a string is a valid IPv6 address
 * @param ip_str The string to validate
 * @return true if valid IPv6 address, false otherwise
 */
bool is_valid_ipv6(const std::string& ip_str);

/**
 * Parse "host:port" or "[ipv6]:port".
 * @param text Address text
 * @param out Parsed address, untouched on failure
 * @return true if the host is non-empty and the port is in 1..65535
 *
 * Example usage:
 *   PeerAddress a;
 *   network_utils::parse_address("127.0.0.1:5001", a);   // true
 *   network_utils::parse_address("[::1]:5001", a);       // true, host "::1"
 *   network_utils::parse_address("localhost", a);        // false, no port
 */
bool parse_address(const std::string& text, PeerAddress& out);

/**
 * Parse a comma-separated neighbor list. Blank entries are skipped.
 * @param text e.g. "127.0.0.1:5001,127.0.0.1:5002"
 * @param out Parsed neighbors in the given order
 * @param bad_entry Set to the first entry that failed to parse
 * @return true if every non-blank entry parsed
 */
bool parse_address_list(const std::string& text, std::vector<PeerAddress>& out, std::string& bad_entry);

} // namespace network_utils
} // namespace blockshare
