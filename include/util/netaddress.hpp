#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split "host:port" probe targets into their components
 - Keep hostnames out of the probe path (only literal IPs are accepted)

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - SplitHostPort: Syntactic split of "host:port" / "[v6]:port"
*/

#include <optional>
#include <string>

namespace liveprobe {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and additionally:
 * 1. Rejects empty strings, hostnames and zoned IPv6 (fe80::1%eth0)
 * 2. Normalizes IPv4-mapped IPv6 addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation
 *
 * @param address IP address string to validate and normalize
 * @return Normalized IP address string, or std::nullopt if invalid
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "localhost" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Check if a string is a valid IP address
 */
bool IsValidIPAddress(const std::string& address);

/**
 * Split "host:port" into host and port text
 *
 * Purely syntactic: the host is not checked to be an IP and the port is
 * not checked to be numeric (an empty port is returned as ""). Accepted
 * forms:
 * - "host:port"
 * - "[host]:port" (required when host contains ':', e.g. IPv6)
 *
 * @param hostport Input string
 * @param out_host Host part, brackets removed
 * @param out_port Port part
 * @param out_error Optional reason on failure ("missing port in address",
 *                  "too many colons in address", "missing ']' in address",
 *                  "unexpected '[' in address", "unexpected ']' in address")
 * @return true if the split succeeded
 */
bool SplitHostPort(const std::string& hostport, std::string& out_host,
                   std::string& out_port, std::string* out_error = nullptr);

} // namespace util
} // namespace liveprobe
