#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address.hpp>

namespace liveprobe {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  // Zone / scope ids (fe80::1%eth0) are not plain literals; embedded NULs
  // would be cut off by the C-string parser
  if (address.empty() || address.find('%') != std::string::npos ||
      address.find('\0') != std::string::npos) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);

    // Reject invalid formats (and hostnames)
    if (ec) {
      return std::nullopt;
    }

    // Example: ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

static bool SplitFail(std::string* out_error, const char* reason) {
  if (out_error) {
    *out_error = reason;
  }
  return false;
}

bool SplitHostPort(const std::string& hostport, std::string& out_host,
                   std::string& out_port, std::string* out_error) {
  // The port starts after the last colon
  size_t last_colon = hostport.rfind(':');
  if (last_colon == std::string::npos) {
    return SplitFail(out_error, "missing port in address");
  }

  std::string host;
  size_t host_begin = 0;
  size_t host_end = 0;

  if (!hostport.empty() && hostport[0] == '[') {
    // Expect the first ']' just before the last ':'
    size_t bracket_end = hostport.find(']');
    if (bracket_end == std::string::npos) {
      return SplitFail(out_error, "missing ']' in address");
    }
    if (bracket_end + 1 == hostport.size()) {
      // There can't be a ':' behind the ']' now
      return SplitFail(out_error, "missing port in address");
    }
    if (bracket_end + 1 != last_colon) {
      // Either ']' isn't followed by a colon, or it is followed by a colon
      // that is not the last one
      if (hostport[bracket_end + 1] == ':') {
        return SplitFail(out_error, "too many colons in address");
      }
      return SplitFail(out_error, "missing port in address");
    }
    host = hostport.substr(1, bracket_end - 1);
    host_begin = 1;
    host_end = bracket_end + 1;
  } else {
    host = hostport.substr(0, last_colon);
    if (host.find(':') != std::string::npos) {
      return SplitFail(out_error, "too many colons in address");
    }
  }

  if (hostport.find('[', host_begin) != std::string::npos) {
    return SplitFail(out_error, "unexpected '[' in address");
  }
  if (hostport.find(']', host_end) != std::string::npos) {
    return SplitFail(out_error, "unexpected ']' in address");
  }

  out_host = host;
  out_port = hostport.substr(last_colon + 1);
  return true;
}

} // namespace util
} // namespace liveprobe
