#include "util/string_parsing.hpp"
#include <cctype>
#include <limits>

namespace liveprobe {
namespace util {

static bool AllDigits(const std::string& str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    // std::invalid_argument / std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  if (!AllDigits(str)) {
    return std::nullopt;
  }

  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
  uint64_t value = 0;
  for (char c : str) {
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (max - digit) / 10) {
      return std::nullopt; // overflow
    }
    value = value * 10 + digit;
  }
  return value;
}

std::optional<uint16_t> SafeParsePortNumber(const std::string& str) {
  auto value = SafeParseUInt64(str);
  if (!value || *value > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

} // namespace util
} // namespace liveprobe
