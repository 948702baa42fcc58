#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation for command-line flags and probe addresses

 Key functions:
 - SafeParseInt / SafeParseInt64: signed parse with bounds checking
 - SafeParseUInt64: request ids
 - SafeParsePortNumber: decimal port in [0, 65535]

 All functions validate that the entire input is consumed (no trailing
 garbage) and return std::nullopt on any error instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace liveprobe {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse an unsigned 64-bit integer made only of decimal digits
 *
 * Signs, whitespace and hex prefixes are rejected.
 *
 * Examples:
 *   SafeParseUInt64("18446744073709551615") -> UINT64_MAX
 *   SafeParseUInt64("18446744073709551616") -> std::nullopt (overflow)
 *   SafeParseUInt64("+1") -> std::nullopt
 */
std::optional<uint64_t> SafeParseUInt64(const std::string& str);

/**
 * Parse a port number made only of decimal digits, value in [0, 65535]
 *
 * Unlike a listen port, 0 is accepted: probe addresses follow the plain
 * "16-bit decimal" rule. Leading zeros are allowed ("0080" -> 80).
 *
 * Examples:
 *   SafeParsePortNumber("8545") -> 8545
 *   SafeParsePortNumber("0") -> 0
 *   SafeParsePortNumber("99999") -> std::nullopt
 *   SafeParsePortNumber("-1") -> std::nullopt
 */
std::optional<uint16_t> SafeParsePortNumber(const std::string& str);

} // namespace util
} // namespace liveprobe
