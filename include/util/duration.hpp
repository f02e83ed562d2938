/**
 * @file duration.hpp
 * @brief Parsing of human readable timeouts.
 *
 * Turns strings such as "30s", "1500ms" or "1m30s" into milliseconds for the
 * HTTP timeout settings.
 */
#ifndef GERRITNAV_UTIL_DURATION_HPP
#define GERRITNAV_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace gnav {

/**
 * Parse a duration made of number/unit pairs into milliseconds.
 *
 * Supported units are `ms`, `s`, `m` and `h`; they may be combined
 * ("1m30s"). A bare number is read as seconds.
 *
 * @param str Duration text; an empty string yields zero.
 * @return Parsed duration.
 * @throws std::invalid_argument on malformed input or unknown units.
 */
std::chrono::milliseconds parse_timeout(const std::string &str);

} // namespace gnav

#endif // GERRITNAV_UTIL_DURATION_HPP
