/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * ISO-8601 timestamp formatting and parsing
 */

#ifndef MAILRLM_UTIL_TIME_FORMAT_HPP
#define MAILRLM_UTIL_TIME_FORMAT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mailrlm::util {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Format as UTC "YYYY-MM-DDTHH:MM:SS.ffffffZ"
 */
std::string format_iso8601(Timestamp tp);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.f{1,9}][Z|+HH:MM|-HH:MM]".
 * A timestamp without zone designator is read as local time, as other
 * tools sharing the cache directory write local wall-clock time.
 *
 * @return nullopt if the text is not a valid timestamp
 */
std::optional<Timestamp> parse_iso8601(std::string_view text);

} // namespace mailrlm::util

#endif // MAILRLM_UTIL_TIME_FORMAT_HPP
