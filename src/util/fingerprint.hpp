/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Fingerprint - XXHash-based dataset and prompt identity
 *
 * Fingerprints are compared for equality only. A dataset fingerprint
 * covers the sorted set of item identifiers, so reordering the items
 * of a dataset does not change it.
 */

#ifndef MAILRLM_UTIL_FINGERPRINT_HPP
#define MAILRLM_UTIL_FINGERPRINT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailrlm::util {

/**
 * Hash of raw text, as 16 lowercase hex digits
 */
std::string fingerprint(std::string_view text);

/**
 * Hash of the sorted, '|'-joined identifiers.
 * Items without an identifier contribute their position in the input.
 */
std::string fingerprint_identifiers(const std::vector<std::optional<std::string>>& ids);

/**
 * Dataset fingerprint for any item type exposing `std::optional<std::string> id`
 */
template<typename Item>
std::string fingerprint(const std::vector<Item>& items) {
    std::vector<std::optional<std::string>> ids;
    ids.reserve(items.size());
    for (const auto& item : items) {
        ids.push_back(item.id);
    }
    return fingerprint_identifiers(ids);
}

} // namespace mailrlm::util

#endif // MAILRLM_UTIL_FINGERPRINT_HPP
