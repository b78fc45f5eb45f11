/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Cache Key - SHA-256 content address for model query results
 *
 * A key covers everything that determines a model response:
 * - Prompt text
 * - Context text (email summaries, chunk contents)
 * - Model name
 */

#ifndef MAILRLM_CACHE_CACHE_KEY_HPP
#define MAILRLM_CACHE_CACHE_KEY_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace mailrlm::cache {

/**
 * Cache key - lowercase hex SHA-256 digest (64 characters)
 */
struct CacheKey {
    std::string hex;

    bool operator==(const CacheKey& other) const = default;

    /**
     * Short prefix stored alongside entries for debugging
     */
    std::string fragment(std::size_t length = 16) const {
        return hex.substr(0, length);
    }

};

/**
 * Generate the cache key for a (prompt, context, model) triple
 *
 * The digest is taken over "prompt|context|model".
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
CacheKey key_for(std::string_view prompt, std::string_view context, std::string_view model);

/**
 * Check whether text has the shape of a cache key (64 lowercase hex digits)
 */
bool is_valid_key(std::string_view text);

} // namespace mailrlm::cache

#endif // MAILRLM_CACHE_CACHE_KEY_HPP
