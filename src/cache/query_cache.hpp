/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Query Cache - Disk-backed cache of model query results
 *
 * Features:
 * - One JSON file per entry, named after its SHA-256 key
 * - TTL expiry checked on read; expired and corrupted entries are
 *   deleted when encountered
 * - Hit/miss/tokens-saved statistics for cost reporting
 * - Atomic writes (temp file + rename)
 *
 * No locking: concurrent writers to one key race, last writer wins.
 */

#ifndef MAILRLM_CACHE_QUERY_CACHE_HPP
#define MAILRLM_CACHE_QUERY_CACHE_HPP

#include "cache/cache_key.hpp"
#include "util/time_format.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mailrlm::cache {

/**
 * Persisted cache entry
 */
struct CacheEntry {
    std::string result;          // Model response text
    util::Timestamp created_at;  // When the entry was written
    std::uint64_t tokens_saved{0};
    std::string model;
    std::string prompt_hash;     // Key prefix, for debugging
};

/**
 * Cache statistics for reporting
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t tokens_saved{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Query cache configuration
 */
struct QueryCacheConfig {
    std::filesystem::path directory;            // Empty = <tmp>/rlm_cache
    std::chrono::seconds ttl{24 * 3600};        // 24 hour TTL default
    bool enabled{true};

    static std::filesystem::path default_directory();
};

/**
 * Disk-backed query cache
 *
 * Constructed once per process and passed by reference to the
 * components that issue model queries.
 */
class QueryCache {
public:
    explicit QueryCache(const QueryCacheConfig& config);
    ~QueryCache() = default;

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;
    QueryCache(QueryCache&&) = delete;
    QueryCache& operator=(QueryCache&&) = delete;

    /**
     * Get a cached result by key
     *
     * @param key Cache key
     * @return Result text if present, parseable and not expired
     */
    std::optional<std::string> get(const CacheKey& key);

    /**
     * Store (overwrite) a result
     *
     * @param key Cache key
     * @param result Model response
     * @param tokens Tokens the call consumed (credited on later hits)
     * @param model Model name
     * @throws std::runtime_error if the entry cannot be written
     */
    void set(const CacheKey& key, const std::string& result, std::uint64_t tokens,
             const std::string& model);

    /**
     * Remove every entry
     * @return Number of entries removed
     */
    std::size_t clear();

    /**
     * Remove expired and unparseable entries
     * @return Number of entries removed
     */
    std::size_t cleanup_expired();

    /**
     * Number of entry files currently on disk
     */
    std::size_t entry_count() const;

    CacheStats stats() const;

    bool is_enabled() const { return config_.enabled; }
    const std::filesystem::path& directory() const { return config_.directory; }
    std::chrono::seconds ttl() const { return config_.ttl; }

    /**
     * Parse an entry file's contents
     * @return nullopt if the content is not a well-formed entry
     */
    static std::optional<CacheEntry> parse_entry(const std::string& content);

    static std::string serialize_entry(const CacheEntry& entry);

private:
    std::filesystem::path entry_path(const CacheKey& key) const;

    void ensure_directory() const;

    bool is_expired(const CacheEntry& entry) const;

    static bool is_entry_file(const std::filesystem::directory_entry& entry);

    QueryCacheConfig config_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> tokens_saved_{0};
};

} // namespace mailrlm::cache

#endif // MAILRLM_CACHE_QUERY_CACHE_HPP
