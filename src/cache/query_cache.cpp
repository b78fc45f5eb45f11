/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Query Cache Implementation
 */

#include "cache/query_cache.hpp"
#include "util/atomic_file.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace mailrlm::cache {

namespace log_component = util::log_component;

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        MAILRLM_LOG_WARN(log_component::Cache, "Failed to remove {}: {}", path.string(), ec.message());
    }
}

} // namespace

std::filesystem::path QueryCacheConfig::default_directory() {
    return std::filesystem::temp_directory_path() / "rlm_cache";
}

QueryCache::QueryCache(const QueryCacheConfig& config)
    : config_(config) {
    if (config_.directory.empty()) {
        config_.directory = QueryCacheConfig::default_directory();
    }
    if (config_.enabled) {
        ensure_directory();
    }
    MAILRLM_LOG_DEBUG(log_component::Cache, "Query cache initialized: dir={}, ttl={}s, enabled={}",
                      config_.directory.string(), config_.ttl.count(), config_.enabled);
}

std::optional<std::string> QueryCache::get(const CacheKey& key) {
    if (!config_.enabled) {
        return std::nullopt;
    }

    auto path = entry_path(key);
    if (!std::filesystem::exists(path)) {
        ++misses_;
        return std::nullopt;
    }

    auto content = read_file(path);
    auto entry = content ? parse_entry(*content) : std::nullopt;
    if (!entry) {
        MAILRLM_LOG_WARN(log_component::Cache, "Corrupted cache entry removed: key={}", key.fragment());
        remove_quietly(path);
        ++misses_;
        return std::nullopt;
    }

    if (is_expired(*entry)) {
        MAILRLM_LOG_DEBUG(log_component::Cache, "Expired cache entry removed: key={}", key.fragment());
        remove_quietly(path);
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    tokens_saved_ += entry->tokens_saved;
    MAILRLM_LOG_DEBUG(log_component::Cache, "Cache HIT: key={}, tokens_saved={}",
                      key.fragment(), entry->tokens_saved);
    return std::move(entry->result);
}

void QueryCache::set(const CacheKey& key, const std::string& result, std::uint64_t tokens,
                     const std::string& model) {
    if (!config_.enabled) {
        return;
    }

    ensure_directory();

    CacheEntry entry;
    entry.result = result;
    entry.created_at = std::chrono::system_clock::now();
    entry.tokens_saved = tokens;
    entry.model = model;
    entry.prompt_hash = key.fragment();

    util::write_file_atomic(entry_path(key), serialize_entry(entry));

    MAILRLM_LOG_DEBUG(log_component::Cache, "Cache entry stored: key={}, size={}",
                      key.fragment(), result.size());
}

std::size_t QueryCache::clear() {
    if (!std::filesystem::exists(config_.directory)) {
        return 0;
    }

    std::size_t count = 0;
    for (const auto& dir_entry : std::filesystem::directory_iterator(config_.directory)) {
        if (!is_entry_file(dir_entry)) continue;
        std::filesystem::remove(dir_entry.path());
        ++count;
    }

    MAILRLM_LOG_INFO(log_component::Cache, "Cache cleared: {} entries removed", count);
    return count;
}

std::size_t QueryCache::cleanup_expired() {
    if (!std::filesystem::exists(config_.directory)) {
        return 0;
    }

    std::size_t count = 0;
    for (const auto& dir_entry : std::filesystem::directory_iterator(config_.directory)) {
        if (!is_entry_file(dir_entry)) continue;

        auto content = read_file(dir_entry.path());
        auto entry = content ? parse_entry(*content) : std::nullopt;
        if (!entry || is_expired(*entry)) {
            std::filesystem::remove(dir_entry.path());
            ++count;
        }
    }

    MAILRLM_LOG_INFO(log_component::Cache, "Cache cleanup: {} expired entries removed", count);
    return count;
}

std::size_t QueryCache::entry_count() const {
    if (!std::filesystem::exists(config_.directory)) {
        return 0;
    }

    std::size_t count = 0;
    for (const auto& dir_entry : std::filesystem::directory_iterator(config_.directory)) {
        if (is_entry_file(dir_entry)) ++count;
    }
    return count;
}

CacheStats QueryCache::stats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.tokens_saved = tokens_saved_.load();
    return stats;
}

std::optional<CacheEntry> QueryCache::parse_entry(const std::string& content) {
    nlohmann::json j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    const auto result = j.find("result");
    const auto created_at = j.find("created_at");
    const auto tokens = j.find("tokens_saved");
    const auto model = j.find("model");
    const auto prompt_hash = j.find("prompt_hash");

    if (result == j.end() || !result->is_string() ||
        created_at == j.end() || !created_at->is_string() ||
        tokens == j.end() || !tokens->is_number_integer() ||
        model == j.end() || !model->is_string() ||
        prompt_hash == j.end() || !prompt_hash->is_string()) {
        return std::nullopt;
    }

    auto timestamp = util::parse_iso8601(created_at->get<std::string>());
    if (!timestamp) {
        return std::nullopt;
    }

    auto token_count = tokens->get<std::int64_t>();
    if (token_count < 0) {
        return std::nullopt;
    }

    CacheEntry entry;
    entry.result = result->get<std::string>();
    entry.created_at = *timestamp;
    entry.tokens_saved = static_cast<std::uint64_t>(token_count);
    entry.model = model->get<std::string>();
    entry.prompt_hash = prompt_hash->get<std::string>();
    return entry;
}

std::string QueryCache::serialize_entry(const CacheEntry& entry) {
    nlohmann::json j = {
        {"result", entry.result},
        {"created_at", util::format_iso8601(entry.created_at)},
        {"tokens_saved", entry.tokens_saved},
        {"model", entry.model},
        {"prompt_hash", entry.prompt_hash}
    };
    return j.dump(2);
}

std::filesystem::path QueryCache::entry_path(const CacheKey& key) const {
    return config_.directory / (key.hex + ".json");
}

void QueryCache::ensure_directory() const {
    std::filesystem::create_directories(config_.directory);
}

bool QueryCache::is_expired(const CacheEntry& entry) const {
    auto age = std::chrono::system_clock::now() - entry.created_at;
    return age > config_.ttl;
}

bool QueryCache::is_entry_file(const std::filesystem::directory_entry& entry) {
    return entry.is_regular_file() && entry.path().extension() == ".json" &&
           is_valid_key(entry.path().stem().string());
}

} // namespace mailrlm::cache
