/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Query cache tests
 */

#include "cache/query_cache.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

using mailrlm::cache::CacheEntry;
using mailrlm::cache::QueryCache;
using mailrlm::cache::QueryCacheConfig;
using mailrlm::cache::key_for;
using mailrlm::testing::TempDir;
using mailrlm::testing::read_text;
using mailrlm::testing::write_text;

class QueryCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        mailrlm::testing::quiet_logging();
    }

    QueryCacheConfig make_config(std::chrono::seconds ttl = std::chrono::hours(24)) const {
        QueryCacheConfig config;
        config.directory = dir_.path() / "cache";
        config.ttl = ttl;
        return config;
    }

    std::filesystem::path entry_file(const mailrlm::cache::CacheKey& key) const {
        return dir_.path() / "cache" / (key.hex + ".json");
    }

    TempDir dir_;
};

TEST_F(QueryCacheTest, RoundTripCountsHitAndTokens) {
    QueryCache cache(make_config());
    auto key = key_for("summarize", "ctx", "m");

    cache.set(key, "three urgent threads", 250, "m");
    auto result = cache.get(key);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "three urgent threads");

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.tokens_saved, 250u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 1.0);
}

TEST_F(QueryCacheTest, AbsentEntryIsMiss) {
    QueryCache cache(make_config());

    EXPECT_FALSE(cache.get(key_for("p", "c", "m")).has_value());

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.0);
}

TEST_F(QueryCacheTest, EntryFileHasExpectedFields) {
    QueryCache cache(make_config());
    auto key = key_for("p", "c", "model-x");
    cache.set(key, "answer", 7, "model-x");

    auto j = nlohmann::json::parse(read_text(entry_file(key)));
    EXPECT_EQ(j.at("result"), "answer");
    EXPECT_EQ(j.at("tokens_saved"), 7);
    EXPECT_EQ(j.at("model"), "model-x");
    EXPECT_EQ(j.at("prompt_hash"), key.fragment());
    EXPECT_TRUE(mailrlm::util::parse_iso8601(j.at("created_at").get<std::string>()).has_value());
}

TEST_F(QueryCacheTest, SetOverwritesPreviousResult) {
    QueryCache cache(make_config());
    auto key = key_for("p", "c", "m");

    cache.set(key, "first", 1, "m");
    cache.set(key, "second", 2, "m");

    EXPECT_EQ(cache.get(key).value_or(""), "second");
    EXPECT_EQ(cache.entry_count(), 1u);
}

TEST_F(QueryCacheTest, ExpiredEntryIsMissAndDeleted) {
    QueryCache cache(make_config(std::chrono::hours(1)));
    auto key = key_for("p", "c", "m");

    CacheEntry entry;
    entry.result = "stale";
    entry.created_at = std::chrono::system_clock::now() - std::chrono::hours(2);
    entry.tokens_saved = 10;
    entry.model = "m";
    entry.prompt_hash = key.fragment();
    write_text(entry_file(key), QueryCache::serialize_entry(entry));

    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_FALSE(std::filesystem::exists(entry_file(key)));
    EXPECT_EQ(cache.stats().misses, 1u);
    EXPECT_EQ(cache.stats().tokens_saved, 0u);
}

TEST_F(QueryCacheTest, CorruptedEntryIsMissAndDeleted) {
    QueryCache cache(make_config());
    auto key = key_for("p", "c", "m");
    write_text(entry_file(key), "{not json");

    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_FALSE(std::filesystem::exists(entry_file(key)));

    cache.set(key, "fresh", 1, "m");
    EXPECT_EQ(cache.get(key).value_or(""), "fresh");
}

TEST_F(QueryCacheTest, EntryMissingFieldsIsCorrupted) {
    EXPECT_FALSE(QueryCache::parse_entry(R"({"result": "x"})").has_value());
    EXPECT_FALSE(QueryCache::parse_entry(
        R"({"result": "x", "created_at": "not a time", "tokens_saved": 1, "model": "m", "prompt_hash": "h"})")
        .has_value());
    EXPECT_FALSE(QueryCache::parse_entry(
        R"({"result": "x", "created_at": "2024-01-01T00:00:00", "tokens_saved": -5, "model": "m", "prompt_hash": "h"})")
        .has_value());
    EXPECT_TRUE(QueryCache::parse_entry(
        R"({"result": "x", "created_at": "2024-01-01T00:00:00", "tokens_saved": 5, "model": "m", "prompt_hash": "h"})")
        .has_value());
}

TEST_F(QueryCacheTest, ClearRemovesAllEntries) {
    QueryCache cache(make_config());
    cache.set(key_for("a", "", "m"), "1", 1, "m");
    cache.set(key_for("b", "", "m"), "2", 1, "m");
    write_text(dir_.path() / "cache" / "notes.txt", "not an entry");

    EXPECT_EQ(cache.clear(), 2u);
    EXPECT_EQ(cache.entry_count(), 0u);
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "cache" / "notes.txt"));
}

TEST_F(QueryCacheTest, ForeignJsonFilesAreNotEntries) {
    QueryCache cache(make_config());
    cache.set(key_for("a", "", "m"), "1", 1, "m");
    write_text(dir_.path() / "cache" / "settings.json", "{}");

    EXPECT_EQ(cache.entry_count(), 1u);
    EXPECT_EQ(cache.cleanup_expired(), 0u);
    EXPECT_EQ(cache.clear(), 1u);
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "cache" / "settings.json"));
}

TEST_F(QueryCacheTest, CleanupRemovesOnlyExpiredAndCorrupted) {
    QueryCache cache(make_config(std::chrono::hours(1)));
    auto live = key_for("live", "", "m");
    auto stale = key_for("stale", "", "m");
    auto broken = key_for("broken", "", "m");

    cache.set(live, "ok", 1, "m");

    CacheEntry old_entry;
    old_entry.result = "old";
    old_entry.created_at = std::chrono::system_clock::now() - std::chrono::hours(3);
    old_entry.model = "m";
    old_entry.prompt_hash = stale.fragment();
    write_text(entry_file(stale), QueryCache::serialize_entry(old_entry));
    write_text(entry_file(broken), "[]");

    EXPECT_EQ(cache.cleanup_expired(), 2u);
    EXPECT_EQ(cache.entry_count(), 1u);
    EXPECT_EQ(cache.get(live).value_or(""), "ok");
}

TEST_F(QueryCacheTest, DisabledCacheStoresNothing) {
    auto config = make_config();
    config.enabled = false;
    QueryCache cache(config);
    auto key = key_for("p", "c", "m");

    cache.set(key, "value", 1, "m");

    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_FALSE(std::filesystem::exists(entry_file(key)));
    EXPECT_EQ(cache.stats().misses, 0u);
}

TEST_F(QueryCacheTest, EntriesSurviveNewInstance) {
    auto key = key_for("p", "c", "m");
    {
        QueryCache cache(make_config());
        cache.set(key, "persisted", 3, "m");
    }

    QueryCache reopened(make_config());
    EXPECT_EQ(reopened.get(key).value_or(""), "persisted");
    EXPECT_EQ(reopened.stats().tokens_saved, 3u);
}
