/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Cached query and command client tests
 */

#include "engine/resumable_map.hpp"
#include "llm/cached_query.hpp"
#include "llm/command_client.hpp"
#include "util/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using mailrlm::cache::QueryCache;
using mailrlm::cache::QueryCacheConfig;
using mailrlm::llm::CachedQuery;
using mailrlm::llm::CommandClient;
using mailrlm::llm::CommandClientConfig;
using mailrlm::testing::TempDir;

class CachedQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        mailrlm::testing::quiet_logging();
        QueryCacheConfig config;
        config.directory = dir_.path() / "cache";
        cache_ = std::make_unique<QueryCache>(config);
    }

    mailrlm::llm::QueryFn counting_query() {
        return [this](const std::string& prompt, const std::string& context) {
            ++underlying_calls_;
            return "answer to " + prompt + " about " + context;
        };
    }

    TempDir dir_;
    std::unique_ptr<QueryCache> cache_;
    std::size_t underlying_calls_{0};
};

TEST_F(CachedQueryTest, SecondIdenticalQueryIsServedFromCache) {
    CachedQuery cached(*cache_, counting_query(), "model-a");

    auto first = cached("summarize", "ctx");
    auto second = cached("summarize", "ctx");

    EXPECT_EQ(first, "answer to summarize about ctx");
    EXPECT_EQ(second, first);
    EXPECT_EQ(underlying_calls_, 1u);
    EXPECT_EQ(cached.calls_made(), 1u);
    EXPECT_EQ(cache_->stats().hits, 1u);
    EXPECT_EQ(cache_->stats().tokens_saved,
              CachedQuery::estimate_tokens("summarize", "ctx", first));
}

TEST_F(CachedQueryTest, ModelIsPartOfTheKey) {
    CachedQuery cached(*cache_, counting_query(), "model-a");

    cached("p", "c");
    cached("p", "c", nlohmann::json{{"model", "model-b"}});
    cached("p", "c", nlohmann::json{{"model", "model-b"}});

    EXPECT_EQ(underlying_calls_, 2u);
}

TEST_F(CachedQueryTest, ErrorsAreNotCached) {
    bool fail = true;
    CachedQuery cached(*cache_,
                       [&fail](const std::string&, const std::string&) -> std::string {
                           if (fail) throw mailrlm::ProcessingFailure("model unavailable");
                           return "ok";
                       },
                       "m");

    EXPECT_THROW(cached("p", "c"), mailrlm::ProcessingFailure);
    fail = false;
    EXPECT_EQ(cached("p", "c"), "ok");
    EXPECT_EQ(cache_->entry_count(), 1u);
}

TEST_F(CachedQueryTest, CacheWriteFailureStillReturnsResponse) {
    // A directory squatting on the entry path makes the atomic rename fail
    auto blocked = cache_->directory() / (mailrlm::cache::key_for("p1", "c", "m").hex + ".json");
    std::filesystem::create_directories(blocked / "occupied");

    CachedQuery cached(*cache_, counting_query(), "m");
    mailrlm::engine::ResumableMap map;
    mailrlm::engine::MapOptions options;
    options.prompt = "p1";

    struct Item { std::optional<std::string> id; };
    std::vector<Item> items{{"a"}, {"b"}};
    std::vector<std::string> chunks{"c", "d"};

    auto result = map.run(chunks, {}, cached.as_process_fn(), items, options);

    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.results[0], "answer to p1 about c");
    EXPECT_EQ(result.results[1], "answer to p1 about d");
    EXPECT_EQ(underlying_calls_, 2u);
    EXPECT_EQ(cache_->entry_count(), 1u);
}

TEST_F(CachedQueryTest, WorksAsEngineProcessingCall) {
    CachedQuery cached(*cache_, counting_query(), "m");
    mailrlm::engine::ResumableMap map;
    mailrlm::engine::MapOptions options;
    options.prompt = "classify";

    struct Item { std::optional<std::string> id; };
    std::vector<Item> items{{"a"}, {"b"}, {"c"}};
    std::vector<std::string> chunks{"x", "y", "x"};

    auto result = map.run(chunks, {}, cached.as_process_fn(), items, options);

    EXPECT_EQ(result.results.size(), 3u);
    EXPECT_EQ(result.results[0], result.results[2]);
    EXPECT_EQ(underlying_calls_, 2u);
}

TEST(TokenEstimateTest, RoundsUpQuarterOfCharacters) {
    EXPECT_EQ(CachedQuery::estimate_tokens("", "", ""), 0u);
    EXPECT_EQ(CachedQuery::estimate_tokens("a", "", ""), 1u);
    EXPECT_EQ(CachedQuery::estimate_tokens("abcd", "", ""), 1u);
    EXPECT_EQ(CachedQuery::estimate_tokens("abcd", "e", ""), 2u);
}

TEST(CommandClientTest, BuildsPromptWithContext) {
    EXPECT_EQ(CommandClient::build_prompt("Summarize", "email text"),
              "Context:\nemail text\n\nTask:\nSummarize");
    EXPECT_EQ(CommandClient::build_prompt("Summarize", ""), "Summarize");
}

TEST(CommandClientTest, ReturnsTrimmedStdout) {
    mailrlm::testing::quiet_logging();
    CommandClientConfig config;
    config.command = {"echo"};
    CommandClient client(config);

    EXPECT_EQ(client.query("hello", ""), "hello");
    EXPECT_EQ(client.query("task", "ctx"), "Context:\nctx\n\nTask:\ntask");
}

TEST(CommandClientTest, NonZeroExitIsProcessingFailure) {
    mailrlm::testing::quiet_logging();
    CommandClientConfig config;
    config.command = {"sh", "-c", "echo broken >&2; exit 3", "sh"};
    CommandClient client(config);

    try {
        client.query("prompt", "");
        FAIL() << "expected ProcessingFailure";
    } catch (const mailrlm::ProcessingFailure& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("exit 3"), std::string::npos);
        EXPECT_NE(message.find("broken"), std::string::npos);
    }
}

TEST(CommandClientTest, MissingExecutableIsProcessingFailure) {
    mailrlm::testing::quiet_logging();
    CommandClientConfig config;
    config.command = {"mailrlm-no-such-command-xyz"};
    CommandClient client(config);

    EXPECT_THROW(client.query("prompt", ""), mailrlm::ProcessingFailure);
}

TEST(CommandClientTest, TimeoutIsProcessingFailure) {
    mailrlm::testing::quiet_logging();
    CommandClientConfig config;
    config.command = {"sh", "-c", "sleep 5", "sh"};
    config.timeout = std::chrono::seconds(1);
    CommandClient client(config);

    EXPECT_THROW(client.query("prompt", ""), mailrlm::ProcessingFailure);
}

TEST(CommandClientTest, TimeoutAppliesAfterOutputIsClosed) {
    mailrlm::testing::quiet_logging();
    CommandClientConfig config;
    config.command = {"sh", "-c", "exec >&- 2>&-; sleep 4", "sh"};
    config.timeout = std::chrono::seconds(1);
    CommandClient client(config);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.query("prompt", ""), mailrlm::ProcessingFailure);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST(CommandClientTest, EmptyCommandIsConfigurationError) {
    CommandClientConfig config;
    config.command.clear();
    EXPECT_THROW(CommandClient{config}, mailrlm::ConfigurationError);
}
