/**
 * MAILRLM - Resumable Email Analysis Toolkit
 *
 * Command-line front end: analyze an email dump chunk by chunk through an
 * external model command, with cached queries and resumable progress.
 */

#include "config/config.hpp"
#include "cache/query_cache.hpp"
#include "checkpoint/checkpoint_store.hpp"
#include "dataset/chunking.hpp"
#include "dataset/email.hpp"
#include "dataset/filtering.hpp"
#include "engine/resumable_map.hpp"
#include "llm/cached_query.hpp"
#include "llm/command_client.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <fmt/format.h>

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace log_component = mailrlm::util::log_component;
using mailrlm::config::Config;
using mailrlm::config::Invocation;

mailrlm::util::LogConfig make_log_config(const mailrlm::config::LogSettings& settings) {
    mailrlm::util::LogConfig log_config;
    log_config.level = mailrlm::util::Logger::parse_level(settings.level)
        .value_or(mailrlm::util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

mailrlm::cache::QueryCacheConfig make_cache_config(const mailrlm::config::CacheSettings& settings) {
    mailrlm::cache::QueryCacheConfig cache_config;
    cache_config.directory = settings.dir.empty()
        ? mailrlm::cache::QueryCacheConfig::default_directory()
        : std::filesystem::path(settings.dir);
    cache_config.ttl = std::chrono::hours(settings.ttl_hours);
    cache_config.enabled = settings.enabled;
    return cache_config;
}

const std::string& require_word(const Invocation& invocation, std::size_t index, const char* what) {
    if (invocation.positional.size() <= index) {
        throw mailrlm::ConfigurationError(std::string("missing ") + what);
    }
    return invocation.positional[index];
}

mailrlm::dataset::EmailDataset load_selected_emails(const Invocation& invocation) {
    if (!invocation.emails_file) {
        throw mailrlm::ConfigurationError("--emails FILE is required");
    }

    auto dataset = mailrlm::dataset::load_emails_from_file(*invocation.emails_file);
    const auto loaded = dataset.emails.size();

    dataset.emails = mailrlm::dataset::deduplicate_emails(dataset.emails);
    if (invocation.keyword) {
        dataset.emails = mailrlm::dataset::filter_by_keyword(dataset.emails, *invocation.keyword);
    }
    if (invocation.sender) {
        dataset.emails = mailrlm::dataset::filter_by_sender(dataset.emails, *invocation.sender);
    }
    if (dataset.emails.size() != loaded) {
        MAILRLM_LOG_INFO(log_component::Cli, "Selected {} of {} emails", dataset.emails.size(), loaded);
    }
    return dataset;
}

std::vector<mailrlm::dataset::EmailChunk> make_chunks(const std::vector<mailrlm::dataset::Email>& emails,
                                                      const mailrlm::config::ChunkingSettings& settings) {
    namespace ds = mailrlm::dataset;
    const auto& kind = settings.group_by;
    if (kind == "size") {
        return ds::chunk_by_size(emails, settings.chunk_size);
    }
    if (kind == "sender") {
        return ds::groups_to_chunks(ds::chunk_by_sender(emails));
    }
    if (kind == "domain") {
        return ds::groups_to_chunks(ds::chunk_by_sender_domain(emails));
    }
    if (kind == "thread") {
        return ds::groups_to_chunks(ds::chunk_by_thread(emails));
    }
    if (auto period = ds::parse_date_period(kind)) {
        // Oldest period first
        return ds::groups_to_chunks(ds::chunk_by_date(ds::sort_emails(emails, ds::SortKey::Date, false), *period));
    }
    throw mailrlm::ConfigurationError("unknown grouping: " + kind);
}

int run_command(const Config& config, const Invocation& invocation) {
    if (!invocation.emails_file || !invocation.prompt) {
        throw mailrlm::ConfigurationError("run requires --emails FILE and --prompt TEXT");
    }

    auto dataset = load_selected_emails(invocation);
    auto chunks = make_chunks(dataset.emails, config.chunking);

    MAILRLM_LOG_INFO(log_component::Cli, "Loaded {} emails from {} ({} chunks, grouped by {})",
                     dataset.emails.size(), dataset.source_file.string(),
                     chunks.size(), config.chunking.group_by);
    MAILRLM_LOG_INFO(log_component::Cli, "Dump query '{}' ({} results reported, format {})",
                     dataset.query, dataset.result_count, dataset.format);
    if (dataset.result_count != dataset.emails.size()) {
        MAILRLM_LOG_WARN(log_component::Cli, "Dump reports {} results but holds {} messages",
                         dataset.result_count, dataset.emails.size());
    }

    mailrlm::cache::QueryCache cache(make_cache_config(config.cache));

    mailrlm::llm::CommandClientConfig client_config;
    client_config.command = config.llm.command;
    client_config.timeout = std::chrono::seconds(config.llm.timeout_seconds);
    mailrlm::llm::CommandClient client(client_config);

    MAILRLM_LOG_INFO(log_component::Cli, "Model command '{}' (timeout {}s), cache {}",
                     client.config().command.front(), client.config().timeout.count(),
                     cache.is_enabled() ? cache.directory().string() : std::string("disabled"));

    mailrlm::llm::CachedQuery cached(
        cache,
        [&client](const std::string& prompt, const std::string& context) {
            return client.query(prompt, context);
        },
        config.llm.model);

    mailrlm::engine::MapOptions options;
    options.prompt = *invocation.prompt;
    if (!config.checkpoint.path.empty()) {
        options.checkpoint_path = std::filesystem::path(config.checkpoint.path);
    }
    options.checkpoint_interval = config.checkpoint.interval;
    options.session_state = [&cache, &cached]() {
        auto stats = cache.stats();
        return nlohmann::json{
            {"model", cached.model()},
            {"cache_hits", stats.hits},
            {"cache_misses", stats.misses},
            {"tokens_saved", stats.tokens_saved},
            {"calls_made", cached.calls_made()}
        };
    };
    options.on_progress = [](std::size_t completed, std::size_t total) {
        MAILRLM_LOG_INFO(log_component::Cli, "Progress: {}/{}", completed, total);
    };

    const auto max_chars = config.chunking.max_context_chars;
    mailrlm::engine::ResumableMap map;
    auto result = map.run(
        chunks,
        [max_chars](const mailrlm::dataset::EmailChunk& chunk) {
            return mailrlm::dataset::batch_extract_summaries(chunk, max_chars);
        },
        cached.as_process_fn(),
        dataset.emails,
        options);

    if (result.discard_reason) {
        MAILRLM_LOG_WARN(log_component::Cli, "Previous checkpoint discarded: {}", *result.discard_reason);
    }

    auto stats = cache.stats();
    MAILRLM_LOG_INFO(log_component::Cli,
                     "Session {} ({}): {} model calls, cache {} hits / {} misses ({:.0f}%), ~{} tokens saved",
                     result.session_id, mailrlm::engine::to_string(result.start_mode),
                     cached.calls_made(), stats.hits, stats.misses, stats.hit_rate() * 100.0,
                     stats.tokens_saved);

    std::cout << mailrlm::dataset::aggregate_results(result.results) << "\n";
    return 0;
}

int cache_command(const Config& config, const Invocation& invocation) {
    const auto& action = require_word(invocation, 1, "cache action (stats|clear|cleanup)");

    auto cache_config = make_cache_config(config.cache);
    cache_config.enabled = true;
    mailrlm::cache::QueryCache cache(cache_config);

    if (action == "stats") {
        std::cout << fmt::format("Directory: {}\nEntries:   {}\nTTL:       {}h\n",
                                 cache.directory().string(), cache.entry_count(),
                                 std::chrono::duration_cast<std::chrono::hours>(cache.ttl()).count());
    } else if (action == "clear") {
        std::cout << fmt::format("Removed {} entries\n", cache.clear());
    } else if (action == "cleanup") {
        std::cout << fmt::format("Removed {} expired entries\n", cache.cleanup_expired());
    } else {
        throw mailrlm::ConfigurationError("unknown cache action: " + action);
    }
    return 0;
}

int senders_command(const Invocation& invocation) {
    std::size_t top = 10;
    if (invocation.positional.size() > 1) {
        const auto& word = invocation.positional[1];
        if (word.empty() || word.find_first_not_of("0123456789") != std::string::npos) {
            throw mailrlm::ConfigurationError("senders count must be a number: " + word);
        }
        top = std::stoul(word);
    }

    auto dataset = load_selected_emails(invocation);
    for (const auto& [sender, count] : mailrlm::dataset::get_top_senders(dataset.emails, top)) {
        std::cout << fmt::format("{:>6}  {}\n", count, sender);
    }
    return 0;
}

int checkpoint_command(const Invocation& invocation) {
    const auto& action = require_word(invocation, 1, "checkpoint action (info|clear)");
    const std::filesystem::path path = require_word(invocation, 2, "checkpoint path");

    mailrlm::checkpoint::CheckpointStore store;

    if (action == "info") {
        auto info = store.info(path);
        std::cout << fmt::format("Session:    {}\nCheckpoint: {}\nCreated:    {}\nProgress:   {} ({:.1f}%)\n",
                                 info.session_id, info.checkpoint_id, info.created_at,
                                 info.progress, info.progress_pct);
        if (!info.session_state.empty()) {
            std::cout << "State:      " << info.session_state.dump() << "\n";
        }
    } else if (action == "clear") {
        if (store.clear(path)) {
            std::cout << "Checkpoint removed: " << path.string() << "\n";
        } else {
            std::cout << "No checkpoint at " << path.string() << "\n";
        }
    } else {
        throw mailrlm::ConfigurationError("unknown checkpoint action: " + action);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Load configuration
        mailrlm::config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        const auto& config = config_manager.get_config();
        const auto& invocation = config_manager.get_invocation();

        mailrlm::util::Logger::init(make_log_config(config.logging));

        if (!config_manager.get_config_path().empty()) {
            MAILRLM_LOG_DEBUG(log_component::Config, "Using configuration file {}",
                              config_manager.get_config_path().string());
        }

        const auto& command = require_word(invocation, 0, "command (run|cache|checkpoint|senders)");
        if (command == "run") {
            return run_command(config, invocation);
        }
        if (command == "cache") {
            return cache_command(config, invocation);
        }
        if (command == "checkpoint") {
            return checkpoint_command(invocation);
        }
        if (command == "senders") {
            return senders_command(invocation);
        }
        throw mailrlm::ConfigurationError("unknown command: " + command);

    } catch (const std::exception& e) {
        MAILRLM_LOG_ERROR(log_component::Cli, "{}", e.what());
        return 1;
    }
}
