/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Resumable Map - sequential chunk processing with checkpoint/resume
 *
 * Lifecycle of a run:
 *   START -> RESUMED | FRESH -> PROCESSING -> CHECKPOINTING ... -> DONE
 *
 * Chunks are processed strictly in order, one blocking call at a time.
 * A checkpoint covering chunks [0, i] is written after chunk i whenever
 * (i + 1) is a multiple of the interval, and after the last chunk. An
 * exception from the processing call ends the run and propagates; the
 * last written checkpoint is the recovery point for the next run.
 */

#ifndef MAILRLM_ENGINE_RESUMABLE_MAP_HPP
#define MAILRLM_ENGINE_RESUMABLE_MAP_HPP

#include "checkpoint/checkpoint_store.hpp"
#include "util/fingerprint.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace mailrlm::engine {

/**
 * Processing call: (prompt, context, extra parameters) -> result text
 */
using ProcessFn = std::function<std::string(const std::string& prompt,
                                            const std::string& context,
                                            const nlohmann::json& extra)>;

/**
 * Snapshot of caller state embedded in each checkpoint
 */
using SessionStateFn = std::function<nlohmann::json()>;

/**
 * Called after every processed chunk with (completed, total)
 */
using ProgressFn = std::function<void(std::size_t completed, std::size_t total)>;

/**
 * How a run started
 */
enum class StartMode {
    Fresh,      // No checkpoint configured or none on disk
    Resumed,    // Continued from a valid checkpoint
    Discarded   // A checkpoint existed but was unreadable or did not match
};

std::string_view to_string(StartMode mode);

struct MapOptions {
    std::string prompt;
    std::optional<std::filesystem::path> checkpoint_path;
    std::size_t checkpoint_interval{10};
    std::string session_id;                            // Empty = generated (or taken from the checkpoint)
    SessionStateFn session_state;
    ProgressFn on_progress;
    nlohmann::json extra = nlohmann::json::object();   // Forwarded to every processing call
};

struct MapResult {
    std::vector<std::string> results;   // Aligned 1:1 with the input chunks
    StartMode start_mode{StartMode::Fresh};
    std::size_t start_index{0};
    std::size_t calls_made{0};
    std::string session_id;
    std::optional<std::string> checkpoint_id;    // Last checkpoint written by this run
    std::optional<std::string> discard_reason;
};

/**
 * Default chunk stringification: strings pass through, anything else
 * is rendered as compact JSON
 */
template<typename Chunk>
std::string default_context(const Chunk& chunk) {
    if constexpr (std::is_convertible_v<const Chunk&, std::string>) {
        return std::string(chunk);
    } else {
        return nlohmann::json(chunk).dump();
    }
}

class ResumableMap {
public:
    explicit ResumableMap(checkpoint::CheckpointStore store = {});

    /**
     * Process every chunk in order, resuming from a matching checkpoint
     *
     * @param chunks Ordered chunks
     * @param context_fn Chunk -> context text (empty = default_context)
     * @param process Processing call (required)
     * @param dataset Items the chunks were built from, for fingerprinting
     * @param options Prompt, checkpoint settings and callbacks
     * @throws ConfigurationError if process is empty or the interval is zero
     */
    template<typename Chunk, typename Item>
    MapResult run(const std::vector<Chunk>& chunks,
                  const std::type_identity_t<std::function<std::string(const Chunk&)>>& context_fn,
                  const ProcessFn& process,
                  const std::vector<Item>& dataset,
                  const MapOptions& options) {
        auto context_at = [&chunks, &context_fn](std::size_t index) {
            return context_fn ? context_fn(chunks[index]) : default_context(chunks[index]);
        };
        return run_indexed(chunks.size(), context_at, process, util::fingerprint(dataset), options);
    }

    /**
     * Type-erased core of run(): chunks are addressed by index
     */
    MapResult run_indexed(std::size_t total_chunks,
                          const std::function<std::string(std::size_t)>& context_at,
                          const ProcessFn& process,
                          const std::string& dataset_fingerprint,
                          const MapOptions& options);

    const checkpoint::CheckpointStore& store() const { return store_; }

private:
    struct ResumePoint {
        StartMode mode{StartMode::Fresh};
        std::size_t start_index{0};
        std::map<std::size_t, std::string> results;
        std::string session_id;
        std::optional<std::string> discard_reason;
    };

    ResumePoint decide_resume(const std::filesystem::path& path,
                              std::size_t total_chunks,
                              const std::string& dataset_fingerprint,
                              const std::string& prompt);

    checkpoint::CheckpointStore store_;
};

} // namespace mailrlm::engine

#endif // MAILRLM_ENGINE_RESUMABLE_MAP_HPP
