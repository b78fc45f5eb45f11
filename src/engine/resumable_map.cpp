/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Resumable Map Implementation
 */

#include "engine/resumable_map.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <numeric>

namespace mailrlm::engine {

namespace log_component = util::log_component;

std::string_view to_string(StartMode mode) {
    switch (mode) {
        case StartMode::Fresh:     return "fresh";
        case StartMode::Resumed:   return "resumed";
        case StartMode::Discarded: return "discarded";
        default:                   return "unknown";
    }
}

ResumableMap::ResumableMap(checkpoint::CheckpointStore store)
    : store_(std::move(store)) {
}

MapResult ResumableMap::run_indexed(std::size_t total_chunks,
                                    const std::function<std::string(std::size_t)>& context_at,
                                    const ProcessFn& process,
                                    const std::string& dataset_fingerprint,
                                    const MapOptions& options) {
    if (!process) {
        throw ConfigurationError("a processing call is required");
    }
    if (options.checkpoint_interval == 0) {
        throw ConfigurationError("checkpoint_interval must be non-zero");
    }

    MapResult result;
    result.session_id = options.session_id;

    if (total_chunks == 0) {
        MAILRLM_LOG_DEBUG(log_component::Engine, "No chunks to process");
        return result;
    }

    const auto& path = options.checkpoint_path;

    ResumePoint resume;
    if (path && std::filesystem::exists(*path)) {
        resume = decide_resume(*path, total_chunks, dataset_fingerprint, options.prompt);
    }

    result.start_mode = resume.mode;
    result.start_index = resume.start_index;
    result.discard_reason = resume.discard_reason;
    if (result.session_id.empty()) {
        result.session_id = resume.session_id.empty()
            ? checkpoint::CheckpointStore::generate_session_id()
            : resume.session_id;
    }

    auto results = std::move(resume.results);
    const auto prompt_fingerprint = util::fingerprint(options.prompt);

    MAILRLM_LOG_INFO(log_component::Engine, "Session {}: processing chunks {}..{} of {} ({})",
                     result.session_id, resume.start_index + 1, total_chunks, total_chunks,
                     to_string(resume.mode));

    for (std::size_t i = resume.start_index; i < total_chunks; ++i) {
        auto context = context_at(i);
        results[i] = process(options.prompt, context, options.extra);
        ++result.calls_made;

        if (options.on_progress) {
            options.on_progress(i + 1, total_chunks);
        }

        bool due = (i + 1) % options.checkpoint_interval == 0 || i + 1 == total_chunks;
        if (path && due) {
            std::vector<std::size_t> processed(i + 1);
            std::iota(processed.begin(), processed.end(), std::size_t{0});

            auto state = options.session_state ? options.session_state() : nlohmann::json::object();

            auto checkpoint = store_.create(result.session_id, dataset_fingerprint, prompt_fingerprint,
                                            total_chunks, std::move(processed), results, std::move(state));
            store_.save(checkpoint, *path);
            result.checkpoint_id = checkpoint.checkpoint_id;

            MAILRLM_LOG_INFO(log_component::Engine, "Checkpoint {}: {}/{} chunks ({:.1f}%)",
                             checkpoint.checkpoint_id, i + 1, total_chunks,
                             checkpoint::CheckpointStore::progress_pct(checkpoint));
        }
    }

    result.results.reserve(total_chunks);
    for (std::size_t i = 0; i < total_chunks; ++i) {
        result.results.push_back(std::move(results[i]));
    }

    MAILRLM_LOG_INFO(log_component::Engine, "Session {} done: {} chunks, {} processing calls",
                     result.session_id, total_chunks, result.calls_made);
    return result;
}

ResumableMap::ResumePoint ResumableMap::decide_resume(const std::filesystem::path& path,
                                                      std::size_t total_chunks,
                                                      const std::string& dataset_fingerprint,
                                                      const std::string& prompt) {
    ResumePoint point;

    checkpoint::Checkpoint checkpoint;
    try {
        checkpoint = store_.load(path);
    } catch (const CheckpointNotFound&) {
        return point;
    } catch (const CheckpointCorrupted& e) {
        MAILRLM_LOG_WARN(log_component::Engine, "Ignoring unreadable checkpoint, starting fresh: {}", e.what());
        store_.quarantine(path);
        point.mode = StartMode::Discarded;
        point.discard_reason = e.what();
        return point;
    }

    if (!store_.is_valid_for(checkpoint, dataset_fingerprint, prompt)) {
        MAILRLM_LOG_WARN(log_component::Engine,
                         "Checkpoint {} does not match the current dataset/prompt, starting fresh",
                         checkpoint.checkpoint_id);
        point.mode = StartMode::Discarded;
        point.discard_reason = "dataset or prompt fingerprint mismatch";
        return point;
    }

    // Same items chunked differently: indices would not line up
    if (checkpoint.total_chunks != total_chunks) {
        MAILRLM_LOG_WARN(log_component::Engine,
                         "Checkpoint {} covers {} chunks but the job has {}, starting fresh",
                         checkpoint.checkpoint_id, checkpoint.total_chunks, total_chunks);
        point.mode = StartMode::Discarded;
        point.discard_reason = "chunk count mismatch";
        return point;
    }

    point.mode = StartMode::Resumed;
    point.start_index = checkpoint.completed();
    point.results = std::move(checkpoint.intermediate_results);
    point.session_id = checkpoint.session_id;

    MAILRLM_LOG_INFO(log_component::Engine, "Resuming session {} from checkpoint {} at chunk {}/{}",
                     checkpoint.session_id, checkpoint.checkpoint_id,
                     point.start_index, total_chunks);
    return point;
}

} // namespace mailrlm::engine
