/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Checkpoint - persisted progress of a chunked analysis job
 *
 * Completed chunks always form a contiguous prefix {0, ..., k-1}: the
 * engine never marks a chunk done while an earlier one is pending, so
 * a checkpoint is fully described by its high-water mark.
 *
 * File layout (JSON):
 *   {"session_id", "checkpoint_id", "created_at", "emails_hash",
 *    "processed_indices": [0, 1, ...], "intermediate_results": {"0": "...", ...},
 *    "session_state": {...}, "total_chunks", "prompt_hash"}
 */

#ifndef MAILRLM_CHECKPOINT_CHECKPOINT_HPP
#define MAILRLM_CHECKPOINT_CHECKPOINT_HPP

#include "util/time_format.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mailrlm::checkpoint {

struct Checkpoint {
    std::string session_id;
    std::string checkpoint_id;
    util::Timestamp created_at;
    std::string dataset_fingerprint;
    std::optional<std::string> prompt_fingerprint;  // nullopt = prompt-agnostic
    std::vector<std::size_t> processed_indices;
    std::map<std::size_t, std::string> intermediate_results;
    nlohmann::json session_state = nlohmann::json::object();
    std::size_t total_chunks{0};

    /**
     * Number of completed chunks (the resume point)
     */
    std::size_t completed() const { return processed_indices.size(); }

    /**
     * processed_indices is exactly {0..k-1} and intermediate_results
     * covers exactly those indices
     */
    bool is_contiguous() const;
};

/**
 * Summary for status reporting (no intermediate results)
 */
struct CheckpointInfo {
    std::string session_id;
    std::string checkpoint_id;
    std::string created_at;
    std::string progress;       // "completed/total"
    double progress_pct{0.0};
    nlohmann::json session_state = nlohmann::json::object();
};

// JSON serialization support
void to_json(nlohmann::json& j, const Checkpoint& c);
void from_json(const nlohmann::json& j, Checkpoint& c);
void to_json(nlohmann::json& j, const CheckpointInfo& i);

} // namespace mailrlm::checkpoint

#endif // MAILRLM_CHECKPOINT_CHECKPOINT_HPP
