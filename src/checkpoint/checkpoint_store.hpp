/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Checkpoint Store - create, persist, load and validate checkpoints
 *
 * Every save rewrites the whole file atomically; there is no append log.
 * Single writer per path: no locking is performed.
 */

#ifndef MAILRLM_CHECKPOINT_CHECKPOINT_STORE_HPP
#define MAILRLM_CHECKPOINT_CHECKPOINT_STORE_HPP

#include "checkpoint/checkpoint.hpp"
#include "util/fingerprint.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailrlm::checkpoint {

class CheckpointStore {
public:
    /**
     * Build a new checkpoint with a fresh id and the current time
     */
    Checkpoint create(std::string session_id,
                      std::string dataset_fingerprint,
                      std::optional<std::string> prompt_fingerprint,
                      std::size_t total_chunks,
                      std::vector<std::size_t> processed_indices = {},
                      std::map<std::size_t, std::string> intermediate_results = {},
                      nlohmann::json session_state = nlohmann::json::object()) const;

    /**
     * Serialize the checkpoint to path, replacing any previous content
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const Checkpoint& checkpoint, const std::filesystem::path& path) const;

    /**
     * @throws CheckpointNotFound if path does not exist
     * @throws CheckpointCorrupted if the content is not a valid checkpoint
     */
    Checkpoint load(const std::filesystem::path& path) const;

    /**
     * Dataset fingerprint must match; the prompt fingerprint is compared
     * only when the checkpoint carries one.
     */
    bool is_valid_for(const Checkpoint& checkpoint,
                      std::string_view dataset_fingerprint,
                      std::string_view prompt) const;

    template<typename Item>
    bool is_valid_for(const Checkpoint& checkpoint,
                      const std::vector<Item>& dataset,
                      std::string_view prompt) const {
        return is_valid_for(checkpoint, std::string_view(util::fingerprint(dataset)), prompt);
    }

    /**
     * completed / total * 100, or 0 when total_chunks is 0
     */
    static double progress_pct(const Checkpoint& checkpoint);

    /**
     * Status summary read without materializing intermediate results
     *
     * @throws CheckpointNotFound, CheckpointCorrupted as load()
     */
    CheckpointInfo info(const std::filesystem::path& path) const;

    /**
     * Delete the checkpoint file
     * @return true if a file was removed
     */
    bool clear(const std::filesystem::path& path) const;

    /**
     * Move an unreadable checkpoint aside to "<path>.corrupt"
     * @return The new location, or nullopt if nothing was moved
     */
    std::optional<std::filesystem::path> quarantine(const std::filesystem::path& path) const;

    /**
     * Short random token used for checkpoint ids
     */
    static std::string generate_id(std::size_t length = 8);

    /**
     * "session_YYYYMMDD_HHMMSS" for the current local time
     */
    static std::string generate_session_id();
};

} // namespace mailrlm::checkpoint

#endif // MAILRLM_CHECKPOINT_CHECKPOINT_STORE_HPP
