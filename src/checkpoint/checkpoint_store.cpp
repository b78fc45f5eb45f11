/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Checkpoint Store Implementation
 */

#include "checkpoint/checkpoint_store.hpp"
#include "util/atomic_file.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <ctime>
#include <fstream>
#include <random>
#include <system_error>

namespace mailrlm::checkpoint {

namespace log_component = util::log_component;

namespace {

std::ifstream open_checkpoint(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw CheckpointNotFound("Checkpoint not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CheckpointCorrupted("Cannot open checkpoint: " + path.string());
    }
    return file;
}

} // namespace

Checkpoint CheckpointStore::create(std::string session_id,
                                   std::string dataset_fingerprint,
                                   std::optional<std::string> prompt_fingerprint,
                                   std::size_t total_chunks,
                                   std::vector<std::size_t> processed_indices,
                                   std::map<std::size_t, std::string> intermediate_results,
                                   nlohmann::json session_state) const {
    Checkpoint checkpoint;
    checkpoint.session_id = std::move(session_id);
    checkpoint.checkpoint_id = generate_id();
    checkpoint.created_at = std::chrono::system_clock::now();
    checkpoint.dataset_fingerprint = std::move(dataset_fingerprint);
    checkpoint.prompt_fingerprint = std::move(prompt_fingerprint);
    checkpoint.processed_indices = std::move(processed_indices);
    checkpoint.intermediate_results = std::move(intermediate_results);
    checkpoint.session_state = session_state.is_object() ? std::move(session_state)
                                                         : nlohmann::json::object();
    checkpoint.total_chunks = total_chunks;
    return checkpoint;
}

void CheckpointStore::save(const Checkpoint& checkpoint, const std::filesystem::path& path) const {
    nlohmann::json j = checkpoint;
    util::write_file_atomic(path, j.dump(2));

    MAILRLM_LOG_DEBUG(log_component::Checkpoint, "Checkpoint {} saved to {}: {}/{} chunks",
                      checkpoint.checkpoint_id, path.string(),
                      checkpoint.completed(), checkpoint.total_chunks);
}

Checkpoint CheckpointStore::load(const std::filesystem::path& path) const {
    auto file = open_checkpoint(path);

    Checkpoint checkpoint;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        checkpoint = j.get<Checkpoint>();
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointCorrupted("Invalid checkpoint " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw CheckpointCorrupted("Invalid checkpoint " + path.string() + ": " + e.what());
    }

    if (!checkpoint.is_contiguous()) {
        throw CheckpointCorrupted("Invalid checkpoint " + path.string() +
                                  ": processed indices are not a contiguous prefix");
    }
    if (checkpoint.completed() > checkpoint.total_chunks) {
        throw CheckpointCorrupted("Invalid checkpoint " + path.string() +
                                  ": more processed chunks than total_chunks");
    }

    return checkpoint;
}

bool CheckpointStore::is_valid_for(const Checkpoint& checkpoint,
                                   std::string_view dataset_fingerprint,
                                   std::string_view prompt) const {
    if (checkpoint.dataset_fingerprint != dataset_fingerprint) {
        return false;
    }
    if (checkpoint.prompt_fingerprint && *checkpoint.prompt_fingerprint != util::fingerprint(prompt)) {
        return false;
    }
    return true;
}

double CheckpointStore::progress_pct(const Checkpoint& checkpoint) {
    if (checkpoint.total_chunks == 0) {
        return 0.0;
    }
    return static_cast<double>(checkpoint.completed()) / static_cast<double>(checkpoint.total_chunks) * 100.0;
}

CheckpointInfo CheckpointStore::info(const std::filesystem::path& path) const {
    auto file = open_checkpoint(path);

    // Drop intermediate_results while parsing instead of building it
    nlohmann::json::parser_callback_t skip_results =
        [](int depth, nlohmann::json::parse_event_t event, nlohmann::json& parsed) {
            return !(depth == 1 && event == nlohmann::json::parse_event_t::key &&
                     parsed == "intermediate_results");
        };

    CheckpointInfo info;
    try {
        nlohmann::json j = nlohmann::json::parse(file, skip_results);

        auto completed = j.at("processed_indices").size();
        auto total = j.at("total_chunks").get<std::size_t>();

        info.session_id = j.at("session_id").get<std::string>();
        info.checkpoint_id = j.at("checkpoint_id").get<std::string>();
        info.created_at = j.at("created_at").get<std::string>();
        info.progress = fmt::format("{}/{}", completed, total);
        info.progress_pct = total == 0 ? 0.0
            : static_cast<double>(completed) / static_cast<double>(total) * 100.0;
        info.session_state = j.value("session_state", nlohmann::json::object());
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointCorrupted("Invalid checkpoint " + path.string() + ": " + e.what());
    }

    return info;
}

bool CheckpointStore::clear(const std::filesystem::path& path) const {
    bool removed = std::filesystem::remove(path);
    if (removed) {
        MAILRLM_LOG_INFO(log_component::Checkpoint, "Checkpoint cleared: {}", path.string());
    }
    return removed;
}

std::optional<std::filesystem::path> CheckpointStore::quarantine(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    auto target = path;
    target += ".corrupt";

    std::error_code ec;
    std::filesystem::rename(path, target, ec);
    if (ec) {
        MAILRLM_LOG_WARN(log_component::Checkpoint, "Cannot move corrupted checkpoint {} aside: {}",
                         path.string(), ec.message());
        return std::nullopt;
    }

    MAILRLM_LOG_WARN(log_component::Checkpoint, "Corrupted checkpoint preserved as {}", target.string());
    return target;
}

std::string CheckpointStore::generate_id(std::size_t length) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::string id;
    id.reserve(length);
    std::uint64_t value = rng();
    for (std::size_t i = 0; i < length; ++i) {
        if (i > 0 && i % 16 == 0) {
            value = rng();
        }
        id.push_back(hex_chars[(value >> ((i % 16) * 4)) & 0xF]);
    }
    return id;
}

std::string CheckpointStore::generate_session_id() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "session_%Y%m%d_%H%M%S", &tm);
    return buffer;
}

} // namespace mailrlm::checkpoint
