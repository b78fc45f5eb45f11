/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Checkpoint serialization
 */

#include "checkpoint/checkpoint.hpp"

#include <charconv>
#include <stdexcept>

namespace mailrlm::checkpoint {

namespace {

std::size_t parse_index(const std::string& key) {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
    if (ec != std::errc{} || ptr != key.data() + key.size() || key.empty()) {
        throw std::invalid_argument("Invalid result index: \"" + key + "\"");
    }
    return value;
}

} // namespace

bool Checkpoint::is_contiguous() const {
    if (intermediate_results.size() != processed_indices.size()) {
        return false;
    }
    for (std::size_t i = 0; i < processed_indices.size(); ++i) {
        if (processed_indices[i] != i || !intermediate_results.contains(i)) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const Checkpoint& c) {
    nlohmann::json results = nlohmann::json::object();
    for (const auto& [index, text] : c.intermediate_results) {
        results[std::to_string(index)] = text;
    }

    j = nlohmann::json{
        {"session_id", c.session_id},
        {"checkpoint_id", c.checkpoint_id},
        {"created_at", util::format_iso8601(c.created_at)},
        {"emails_hash", c.dataset_fingerprint},
        {"processed_indices", c.processed_indices},
        {"intermediate_results", std::move(results)},
        {"session_state", c.session_state},
        {"total_chunks", c.total_chunks},
        {"prompt_hash", c.prompt_fingerprint ? nlohmann::json(*c.prompt_fingerprint) : nlohmann::json(nullptr)}
    };
}

void from_json(const nlohmann::json& j, Checkpoint& c) {
    j.at("session_id").get_to(c.session_id);
    j.at("checkpoint_id").get_to(c.checkpoint_id);
    j.at("emails_hash").get_to(c.dataset_fingerprint);
    j.at("processed_indices").get_to(c.processed_indices);
    j.at("total_chunks").get_to(c.total_chunks);

    auto created_at = util::parse_iso8601(j.at("created_at").get<std::string>());
    if (!created_at) {
        throw std::invalid_argument("Invalid created_at timestamp");
    }
    c.created_at = *created_at;

    c.intermediate_results.clear();
    for (const auto& [key, value] : j.at("intermediate_results").items()) {
        c.intermediate_results[parse_index(key)] = value.get<std::string>();
    }

    c.session_state = j.value("session_state", nlohmann::json::object());
    if (!c.session_state.is_object()) {
        throw std::invalid_argument("session_state must be an object");
    }

    c.prompt_fingerprint.reset();
    if (j.contains("prompt_hash") && !j.at("prompt_hash").is_null()) {
        c.prompt_fingerprint = j.at("prompt_hash").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const CheckpointInfo& i) {
    j = nlohmann::json{
        {"session_id", i.session_id},
        {"checkpoint_id", i.checkpoint_id},
        {"created_at", i.created_at},
        {"progress", i.progress},
        {"progress_pct", i.progress_pct},
        {"session_state", i.session_state}
    };
}

} // namespace mailrlm::checkpoint
