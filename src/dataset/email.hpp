/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Email dataset - message records and dump loading
 *
 * Reads the JSON dumps produced by the bulk-read tool:
 *   {"status": "success", "query": "...", "result_count": N,
 *    "messages": [{"id": ..., "threadId": ..., "from": ..., ...}]}
 */

#ifndef MAILRLM_DATASET_EMAIL_HPP
#define MAILRLM_DATASET_EMAIL_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mailrlm::dataset {

/**
 * One message. Only `id` takes part in dataset fingerprinting.
 */
struct Email {
    std::optional<std::string> id;
    std::string thread_id;
    std::string from;
    std::string to;
    std::string subject;
    std::string date;
    std::string snippet;
    std::string body;

    bool operator==(const Email&) const = default;
};

/**
 * Parsed Date header. `local` holds the wall-clock fields as written,
 * `utc` the instant they denote (zone-less forms are taken as UTC).
 */
struct EmailDate {
    std::tm local{};
    std::time_t utc{0};
};

/**
 * Parse a Date header: RFC 2822 with or without weekday,
 * "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DD"
 *
 * @return nullopt for any other form
 */
std::optional<EmailDate> parse_email_date(const std::string& text);

/**
 * Loaded dump with its query metadata
 */
struct EmailDataset {
    std::vector<Email> emails;
    std::string query{"loaded_from_file"};
    std::size_t result_count{0};
    std::string format{"unknown"};
    std::filesystem::path source_file;
};

/**
 * Load a dump written by the bulk-read tool
 *
 * @throws std::runtime_error if the file is missing, not JSON, or its
 *         status is not "success"
 */
EmailDataset load_emails_from_file(const std::filesystem::path& path);

// JSON serialization support
void to_json(nlohmann::json& j, const Email& e);
void from_json(const nlohmann::json& j, Email& e);

} // namespace mailrlm::dataset

#endif // MAILRLM_DATASET_EMAIL_HPP
