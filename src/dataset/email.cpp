/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Email dataset Implementation
 */

#include "dataset/email.hpp"
#include "util/logger.hpp"

#include <time.h>

#include <fstream>
#include <stdexcept>

namespace mailrlm::dataset {

namespace log_component = util::log_component;

namespace {

// Tried in order; the whole (trimmed) text must match
constexpr const char* kDateFormats[] = {
    "%a, %d %b %Y %H:%M:%S %z",
    "%d %b %Y %H:%M:%S %z",
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%d",
};

} // namespace

std::optional<EmailDate> parse_email_date(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    auto trimmed = text.substr(start, text.find_last_not_of(" \t\r\n") - start + 1);

    for (const char* format : kDateFormats) {
        std::tm tm{};
        const char* end = ::strptime(trimmed.c_str(), format, &tm);
        if (end == nullptr || *end != '\0') {
            continue;
        }

        EmailDate date;
        date.local = tm;
        // timegm normalizes its argument and fills in weekday and day of year
        date.utc = timegm(&date.local) - tm.tm_gmtoff;
        return date;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Email& e) {
    j = nlohmann::json{
        {"threadId", e.thread_id},
        {"from", e.from},
        {"to", e.to},
        {"subject", e.subject},
        {"date", e.date},
        {"snippet", e.snippet}
    };
    if (e.id) j["id"] = *e.id;
    if (!e.body.empty()) j["body"] = e.body;
}

void from_json(const nlohmann::json& j, Email& e) {
    if (j.contains("id") && j.at("id").is_string()) e.id = j.at("id").get<std::string>();
    if (j.contains("threadId")) j.at("threadId").get_to(e.thread_id);
    if (j.contains("from")) j.at("from").get_to(e.from);
    if (j.contains("to")) j.at("to").get_to(e.to);
    if (j.contains("subject")) j.at("subject").get_to(e.subject);
    if (j.contains("date")) j.at("date").get_to(e.date);
    if (j.contains("snippet")) j.at("snippet").get_to(e.snippet);
    if (j.contains("body")) j.at("body").get_to(e.body);
}

EmailDataset load_emails_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Email file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open email file: " + path.string());
    }

    EmailDataset dataset;
    try {
        nlohmann::json j = nlohmann::json::parse(file);

        auto status = j.value("status", std::string{});
        if (status != "success") {
            throw std::runtime_error("Invalid email file: status=" + (status.empty() ? "(none)" : status));
        }

        if (j.contains("messages")) {
            j.at("messages").get_to(dataset.emails);
        }
        dataset.query = j.value("query", std::string{"loaded_from_file"});
        dataset.result_count = j.value("result_count", dataset.emails.size());
        if (j.contains("metadata") && j.at("metadata").is_object()) {
            dataset.format = j.at("metadata").value("format", std::string{"unknown"});
        }
        dataset.source_file = path;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in email file: " + std::string(e.what()));
    }

    MAILRLM_LOG_INFO(log_component::Dataset, "Loaded {} emails from {}",
                     dataset.emails.size(), path.string());
    return dataset;
}

} // namespace mailrlm::dataset
