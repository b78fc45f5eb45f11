/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Chunking Implementation
 */

#include "dataset/chunking.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <unordered_set>

namespace mailrlm::dataset {

namespace {

std::string_view trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string date_key(const std::string& date, DatePeriod period) {
    auto parsed = parse_email_date(date);
    if (!parsed) {
        return std::string(kUnknownDate);
    }

    const char* pattern = "%Y-%m-%d";
    if (period == DatePeriod::Week) {
        pattern = "%Y-W%W";
    } else if (period == DatePeriod::Month) {
        pattern = "%Y-%m";
    }
    char buf[32];
    auto len = std::strftime(buf, sizeof(buf), pattern, &parsed->local);
    return std::string(buf, len);
}

} // namespace

std::optional<DatePeriod> parse_date_period(std::string_view name) {
    if (name == "day") return DatePeriod::Day;
    if (name == "week") return DatePeriod::Week;
    if (name == "month") return DatePeriod::Month;
    return std::nullopt;
}

std::string sender_address(const Email& email) {
    std::string_view from = email.from.empty() ? std::string_view{"(Unknown)"} : email.from;

    auto open = from.find('<');
    if (open != std::string_view::npos) {
        auto close = from.find('>', open + 1);
        if (close != std::string_view::npos && close > open + 1) {
            return to_lower(from.substr(open + 1, close - open - 1));
        }
    }
    return to_lower(trim(from));
}

EmailGroups chunk_by_sender(const std::vector<Email>& emails) {
    EmailGroups groups;
    for (const auto& email : emails) {
        groups[sender_address(email)].push_back(email);
    }
    return groups;
}

EmailGroups chunk_by_sender_domain(const std::vector<Email>& emails) {
    EmailGroups groups;
    for (const auto& email : emails) {
        auto address = sender_address(email);
        auto at = address.find('@');
        if (at == std::string::npos) {
            groups["unknown"].push_back(email);
            continue;
        }
        auto domain = address.substr(at + 1);
        groups[domain.substr(0, domain.find('@'))].push_back(email);
    }
    return groups;
}

EmailGroups chunk_by_date(const std::vector<Email>& emails, DatePeriod period) {
    EmailGroups groups;
    for (const auto& email : emails) {
        groups[date_key(email.date, period)].push_back(email);
    }
    return groups;
}

EmailGroups chunk_by_thread(const std::vector<Email>& emails) {
    EmailGroups groups;
    for (const auto& email : emails) {
        if (!email.thread_id.empty()) {
            groups[email.thread_id].push_back(email);
        } else if (email.id && !email.id->empty()) {
            groups[*email.id].push_back(email);
        } else {
            groups["unknown"].push_back(email);
        }
    }
    return groups;
}

std::vector<EmailChunk> groups_to_chunks(EmailGroups groups) {
    std::vector<EmailChunk> chunks;
    chunks.reserve(groups.size());
    for (auto& [key, group] : groups) {
        chunks.push_back(std::move(group));
    }
    return chunks;
}

std::vector<EmailChunk> chunk_by_size(const std::vector<Email>& emails, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be non-zero");
    }

    std::vector<EmailChunk> chunks;
    chunks.reserve((emails.size() + chunk_size - 1) / chunk_size);
    for (std::size_t i = 0; i < emails.size(); i += chunk_size) {
        auto end = std::min(emails.size(), i + chunk_size);
        chunks.emplace_back(emails.begin() + static_cast<std::ptrdiff_t>(i),
                            emails.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

std::string extract_email_summary(const Email& email) {
    std::vector<std::string> parts;
    if (!email.from.empty()) parts.push_back("From: " + email.from);
    if (!email.subject.empty()) parts.push_back("Subject: " + email.subject);
    if (!email.date.empty()) parts.push_back("Date: " + email.date);
    if (!email.snippet.empty()) parts.push_back("Preview: " + email.snippet);

    return fmt::format("{}", fmt::join(parts, "\n"));
}

std::string batch_extract_summaries(const std::vector<Email>& emails, std::size_t max_chars) {
    std::vector<std::string> summaries;
    std::size_t total_chars = 0;

    for (std::size_t i = 0; i < emails.size(); ++i) {
        auto summary = fmt::format("[{}] {}", i + 1, extract_email_summary(emails[i]));
        auto summary_len = summary.size() + 2;  // blank-line separator

        if (total_chars + summary_len > max_chars) {
            summaries.push_back(fmt::format("... and {} more emails", emails.size() - i));
            break;
        }

        summaries.push_back(std::move(summary));
        total_chars += summary_len;
    }

    return fmt::format("{}", fmt::join(summaries, "\n\n"));
}

std::string aggregate_results(const std::vector<std::string>& results, std::string_view separator) {
    std::vector<std::string_view> non_empty;
    for (const auto& result : results) {
        auto trimmed = trim(result);
        if (!trimmed.empty()) {
            non_empty.push_back(trimmed);
        }
    }
    return fmt::format("{}", fmt::join(non_empty, separator));
}

std::vector<Email> deduplicate_emails(const std::vector<Email>& emails) {
    std::unordered_set<std::string> seen;
    std::vector<Email> result;

    for (const auto& email : emails) {
        if (!email.id || email.id->empty()) {
            result.push_back(email);
        } else if (seen.insert(*email.id).second) {
            result.push_back(email);
        }
    }
    return result;
}

} // namespace mailrlm::dataset
