/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Filtering Implementation
 */

#include "dataset/filtering.hpp"
#include "dataset/chunking.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <unordered_map>

namespace mailrlm::dataset {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_lower(std::string_view haystack, const std::string& needle_lower) {
    return to_lower(haystack).find(needle_lower) != std::string::npos;
}

struct DateSortKey {
    std::optional<std::time_t> instant;
    std::string raw;
};

} // namespace

std::string_view field_value(const Email& email, EmailField field) {
    switch (field) {
        case EmailField::From: return email.from;
        case EmailField::To: return email.to;
        case EmailField::Subject: return email.subject;
        case EmailField::Date: return email.date;
        case EmailField::Snippet: return email.snippet;
        case EmailField::Body: return email.body;
    }
    return {};
}

std::vector<Email> filter_emails(const std::vector<Email>& emails,
                                 const std::function<bool(const Email&)>& predicate) {
    std::vector<Email> result;
    std::copy_if(emails.begin(), emails.end(), std::back_inserter(result), predicate);
    return result;
}

std::vector<Email> filter_by_keyword(const std::vector<Email>& emails, std::string_view keyword,
                                     const std::vector<EmailField>& fields) {
    const auto needle = to_lower(keyword);
    return filter_emails(emails, [&](const Email& email) {
        return std::any_of(fields.begin(), fields.end(), [&](EmailField field) {
            return contains_lower(field_value(email, field), needle);
        });
    });
}

std::vector<Email> filter_by_sender(const std::vector<Email>& emails, std::string_view pattern) {
    const auto needle = to_lower(pattern);
    return filter_emails(emails, [&](const Email& email) {
        return contains_lower(email.from, needle);
    });
}

std::vector<Email> sort_emails(std::vector<Email> emails, SortKey by, bool descending) {
    if (by == SortKey::Date) {
        std::vector<std::pair<DateSortKey, Email>> keyed;
        keyed.reserve(emails.size());
        for (auto& email : emails) {
            DateSortKey key;
            if (auto parsed = parse_email_date(email.date)) {
                key.instant = parsed->utc;
            }
            key.raw = email.date;
            keyed.emplace_back(std::move(key), std::move(email));
        }

        std::stable_sort(keyed.begin(), keyed.end(), [descending](const auto& a, const auto& b) {
            const auto& ka = a.first;
            const auto& kb = b.first;
            if (ka.instant.has_value() != kb.instant.has_value()) {
                return ka.instant.has_value();
            }
            if (ka.instant) {
                return descending ? *ka.instant > *kb.instant : *ka.instant < *kb.instant;
            }
            return descending ? ka.raw > kb.raw : ka.raw < kb.raw;
        });

        emails.clear();
        for (auto& [key, email] : keyed) {
            emails.push_back(std::move(email));
        }
        return emails;
    }

    const auto field = by == SortKey::From ? EmailField::From : EmailField::Subject;
    std::vector<std::pair<std::string, Email>> keyed;
    keyed.reserve(emails.size());
    for (auto& email : emails) {
        auto key = to_lower(field_value(email, field));
        keyed.emplace_back(std::move(key), std::move(email));
    }

    std::stable_sort(keyed.begin(), keyed.end(), [descending](const auto& a, const auto& b) {
        return descending ? a.first > b.first : a.first < b.first;
    });

    emails.clear();
    for (auto& [key, email] : keyed) {
        emails.push_back(std::move(email));
    }
    return emails;
}

std::vector<SenderCount> get_top_senders(const std::vector<Email>& emails, std::size_t n) {
    std::vector<SenderCount> counts;
    std::unordered_map<std::string, std::size_t> position;

    for (const auto& email : emails) {
        auto sender = sender_address(email);
        auto [it, inserted] = position.try_emplace(sender, counts.size());
        if (inserted) {
            counts.emplace_back(std::move(sender), 0);
        }
        ++counts[it->second].second;
    }

    std::stable_sort(counts.begin(), counts.end(), [](const SenderCount& a, const SenderCount& b) {
        return a.second > b.second;
    });
    if (counts.size() > n) {
        counts.resize(n);
    }
    return counts;
}

} // namespace mailrlm::dataset
