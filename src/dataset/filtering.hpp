/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Filtering - select, order and rank emails before chunking
 */

#ifndef MAILRLM_DATASET_FILTERING_HPP
#define MAILRLM_DATASET_FILTERING_HPP

#include "dataset/email.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mailrlm::dataset {

enum class EmailField {
    From,
    To,
    Subject,
    Date,
    Snippet,
    Body
};

std::string_view field_value(const Email& email, EmailField field);

/**
 * Keep the emails the predicate accepts, in input order
 */
std::vector<Email> filter_emails(const std::vector<Email>& emails,
                                 const std::function<bool(const Email&)>& predicate);

/**
 * Case-insensitive substring match on any of the given fields
 * (subject, snippet and body by default)
 */
std::vector<Email> filter_by_keyword(const std::vector<Email>& emails, std::string_view keyword,
                                     const std::vector<EmailField>& fields = {
                                         EmailField::Subject, EmailField::Snippet, EmailField::Body});

/**
 * Case-insensitive substring match on the From header
 */
std::vector<Email> filter_by_sender(const std::vector<Email>& emails, std::string_view pattern);

enum class SortKey {
    Date,
    From,
    Subject
};

/**
 * Stable sort, newest first by default.
 *
 * Dates are compared as instants; emails whose Date header cannot be parsed
 * come after every parsed one in either direction, ordered by raw text.
 * From and Subject compare case-insensitively.
 */
std::vector<Email> sort_emails(std::vector<Email> emails, SortKey by = SortKey::Date,
                               bool descending = true);

using SenderCount = std::pair<std::string, std::size_t>;

/**
 * The n most frequent sender addresses (see sender_address), most frequent
 * first; ties keep first-appearance order
 */
std::vector<SenderCount> get_top_senders(const std::vector<Email>& emails, std::size_t n = 10);

} // namespace mailrlm::dataset

#endif // MAILRLM_DATASET_FILTERING_HPP
