/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Chunking - split datasets into model-sized pieces and render context text
 */

#ifndef MAILRLM_DATASET_CHUNKING_HPP
#define MAILRLM_DATASET_CHUNKING_HPP

#include "dataset/email.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailrlm::dataset {

using EmailChunk = std::vector<Email>;

/**
 * Emails grouped under a key, in key order. Each group keeps the input order.
 */
using EmailGroups = std::map<std::string, EmailChunk>;

enum class DatePeriod {
    Day,     // "2026-01-15"
    Week,    // "2026-W02" (Monday-based week of the year)
    Month    // "2026-01"
};

/**
 * "day", "week" or "month"
 */
std::optional<DatePeriod> parse_date_period(std::string_view name);

/**
 * Grouping key for emails whose date cannot be read
 */
constexpr std::string_view kUnknownDate = "unknown_date";

/**
 * Split into consecutive chunks of at most chunk_size emails
 *
 * @throws std::invalid_argument if chunk_size is zero
 */
std::vector<EmailChunk> chunk_by_size(const std::vector<Email>& emails, std::size_t chunk_size = 20);

/**
 * Lowercased address of the sender: the part inside <...> when present,
 * otherwise the whole trimmed field ("(unknown)" when empty)
 */
std::string sender_address(const Email& email);

EmailGroups chunk_by_sender(const std::vector<Email>& emails);

/**
 * Group by the domain of sender_address(); "unknown" when it has no '@'
 */
EmailGroups chunk_by_sender_domain(const std::vector<Email>& emails);

/**
 * Group by calendar period of the Date header, read in the sender's own
 * zone. Accepted forms: RFC 2822 with or without weekday, "YYYY-MM-DD HH:MM:SS"
 * and "YYYY-MM-DD". Anything else lands under kUnknownDate.
 */
EmailGroups chunk_by_date(const std::vector<Email>& emails, DatePeriod period = DatePeriod::Day);

/**
 * Group by threadId, falling back to the message id, then "unknown"
 */
EmailGroups chunk_by_thread(const std::vector<Email>& emails);

/**
 * Group values as chunks, in key order
 */
std::vector<EmailChunk> groups_to_chunks(EmailGroups groups);

/**
 * "From/Subject/Date/Preview" lines for one email (empty fields skipped)
 */
std::string extract_email_summary(const Email& email);

/**
 * Numbered summaries joined by blank lines, stopping with an
 * "... and N more emails" marker once max_chars would be exceeded
 */
std::string batch_extract_summaries(const std::vector<Email>& emails, std::size_t max_chars = 4000);

/**
 * Join the non-blank results (trimmed) with a separator
 */
std::string aggregate_results(const std::vector<std::string>& results,
                              std::string_view separator = "\n\n---\n\n");

/**
 * Drop repeated ids, keeping first occurrences; emails with a missing or
 * empty id are always kept
 */
std::vector<Email> deduplicate_emails(const std::vector<Email>& emails);

} // namespace mailrlm::dataset

#endif // MAILRLM_DATASET_CHUNKING_HPP
