/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Email dataset and chunking tests
 */

#include "dataset/chunking.hpp"
#include "dataset/email.hpp"
#include "dataset/filtering.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using mailrlm::dataset::Email;
using mailrlm::testing::TempDir;
using mailrlm::testing::write_text;

namespace {

Email make_email(const std::string& id, const std::string& subject) {
    Email email;
    email.id = id;
    email.thread_id = "t-" + id;
    email.from = "alice@example.com";
    email.subject = subject;
    email.date = "Mon, 1 Jan 2024";
    email.snippet = "preview of " + subject;
    return email;
}

std::vector<Email> make_emails(std::size_t count) {
    std::vector<Email> emails;
    for (std::size_t i = 0; i < count; ++i) {
        emails.push_back(make_email("m" + std::to_string(i), "Subject " + std::to_string(i)));
    }
    return emails;
}

} // namespace

class EmailLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mailrlm::testing::quiet_logging();
    }

    TempDir dir_;
};

TEST_F(EmailLoaderTest, LoadsSuccessfulDump) {
    auto path = dir_ / "emails.json";
    write_text(path, R"({
        "status": "success",
        "query": "is:unread",
        "result_count": 2,
        "metadata": {"format": "full"},
        "messages": [
            {"id": "a1", "threadId": "t1", "from": "bob@example.com", "subject": "Invoice",
             "date": "Tue", "snippet": "Please pay", "body": "Full text"},
            {"id": "a2", "threadId": "t2", "subject": "Lunch"}
        ]
    })");

    auto dataset = mailrlm::dataset::load_emails_from_file(path);

    ASSERT_EQ(dataset.emails.size(), 2u);
    EXPECT_EQ(dataset.emails[0].id, std::optional<std::string>("a1"));
    EXPECT_EQ(dataset.emails[0].thread_id, "t1");
    EXPECT_EQ(dataset.emails[0].body, "Full text");
    EXPECT_EQ(dataset.emails[1].from, "");
    EXPECT_EQ(dataset.query, "is:unread");
    EXPECT_EQ(dataset.result_count, 2u);
    EXPECT_EQ(dataset.format, "full");
    EXPECT_EQ(dataset.source_file, path);
}

TEST_F(EmailLoaderTest, DefaultsForMinimalDump) {
    auto path = dir_ / "emails.json";
    write_text(path, R"({"status": "success", "messages": [{"subject": "no id"}]})");

    auto dataset = mailrlm::dataset::load_emails_from_file(path);

    ASSERT_EQ(dataset.emails.size(), 1u);
    EXPECT_FALSE(dataset.emails[0].id.has_value());
    EXPECT_EQ(dataset.query, "loaded_from_file");
    EXPECT_EQ(dataset.result_count, 1u);
    EXPECT_EQ(dataset.format, "unknown");
}

TEST_F(EmailLoaderTest, RejectsNonSuccessStatus) {
    auto path = dir_ / "emails.json";
    write_text(path, R"({"status": "error", "messages": []})");
    EXPECT_THROW(mailrlm::dataset::load_emails_from_file(path), std::runtime_error);
}

TEST_F(EmailLoaderTest, RejectsMissingFileAndBadJson) {
    EXPECT_THROW(mailrlm::dataset::load_emails_from_file(dir_ / "absent.json"), std::runtime_error);

    auto path = dir_ / "broken.json";
    write_text(path, "{\"status\": \"success\", ");
    EXPECT_THROW(mailrlm::dataset::load_emails_from_file(path), std::runtime_error);
}

TEST(EmailJsonTest, UsesThreadIdKey) {
    nlohmann::json j = make_email("x", "hello");
    EXPECT_EQ(j.at("threadId"), "t-x");
    EXPECT_EQ(j.at("id"), "x");
    EXPECT_EQ(j.get<Email>(), make_email("x", "hello"));
}

TEST(ChunkingTest, SplitsIntoFixedSizeChunks) {
    auto chunks = mailrlm::dataset::chunk_by_size(make_emails(45), 20);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size(), 20u);
    EXPECT_EQ(chunks[1].size(), 20u);
    EXPECT_EQ(chunks[2].size(), 5u);
    EXPECT_EQ(chunks[2].front().id, std::optional<std::string>("m40"));
}

TEST(ChunkingTest, EmptyInputYieldsNoChunks) {
    EXPECT_TRUE(mailrlm::dataset::chunk_by_size({}, 5).empty());
}

TEST(ChunkingTest, ZeroChunkSizeThrows) {
    EXPECT_THROW(mailrlm::dataset::chunk_by_size(make_emails(3), 0), std::invalid_argument);
}

TEST(ChunkingTest, SummaryListsPresentFields) {
    auto summary = mailrlm::dataset::extract_email_summary(make_email("x", "Quarterly report"));
    EXPECT_EQ(summary,
              "From: alice@example.com\n"
              "Subject: Quarterly report\n"
              "Date: Mon, 1 Jan 2024\n"
              "Preview: preview of Quarterly report");

    Email sparse;
    sparse.subject = "Only subject";
    EXPECT_EQ(mailrlm::dataset::extract_email_summary(sparse), "Subject: Only subject");
}

TEST(ChunkingTest, BatchSummariesAreNumbered) {
    auto text = mailrlm::dataset::batch_extract_summaries(make_emails(2), 4000);
    EXPECT_TRUE(text.starts_with("[1] From: alice@example.com"));
    EXPECT_NE(text.find("\n\n[2] From: alice@example.com"), std::string::npos);
}

TEST(ChunkingTest, BatchSummariesStopAtBudget) {
    auto emails = make_emails(50);
    auto text = mailrlm::dataset::batch_extract_summaries(emails, 500);

    EXPECT_NE(text.find("[1] "), std::string::npos);
    EXPECT_EQ(text.find("[50] "), std::string::npos);
    EXPECT_NE(text.find("more emails"), std::string::npos);
}

TEST(ChunkingTest, AggregateSkipsBlankResults) {
    std::vector<std::string> results{"  first  ", "", "\n", "second"};
    EXPECT_EQ(mailrlm::dataset::aggregate_results(results), "first\n\n---\n\nsecond");
    EXPECT_EQ(mailrlm::dataset::aggregate_results(results, " | "), "first | second");
}

TEST(ChunkingTest, DeduplicateKeepsFirstOccurrence) {
    auto a = make_email("a", "one");
    auto b = make_email("b", "two");
    auto a_again = make_email("a", "duplicate");
    Email anonymous;
    anonymous.subject = "no id";

    auto unique = mailrlm::dataset::deduplicate_emails({a, b, a_again, anonymous, anonymous});

    ASSERT_EQ(unique.size(), 4u);
    EXPECT_EQ(unique[0].subject, "one");
    EXPECT_EQ(unique[1].subject, "two");
    EXPECT_EQ(unique[2].subject, "no id");
}

TEST(ChunkingTest, DeduplicateKeepsEmptyIds) {
    auto blank = make_email("", "blank one");
    auto blank_again = make_email("", "blank two");

    auto unique = mailrlm::dataset::deduplicate_emails({blank, blank_again});

    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[1].subject, "blank two");
}

namespace {

Email from_sender(const std::string& id, const std::string& from, const std::string& date = "") {
    auto email = make_email(id, "Subject " + id);
    email.from = from;
    email.date = date;
    return email;
}

} // namespace

TEST(GroupingTest, SenderAddressPrefersAngleBrackets) {
    EXPECT_EQ(mailrlm::dataset::sender_address(from_sender("1", "Bob Smith <Bob@Corp.COM>")), "bob@corp.com");
    EXPECT_EQ(mailrlm::dataset::sender_address(from_sender("2", "  Carol@Home.org ")), "carol@home.org");
    EXPECT_EQ(mailrlm::dataset::sender_address(from_sender("3", "")), "(unknown)");
}

TEST(GroupingTest, ChunkBySenderKeepsInputOrderWithinGroups) {
    auto groups = mailrlm::dataset::chunk_by_sender({
        from_sender("1", "Bob <bob@corp.com>"),
        from_sender("2", "alice@home.org"),
        from_sender("3", "BOB@corp.com"),
    });

    ASSERT_EQ(groups.size(), 2u);
    ASSERT_EQ(groups.at("bob@corp.com").size(), 2u);
    EXPECT_EQ(*groups.at("bob@corp.com")[0].id, "1");
    EXPECT_EQ(*groups.at("bob@corp.com")[1].id, "3");
    EXPECT_EQ(groups.at("alice@home.org").size(), 1u);
}

TEST(GroupingTest, ChunkBySenderDomain) {
    auto groups = mailrlm::dataset::chunk_by_sender_domain({
        from_sender("1", "Bob <bob@corp.com>"),
        from_sender("2", "carol@corp.com"),
        from_sender("3", "mailer-daemon"),
    });

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.at("corp.com").size(), 2u);
    EXPECT_EQ(groups.at("unknown").size(), 1u);
}

TEST(GroupingTest, ChunkByDatePeriods) {
    std::vector<Email> emails{
        from_sender("1", "a@x.com", "Wed, 14 Jan 2026 10:30:00 -0800"),
        from_sender("2", "a@x.com", "15 Jan 2026 23:30:00 -0800"),
        from_sender("3", "a@x.com", "2026-02-02 08:00:00"),
        from_sender("4", "a@x.com", "2026-01-15"),
        from_sender("5", "a@x.com", "last tuesday"),
    };

    auto by_day = mailrlm::dataset::chunk_by_date(emails, mailrlm::dataset::DatePeriod::Day);
    EXPECT_EQ(by_day.at("2026-01-14").size(), 1u);
    EXPECT_EQ(by_day.at("2026-01-15").size(), 2u);
    EXPECT_EQ(by_day.at("2026-02-02").size(), 1u);
    EXPECT_EQ(by_day.at(std::string(mailrlm::dataset::kUnknownDate)).size(), 1u);

    auto by_week = mailrlm::dataset::chunk_by_date(emails, mailrlm::dataset::DatePeriod::Week);
    EXPECT_EQ(by_week.at("2026-W02").size(), 3u);
    EXPECT_EQ(by_week.at("2026-W05").size(), 1u);

    auto by_month = mailrlm::dataset::chunk_by_date(emails, mailrlm::dataset::DatePeriod::Month);
    EXPECT_EQ(by_month.at("2026-01").size(), 3u);
    EXPECT_EQ(by_month.at("2026-02").size(), 1u);
}

TEST(GroupingTest, ParsesPeriodNames) {
    EXPECT_EQ(mailrlm::dataset::parse_date_period("week"), mailrlm::dataset::DatePeriod::Week);
    EXPECT_FALSE(mailrlm::dataset::parse_date_period("year").has_value());
}

TEST(GroupingTest, ChunkByThreadFallsBackToId) {
    auto threaded = make_email("1", "a");
    threaded.thread_id = "T";
    auto reply = make_email("2", "b");
    reply.thread_id = "T";
    auto lone = make_email("3", "c");
    lone.thread_id.clear();

    auto groups = mailrlm::dataset::chunk_by_thread({threaded, lone, reply});

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.at("T").size(), 2u);
    EXPECT_EQ(groups.at("3").size(), 1u);

    auto chunks = mailrlm::dataset::groups_to_chunks(groups);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(*chunks[0][0].id, "3");
    EXPECT_EQ(*chunks[1][0].id, "1");
}

TEST(FilteringTest, KeywordMatchesDefaultFieldsCaseInsensitively) {
    auto urgent = make_email("1", "URGENT: server down");
    auto body_hit = make_email("2", "status");
    body_hit.body = "this is urgent";
    auto from_only = make_email("3", "hello");
    from_only.from = "urgent@corp.com";

    auto hits = mailrlm::dataset::filter_by_keyword({urgent, body_hit, from_only}, "Urgent");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(*hits[0].id, "1");
    EXPECT_EQ(*hits[1].id, "2");

    auto by_from = mailrlm::dataset::filter_by_keyword({urgent, body_hit, from_only}, "urgent",
                                                       {mailrlm::dataset::EmailField::From});
    ASSERT_EQ(by_from.size(), 1u);
    EXPECT_EQ(*by_from[0].id, "3");
}

TEST(FilteringTest, SenderPatternIsSubstring) {
    auto hits = mailrlm::dataset::filter_by_sender({
        from_sender("1", "Bob <bob@Company.com>"),
        from_sender("2", "eve@other.net"),
    }, "@company.com");

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(*hits[0].id, "1");
}

TEST(FilteringTest, SortByDateNewestFirstWithUnparsableLast) {
    std::vector<Email> emails{
        from_sender("old", "a@x.com", "2026-01-01"),
        from_sender("junk", "a@x.com", "someday"),
        from_sender("new", "a@x.com", "Wed, 14 Jan 2026 10:30:00 +0000"),
        from_sender("mid", "a@x.com", "Mon, 05 Jan 2026 10:30:00 +0000"),
    };

    auto newest = mailrlm::dataset::sort_emails(emails);
    ASSERT_EQ(newest.size(), 4u);
    EXPECT_EQ(*newest[0].id, "new");
    EXPECT_EQ(*newest[1].id, "mid");
    EXPECT_EQ(*newest[2].id, "old");
    EXPECT_EQ(*newest[3].id, "junk");

    auto oldest = mailrlm::dataset::sort_emails(emails, mailrlm::dataset::SortKey::Date, false);
    EXPECT_EQ(*oldest[0].id, "old");
    EXPECT_EQ(*oldest[3].id, "junk");
}

TEST(FilteringTest, SortByDateHonorsZoneOffsets) {
    // 09:00 -0800 is 17:00 UTC, later than 12:00 +0000
    auto sorted = mailrlm::dataset::sort_emails({
        from_sender("utc", "a@x.com", "Wed, 14 Jan 2026 12:00:00 +0000"),
        from_sender("pst", "a@x.com", "Wed, 14 Jan 2026 09:00:00 -0800"),
    });

    EXPECT_EQ(*sorted[0].id, "pst");
}

TEST(FilteringTest, SortBySubjectIgnoresCase) {
    auto sorted = mailrlm::dataset::sort_emails({
        make_email("1", "beta"),
        make_email("2", "Alpha"),
        make_email("3", "gamma"),
    }, mailrlm::dataset::SortKey::Subject, false);

    EXPECT_EQ(*sorted[0].id, "2");
    EXPECT_EQ(*sorted[1].id, "1");
    EXPECT_EQ(*sorted[2].id, "3");
}

TEST(FilteringTest, TopSendersByCount) {
    std::vector<Email> emails{
        from_sender("1", "carol@x.com"),
        from_sender("2", "Bob <bob@x.com>"),
        from_sender("3", "bob@x.com"),
        from_sender("4", "dave@x.com"),
        from_sender("5", "bob@x.com"),
        from_sender("6", "dave@x.com"),
    };

    auto top = mailrlm::dataset::get_top_senders(emails, 2);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], (mailrlm::dataset::SenderCount{"bob@x.com", 3}));
    EXPECT_EQ(top[1], (mailrlm::dataset::SenderCount{"dave@x.com", 2}));
    EXPECT_EQ(mailrlm::dataset::get_top_senders(emails).size(), 3u);
}
