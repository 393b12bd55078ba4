#include "report/Aggregator.hxx"
#include "report/Outcome.hxx"
#include "site/Record.hxx"
#include "CaptureLog.hxx"

#include <gtest/gtest.h>

#include <memory>
#include <type_traits>

using std::string_view_literals::operator""sv;

static SiteRecord
MakeRecord(unsigned i)
{
	return {
		.path = "/var/www/site" + std::to_string(i),
		.owner = "alice",
		.method = SiteMethod::WP_CLI,
		.line = i,
	};
}

TEST(Aggregator, Format)
{
	EXPECT_EQ(FormatOutcome(JobOutcome::Success(MakeRecord(1),
						    std::chrono::seconds(3))),
		  "SUCCESS: /var/www/site1 (3s, wp-cli, user: alice)");

	EXPECT_EQ(FormatOutcome(JobOutcome::Failure(MakeRecord(2),
						    std::chrono::seconds(300),
						    "timeout after 300s")),
		  "FAILED: /var/www/site2 (300s, wp-cli, user: alice) - timeout after 300s");

	EXPECT_EQ(FormatOutcome(JobOutcome::Blocked(MakeRecord(3),
						    "Path traversal attempt blocked: /var/www/../etc")),
		  "SECURITY: /var/www/site3 (0s, wp-cli, user: alice) - Path traversal attempt blocked: /var/www/../etc");

	EXPECT_EQ(FormatOutcome(JobOutcome::Invalid(4, "/var/www/x", "bob",
						    "Unknown method \"cgi\"")),
		  "INVALID: registry line 4: /var/www/x (0s, ?, user: bob) - Unknown method \"cgi\"");

	/* a duplicate naming another owner must show that owner */
	EXPECT_EQ(FormatOutcome(JobOutcome::Invalid(3, "/var/www/a", "mallory",
						    "Duplicate registry entry")),
		  "INVALID: registry line 3: /var/www/a (0s, ?, user: mallory) - Duplicate registry entry");

	EXPECT_EQ(FormatOutcome(JobOutcome::Invalid(5, {}, {},
						    "Invalid registry line 5: expected path|user|method")),
		  "INVALID: registry line 5: ? (0s, ?, user: ?) - Invalid registry line 5: expected path|user|method");

	auto record = MakeRecord(6);
	record.method = SiteMethod::PHP_DIRECT;
	EXPECT_EQ(FormatOutcome(JobOutcome::Blocked(record,
						    "wp-config.php not found in /var/www/site6")),
		  "SECURITY: /var/www/site6 (0s, php-direct, user: alice) - wp-config.php not found in /var/www/site6");
}

TEST(Aggregator, Counts)
{
	CaptureLog log;
	OutcomeAggregator aggregator{log};

	aggregator.Add(JobOutcome::Success(MakeRecord(1), {}));
	aggregator.Add(JobOutcome::Success(MakeRecord(2), {}));
	aggregator.Add(JobOutcome::Failure(MakeRecord(3), {}, "exit status 1"));
	aggregator.Add(JobOutcome::Invalid(4, {}, {}, "bad"));

	EXPECT_EQ(log.lines.size(), 4u);
	EXPECT_EQ(log.lines[0].priority, LOG_INFO);
	EXPECT_EQ(log.lines[2].priority, LOG_WARNING);

	const auto s = aggregator.Finish(std::chrono::seconds(12));
	EXPECT_EQ(s.total, 4u);
	EXPECT_EQ(s.success, 2u);
	EXPECT_EQ(s.failure, 1u);
	EXPECT_EQ(s.blocked, 0u);
	EXPECT_EQ(s.invalid, 1u);
	EXPECT_EQ(s.success + s.failure + s.blocked + s.invalid, s.total);
	EXPECT_FALSE(s.alert);

	EXPECT_EQ(log.lines.size(), 5u);
	EXPECT_TRUE(log.Contains("completed in 12s"));
	EXPECT_TRUE(log.Contains("Success: 2, Failed: 1, Security Blocked: 0, Invalid: 1, Total Sites: 4"));
	EXPECT_EQ(log.Count("ALERT"sv), 0u);
}

TEST(Aggregator, AlertThreshold)
{
	EXPECT_FALSE(IsBlockedRatioAnomalous(0, 0));
	EXPECT_FALSE(IsBlockedRatioAnomalous(0, 10));
	EXPECT_FALSE(IsBlockedRatioAnomalous(1, 10));
	EXPECT_TRUE(IsBlockedRatioAnomalous(2, 10));
	EXPECT_TRUE(IsBlockedRatioAnomalous(1, 9));
	EXPECT_FALSE(IsBlockedRatioAnomalous(10, 100));
	EXPECT_TRUE(IsBlockedRatioAnomalous(11, 100));
}

TEST(Aggregator, Alert)
{
	CaptureLog log;
	OutcomeAggregator aggregator{log};

	for (unsigned i = 0; i < 8; ++i)
		aggregator.Add(JobOutcome::Success(MakeRecord(i), {}));
	aggregator.Add(JobOutcome::Blocked(MakeRecord(8), "x"));
	aggregator.Add(JobOutcome::Blocked(MakeRecord(9), "y"));

	EXPECT_EQ(log.lines.back().priority, LOG_NOTICE);

	const auto s = aggregator.Finish({});
	EXPECT_EQ(s.blocked, 2u);
	EXPECT_TRUE(s.alert);

	ASSERT_EQ(log.Count("ALERT"sv), 1u);
	EXPECT_EQ(log.lines.back().priority, LOG_ALERT);
}

TEST(Aggregator, AllSuccess)
{
	CaptureLog log;
	OutcomeAggregator aggregator{log};

	for (unsigned i = 0; i < 3; ++i)
		aggregator.Add(JobOutcome::Success(MakeRecord(i), {}));

	const auto s = aggregator.Finish({});
	EXPECT_EQ(s.success, 3u);
	EXPECT_EQ(s.failure, 0u);
	EXPECT_EQ(s.blocked, 0u);
	EXPECT_FALSE(s.alert);
}

TEST(Aggregator, SinkOwnership)
{
	static_assert(std::has_virtual_destructor_v<LogSink>);

	std::unique_ptr<LogSink> sink = std::make_unique<CaptureLog>();
	OutcomeAggregator aggregator{*sink};
	aggregator.Add(JobOutcome::Success(MakeRecord(1), {}));
	EXPECT_EQ(static_cast<CaptureLog &>(*sink).lines.size(), 1u);
}
