#include "load/Throttle.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(Throttle, ParseCpuTimes)
{
	const auto t = ParseCpuTimes("cpu  100 20 30 400 50 6 7 8 9 10"sv);
	ASSERT_TRUE(t);
	/* guest and guest_nice are not added again */
	EXPECT_EQ(t->total, 100u + 20 + 30 + 400 + 50 + 6 + 7 + 8);
	EXPECT_EQ(t->idle, 400u + 50);

	/* old kernels without iowait etc. */
	const auto old = ParseCpuTimes("cpu 1 2 3 4"sv);
	ASSERT_TRUE(old);
	EXPECT_EQ(old->total, 10u);
	EXPECT_EQ(old->idle, 4u);

	EXPECT_FALSE(ParseCpuTimes("cpu0 1 2 3 4 5 6 7 8"sv));
	EXPECT_FALSE(ParseCpuTimes("intr 12345"sv));
	EXPECT_FALSE(ParseCpuTimes("cpu 1 2"sv));
	EXPECT_FALSE(ParseCpuTimes("cpu 1 x 3 4"sv));
}

TEST(Throttle, FindCpuTimes)
{
	const auto t = FindCpuTimes("intr 1 2 3\n"
				    "cpu  10 0 10 80 0 0 0 0 0 0\n"
				    "cpu0 5 0 5 40 0 0 0 0 0 0\n"sv);
	ASSERT_TRUE(t);
	EXPECT_EQ(t->total, 100u);
	EXPECT_EQ(t->idle, 80u);

	EXPECT_FALSE(FindCpuTimes("ctxt 1\n"sv));
}

TEST(Throttle, CalculateBusyPercent)
{
	const CpuTimes a{1000, 800};

	EXPECT_DOUBLE_EQ(CalculateBusyPercent(a, {1100, 890}), 10.);
	EXPECT_DOUBLE_EQ(CalculateBusyPercent(a, {1100, 800}), 100.);
	EXPECT_DOUBLE_EQ(CalculateBusyPercent(a, {1100, 900}), 0.);

	/* no time has passed */
	EXPECT_DOUBLE_EQ(CalculateBusyPercent(a, a), 0.);
}

TEST(Throttle, ParseLoadAverage)
{
	const auto l = ParseLoadAverage("1.25 0.80 0.50 2/345 6789\n"sv);
	ASSERT_TRUE(l);
	EXPECT_DOUBLE_EQ(*l, 1.25);

	EXPECT_FALSE(ParseLoadAverage(""sv));
	EXPECT_FALSE(ParseLoadAverage("abc"sv));
}

TEST(Throttle, Evaluate)
{
	const ThrottleConfig config;

	auto s = EvaluateThrottle(config, 10, 0.5, 4);
	EXPECT_FALSE(s.throttle);
	EXPECT_TRUE(s.reason.empty());

	/* the threshold itself is not exceeded */
	EXPECT_FALSE(EvaluateThrottle(config, 80, 8, 4).throttle);

	s = EvaluateThrottle(config, 95, 0.5, 4);
	EXPECT_TRUE(s.throttle);
	EXPECT_NE(s.reason.find("CPU"), s.reason.npos);

	s = EvaluateThrottle(config, 10, 8.5, 4);
	EXPECT_TRUE(s.throttle);
	EXPECT_NE(s.reason.find("Load average"), s.reason.npos);

	ThrottleConfig strict;
	strict.cpu_threshold = 20;
	strict.load_factor = 1;
	EXPECT_TRUE(EvaluateThrottle(strict, 25, 0, 4).throttle);
	EXPECT_TRUE(EvaluateThrottle(strict, 0, 4.5, 4).throttle);
}

TEST(Throttle, CountUsableCpus)
{
	EXPECT_GE(CountUsableCpus(), 1u);
}
