#include <stakeq/secure/pricing.hpp>
#include <stakeq/test_common/testutil.hpp>

#include <gtest/gtest.h>

using stakeq::test::fixed;
using stakeq::test::tokens;

TEST (pricing, log2_exact_powers)
{
	ASSERT_EQ (0, stakeq::pricing::log2 (fixed ("1")).value ());
	ASSERT_EQ (fixed ("1"), stakeq::pricing::log2 (fixed ("2")).value ());
	ASSERT_EQ (fixed ("3"), stakeq::pricing::log2 (fixed ("8")).value ());
	ASSERT_EQ (fixed ("10"), stakeq::pricing::log2 (fixed ("1024")).value ());
}

TEST (pricing, log2_fraction)
{
	// Truncated approximations of the real values
	ASSERT_EQ (stakeq::uint128_t ("263034405833793822"), stakeq::pricing::log2 (fixed ("1.2")).value ());
	ASSERT_EQ (stakeq::uint128_t ("1584962500721156166"), stakeq::pricing::log2 (fixed ("3")).value ());
	ASSERT_EQ (stakeq::uint128_t ("3321928094887362334"), stakeq::pricing::log2 (fixed ("10")).value ());
}

TEST (pricing, log2_below_one)
{
	ASSERT_FALSE (stakeq::pricing::log2 (fixed ("0.5")));
	ASSERT_FALSE (stakeq::pricing::log2 (0));
}

TEST (pricing, log_base)
{
	ASSERT_EQ (fixed ("1"), stakeq::pricing::log_base (stakeq::pricing::base).value ());
	ASSERT_EQ (stakeq::uint128_t ("3801784016923930442"), stakeq::pricing::log_base (fixed ("2")).value ());
	ASSERT_FALSE (stakeq::pricing::log_base (fixed ("1")));
}

TEST (pricing, cost)
{
	// log_1.2 (2) ~ 3.8
	ASSERT_EQ (19, stakeq::pricing::cost (fixed ("2"), 5).value ());
	ASSERT_EQ (stakeq::uint128_t ("19008920084619652210"), stakeq::pricing::cost (fixed ("2"), tokens (5)).value ());
	ASSERT_EQ (stakeq::uint128_t ("38017840169239304420"), stakeq::pricing::cost (fixed ("2"), tokens (10)).value ());
	ASSERT_EQ (tokens (7), stakeq::pricing::cost (stakeq::pricing::base, tokens (7)).value ());
	ASSERT_EQ (0, stakeq::pricing::cost (fixed ("2"), 0).value ());
}

TEST (pricing, invalid_weight)
{
	ASSERT_FALSE (stakeq::pricing::cost (0, tokens (1)));
	ASSERT_FALSE (stakeq::pricing::cost (fixed ("0.5"), tokens (1)));
	ASSERT_FALSE (stakeq::pricing::cost (fixed ("1"), tokens (1)));
	// Logarithm truncates to zero just above 1.0
	ASSERT_FALSE (stakeq::pricing::cost (stakeq::weight_unit + 1, tokens (1)));
	ASSERT_FALSE (stakeq::pricing::priority_from_stake (fixed ("1"), tokens (1)));
}

TEST (pricing, monotonic_in_priority)
{
	auto const weight = fixed ("1.5");
	stakeq::uint128_t previous{ 0 };
	for (uint64_t priority = 1; priority <= 50; ++priority)
	{
		auto cost = stakeq::pricing::cost (weight, tokens (priority)).value ();
		ASSERT_GT (cost, previous);
		previous = cost;
	}
}

TEST (pricing, monotonic_in_weight)
{
	auto const priority = tokens (3);
	stakeq::uint128_t previous{ 0 };
	for (uint64_t tenths = 11; tenths <= 100; ++tenths)
	{
		auto cost = stakeq::pricing::cost (stakeq::weight_unit / 10 * tenths, priority).value ();
		ASSERT_GT (cost, previous);
		previous = cost;
	}
}

TEST (pricing, priority_from_stake)
{
	auto const weight = fixed ("2");
	auto const priority = tokens (5);
	auto const cost = stakeq::pricing::cost (weight, priority).value ();
	auto const recovered = stakeq::pricing::priority_from_stake (weight, cost).value ();
	// Truncation in both directions loses at most a couple of raw units
	ASSERT_LE (recovered, priority);
	ASSERT_LE (priority - recovered, 2);
}

TEST (pricing, overflow)
{
	auto const max = std::numeric_limits<stakeq::uint128_t>::max ();
	ASSERT_THROW (stakeq::pricing::cost (fixed ("2"), max), std::overflow_error);
}
