#pragma once

#include <stakeq/lib/assert.hpp>
#include <stakeq/lib/numbers.hpp>

#include <random>

namespace stakeq::test
{
/**
 * Seeded generator so a failing randomized test replays the same sequence
 */
class random_generator final
{
public:
	explicit random_generator (uint64_t seed = 0x5eed);

	/// Generate a random number in the range [min, max)
	auto random (auto min, auto max)
	{
		release_assert (min < max);
		std::uniform_int_distribution<decltype (min)> dist (min, max - 1);
		return dist (rng);
	}

	/// Generate a random number in the range [0, max)
	auto random (auto max)
	{
		return random (decltype (max){ 0 }, max);
	}

	/// Generate a random number of type T
	template <typename T>
	T random ()
	{
		std::uniform_int_distribution<T> dist;
		return dist (rng);
	}

	uint64_t const seed;

private:
	std::mt19937_64 rng;
};

/*
 * Random generators
 */
stakeq::account random_account (stakeq::test::random_generator &);
/** Weight in (1.0, 1.0 + max_extra], 18 decimal fixed point */
stakeq::uint128_t random_weight (stakeq::test::random_generator &, uint64_t max_extra_milli = 4000);
/** Whole tokens in [1, max_tokens] in raw units */
stakeq::uint128_t random_tokens (stakeq::test::random_generator &, uint64_t max_tokens);
}
