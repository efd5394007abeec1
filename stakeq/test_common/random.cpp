#include <stakeq/test_common/random.hpp>

stakeq::test::random_generator::random_generator (uint64_t seed_a) :
	seed{ seed_a },
	rng{ seed_a }
{
}

stakeq::account stakeq::test::random_account (stakeq::test::random_generator & rng)
{
	// Zero is never a valid participant
	return stakeq::account{ rng.random<uint64_t> () | 1 };
}

stakeq::uint128_t stakeq::test::random_weight (stakeq::test::random_generator & rng, uint64_t max_extra_milli)
{
	auto const extra_milli = rng.random (uint64_t{ 1 }, max_extra_milli + 1);
	return stakeq::weight_unit + stakeq::weight_unit / 1000 * extra_milli;
}

stakeq::uint128_t stakeq::test::random_tokens (stakeq::test::random_generator & rng, uint64_t max_tokens)
{
	return stakeq::token_ratio * rng.random (uint64_t{ 1 }, max_tokens + 1);
}
