#pragma once

#include <stakeq/lib/numbers.hpp>

#include <optional>

namespace stakeq::pricing
{
/** Logarithm base used for weights, 1.2 in 18 decimal fixed point */
stakeq::uint128_t const base = stakeq::uint128_t ("1200000000000000000");

/**
 * Binary logarithm of \p x in 18 decimal fixed point, truncated toward zero.
 * Returns std::nullopt when x is below 1.0 where the result would be negative.
 */
std::optional<stakeq::uint128_t> log2 (stakeq::uint128_t const & x);

/** Logarithm of \p x in base 1.2, fixed point, truncated. std::nullopt unless the result is strictly positive. */
std::optional<stakeq::uint128_t> log_base (stakeq::uint128_t const & x);

/**
 * Stake required to hold \p priority at \p weight: log_1.2(weight) * priority, truncated.
 * Returns std::nullopt if the weight is not above 1.0. Throws std::overflow_error if the result does not fit.
 */
std::optional<stakeq::uint128_t> cost (stakeq::uint128_t const & weight, stakeq::uint128_t const & priority);

/** Approximate inverse of cost: staked / log_1.2(weight), truncated */
std::optional<stakeq::uint128_t> priority_from_stake (stakeq::uint128_t const & weight, stakeq::uint128_t const & staked);
}
