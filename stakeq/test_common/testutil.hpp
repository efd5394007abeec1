#pragma once

#include <stakeq/lib/numbers.hpp>

#include <stdexcept>
#include <string>

namespace stakeq::test
{
/** Whole tokens in raw units */
inline stakeq::uint128_t tokens (uint64_t count)
{
	return stakeq::token_ratio * count;
}

/** Parses an 18 decimal fixed point literal such as "1.2" */
inline stakeq::uint128_t fixed (std::string const & text)
{
	stakeq::uint128_t result;
	if (stakeq::decode_fixed (text, result))
	{
		throw std::invalid_argument ("invalid fixed point literal: " + text);
	}
	return result;
}
}
