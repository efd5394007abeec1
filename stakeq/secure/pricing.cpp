#include <stakeq/secure/pricing.hpp>

namespace
{
stakeq::uint256_t const unit = stakeq::widen (stakeq::weight_unit);

stakeq::uint256_t const & log2_of_base ()
{
	static stakeq::uint256_t const value = stakeq::widen (stakeq::pricing::log2 (stakeq::pricing::base).value ());
	return value;
}
}

std::optional<stakeq::uint128_t> stakeq::pricing::log2 (stakeq::uint128_t const & x)
{
	auto value = stakeq::widen (x);
	if (value < unit)
	{
		return std::nullopt;
	}

	// Integer part is the position of the most significant bit of x / 1.0
	auto const n = boost::multiprecision::msb (stakeq::uint256_t{ value / unit });
	stakeq::uint256_t result = unit * n;

	// Normalise into [1.0, 2.0)
	auto y = value >> n;
	if (y == unit)
	{
		return stakeq::narrow (result);
	}

	// Fractional bits by repeated squaring, each square doubles the exponent
	for (stakeq::uint256_t delta = unit / 2; delta > 0; delta /= 2)
	{
		y = y * y / unit;
		if (y >= unit * 2)
		{
			result += delta;
			y /= 2;
		}
	}
	return stakeq::narrow (result);
}

std::optional<stakeq::uint128_t> stakeq::pricing::log_base (stakeq::uint128_t const & x)
{
	auto log2_x = stakeq::pricing::log2 (x);
	if (!log2_x || log2_x->is_zero ())
	{
		return std::nullopt;
	}
	auto result = stakeq::widen (*log2_x) * unit / log2_of_base ();
	if (result.is_zero ())
	{
		return std::nullopt;
	}
	return stakeq::narrow (result);
}

std::optional<stakeq::uint128_t> stakeq::pricing::cost (stakeq::uint128_t const & weight, stakeq::uint128_t const & priority)
{
	auto log_weight = log_base (weight);
	if (!log_weight)
	{
		return std::nullopt;
	}
	return stakeq::narrow (stakeq::widen (*log_weight) * stakeq::widen (priority) / unit);
}

std::optional<stakeq::uint128_t> stakeq::pricing::priority_from_stake (stakeq::uint128_t const & weight, stakeq::uint128_t const & staked)
{
	auto log_weight = log_base (weight);
	if (!log_weight)
	{
		return std::nullopt;
	}
	return stakeq::narrow (stakeq::widen (staked) * unit / stakeq::widen (*log_weight));
}
