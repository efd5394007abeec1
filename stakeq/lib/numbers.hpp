#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace stakeq
{
/*
 * All value arithmetic goes through checked fixed width integers, overflow and
 * negative results throw instead of wrapping
 */
using uint128_t = boost::multiprecision::checked_uint128_t;
using uint256_t = boost::multiprecision::checked_uint256_t;

using seconds_t = uint64_t;
using external_id = uint64_t;

// Raw units per whole token
uint128_t const token_ratio = uint128_t ("1000000000000000000"); // 10^18
// Fixed point representation of weight 1.0
uint128_t const weight_unit = uint128_t ("1000000000000000000"); // 10^18

std::string to_string (uint128_t const &);
std::string to_string (uint256_t const &);

/** Parses a decimal string, returns true on error */
bool decode_dec (std::string const &, uint128_t &);

/** Parses a decimal with up to 18 fractional digits scaled by 10^18 ("1.5" -> 1500000000000000000), returns true on error */
bool decode_fixed (std::string const &, uint128_t &);
/** Formats a value scaled by 10^18 as a decimal, trailing fractional zeros are dropped */
std::string to_string_fixed (uint128_t const &);

/** Converts to 128 bits, throws std::overflow_error if the value does not fit */
uint128_t narrow (uint256_t const &);
uint256_t widen (uint128_t const &);

/** Elapsed time between two samples, throws std::range_error if `later` precedes `earlier` */
seconds_t elapsed (seconds_t earlier, seconds_t later);

class account final
{
public:
	account () = default;
	account (uint64_t value_a) :
		value{ value_a }
	{
	}

	uint64_t number () const
	{
		return value;
	}

	bool is_zero () const
	{
		return value == 0;
	}

	/** Textual form, `acc_` followed by 16 hex digits */
	std::string to_string () const;
	/** Parses the textual form or a plain decimal number, returns true on error */
	bool decode (std::string const &);

	auto operator<=> (account const &) const = default;

private:
	uint64_t value{ 0 };
};
}

namespace std
{
template <>
struct hash<::stakeq::account>
{
	size_t operator() (::stakeq::account const & account_a) const
	{
		return std::hash<uint64_t> () (account_a.number ());
	}
};
}
