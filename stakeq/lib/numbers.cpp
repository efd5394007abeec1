#include <stakeq/lib/numbers.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace
{
stakeq::uint256_t const max_uint128 = (stakeq::uint256_t{ 1 } << 128) - 1;
}

std::string stakeq::to_string (stakeq::uint128_t const & value)
{
	return value.str ();
}

std::string stakeq::to_string (stakeq::uint256_t const & value)
{
	return value.str ();
}

bool stakeq::decode_dec (std::string const & text, stakeq::uint128_t & result)
{
	bool error = text.empty () || text.size () > 39 || !std::all_of (text.begin (), text.end (), [] (unsigned char ch) { return std::isdigit (ch); });
	if (!error)
	{
		try
		{
			result = narrow (stakeq::uint256_t{ text.c_str () });
		}
		catch (std::overflow_error const &)
		{
			error = true;
		}
	}
	return error;
}

bool stakeq::decode_fixed (std::string const & text, stakeq::uint128_t & result)
{
	std::size_t const decimals = 18;
	auto const dot = text.find ('.');
	auto integer_part = text.substr (0, dot);
	auto fraction_part = dot == std::string::npos ? std::string{} : text.substr (dot + 1);

	bool error = integer_part.empty () || fraction_part.size () > decimals || (dot != std::string::npos && fraction_part.empty ());
	if (!error)
	{
		fraction_part.append (decimals - fraction_part.size (), '0');
		stakeq::uint128_t integer;
		stakeq::uint128_t fraction;
		error = decode_dec (integer_part, integer) || decode_dec (fraction_part, fraction);
		if (!error)
		{
			try
			{
				result = narrow (widen (integer) * widen (stakeq::token_ratio) + widen (fraction));
			}
			catch (std::overflow_error const &)
			{
				error = true;
			}
		}
	}
	return error;
}

std::string stakeq::to_string_fixed (stakeq::uint128_t const & value)
{
	auto const integer = value / stakeq::token_ratio;
	auto fraction = (value % stakeq::token_ratio).str ();
	if (fraction == "0")
	{
		return integer.str ();
	}
	fraction.insert (0, 18 - fraction.size (), '0');
	fraction.erase (fraction.find_last_not_of ('0') + 1);
	return integer.str () + "." + fraction;
}

stakeq::uint128_t stakeq::narrow (stakeq::uint256_t const & value)
{
	if (value > max_uint128)
	{
		throw std::overflow_error ("value does not fit in 128 bits: " + value.str ());
	}
	return static_cast<stakeq::uint128_t> (value);
}

stakeq::uint256_t stakeq::widen (stakeq::uint128_t const & value)
{
	return static_cast<stakeq::uint256_t> (value);
}

stakeq::seconds_t stakeq::elapsed (stakeq::seconds_t earlier, stakeq::seconds_t later)
{
	if (later < earlier)
	{
		throw std::range_error ("time moved backwards: " + std::to_string (later) + " < " + std::to_string (earlier));
	}
	return later - earlier;
}

std::string stakeq::account::to_string () const
{
	std::stringstream stream;
	stream << "acc_" << std::hex << std::setw (16) << std::setfill ('0') << value;
	return stream.str ();
}

bool stakeq::account::decode (std::string const & text)
{
	auto const hex = boost::algorithm::starts_with (text, "acc_");
	auto const digits = hex ? text.substr (4) : text;
	auto const base = hex ? 16 : 10;

	bool error = digits.empty () || (hex && digits.size () > 16);
	if (!error)
	{
		error = !std::all_of (digits.begin (), digits.end (), [hex] (unsigned char ch) { return hex ? std::isxdigit (ch) : std::isdigit (ch); });
	}
	if (!error)
	{
		try
		{
			value = std::stoull (digits, nullptr, base);
		}
		catch (std::out_of_range const &)
		{
			error = true;
		}
	}
	return error;
}
