#include <stakeq/lib/numbers.hpp>
#include <stakeq/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <unordered_set>

TEST (numbers, decode_dec)
{
	stakeq::uint128_t value;
	ASSERT_FALSE (stakeq::decode_dec ("0", value));
	ASSERT_EQ (0, value);
	ASSERT_FALSE (stakeq::decode_dec ("340282366920938463463374607431768211455", value));
	ASSERT_EQ (std::numeric_limits<stakeq::uint128_t>::max (), value);
	ASSERT_TRUE (stakeq::decode_dec ("340282366920938463463374607431768211456", value));
	ASSERT_TRUE (stakeq::decode_dec ("", value));
	ASSERT_TRUE (stakeq::decode_dec ("-1", value));
	ASSERT_TRUE (stakeq::decode_dec ("12a", value));
	ASSERT_TRUE (stakeq::decode_dec (" 1", value));
}

TEST (numbers, decode_fixed)
{
	stakeq::uint128_t value;
	ASSERT_FALSE (stakeq::decode_fixed ("1", value));
	ASSERT_EQ (stakeq::token_ratio, value);
	ASSERT_FALSE (stakeq::decode_fixed ("1.2", value));
	ASSERT_EQ (stakeq::uint128_t ("1200000000000000000"), value);
	ASSERT_FALSE (stakeq::decode_fixed ("0.000000000000000001", value));
	ASSERT_EQ (1, value);
	ASSERT_TRUE (stakeq::decode_fixed ("0.0000000000000000001", value));
	ASSERT_TRUE (stakeq::decode_fixed ("1.", value));
	ASSERT_TRUE (stakeq::decode_fixed (".5", value));
	ASSERT_TRUE (stakeq::decode_fixed ("1.2.3", value));
	ASSERT_TRUE (stakeq::decode_fixed ("", value));
}

TEST (numbers, decode_fixed_overflow)
{
	stakeq::uint128_t value;
	// 2^128 / 10^18 is about 3.4 * 10^20
	ASSERT_FALSE (stakeq::decode_fixed ("340282366920938463463", value));
	ASSERT_TRUE (stakeq::decode_fixed ("340282366920938463464", value));
}

TEST (numbers, to_string_fixed)
{
	ASSERT_EQ ("0", stakeq::to_string_fixed (0));
	ASSERT_EQ ("100", stakeq::to_string_fixed (stakeq::test::tokens (100)));
	ASSERT_EQ ("1.2", stakeq::to_string_fixed (stakeq::test::fixed ("1.2")));
	ASSERT_EQ ("0.000000000000000001", stakeq::to_string_fixed (1));
	ASSERT_EQ ("37.5", stakeq::to_string_fixed (stakeq::test::fixed ("37.50")));
}

TEST (numbers, narrow)
{
	auto const max = std::numeric_limits<stakeq::uint128_t>::max ();
	ASSERT_EQ (max, stakeq::narrow (stakeq::widen (max)));
	ASSERT_THROW (stakeq::narrow (stakeq::widen (max) + 1), std::overflow_error);
}

TEST (numbers, checked_arithmetic)
{
	auto const max = std::numeric_limits<stakeq::uint128_t>::max ();
	stakeq::uint128_t zero{ 0 };
	ASSERT_THROW (max + 1, std::overflow_error);
	ASSERT_THROW (zero - 1, std::range_error);
}

TEST (numbers, elapsed)
{
	ASSERT_EQ (0, stakeq::elapsed (5, 5));
	ASSERT_EQ (95, stakeq::elapsed (5, 100));
	ASSERT_THROW (stakeq::elapsed (100, 99), std::range_error);
}

TEST (account, text)
{
	stakeq::account account{ 0xabc };
	ASSERT_EQ ("acc_0000000000000abc", account.to_string ());

	stakeq::account decoded;
	ASSERT_FALSE (decoded.decode (account.to_string ()));
	ASSERT_EQ (account, decoded);

	ASSERT_FALSE (decoded.decode ("42"));
	ASSERT_EQ (stakeq::account{ 42 }, decoded);
}

TEST (account, decode_invalid)
{
	stakeq::account account;
	ASSERT_TRUE (account.decode (""));
	ASSERT_TRUE (account.decode ("acc_"));
	ASSERT_TRUE (account.decode ("acc_xyz"));
	ASSERT_TRUE (account.decode ("acc_00000000000000001"));
	ASSERT_TRUE (account.decode ("0x10"));
	ASSERT_TRUE (account.decode ("18446744073709551616"));
	ASSERT_TRUE (account.is_zero ());
}

TEST (account, ordering_and_hash)
{
	stakeq::account a{ 1 };
	stakeq::account b{ 2 };
	ASSERT_LT (a, b);
	ASSERT_NE (a, b);

	std::unordered_set<stakeq::account> accounts{ a, b, stakeq::account{ 1 } };
	ASSERT_EQ (2, accounts.size ());
}
