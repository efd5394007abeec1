#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/secure/ledger.hpp>
#include <stakeq/test_common/testutil.hpp>

#include <gtest/gtest.h>

using stakeq::test::tokens;

namespace
{
class ledger_context final
{
public:
	explicit ledger_context (stakeq::ledger_constants const & constants = {}) :
		logger{ stakeq::log_config::tests_default () },
		ledger{ constants, stats, logger }
	{
	}

	bool balanced () const
	{
		auto const recomputed = ledger.settled_total () + ledger.escrowed () + ledger.destroyed () == ledger.accrued_supply ();
		return recomputed && ledger.balanced ();
	}

	stakeq::logger logger;
	stakeq::stats stats;
	stakeq::ledger ledger;
};
}

TEST (ledger, empty)
{
	ledger_context ctx;
	ASSERT_EQ (0, ctx.ledger.account_count ());
	ASSERT_TRUE (ctx.ledger.accounts ().empty ());
	ASSERT_FALSE (ctx.ledger.is_registered (1));
	ASSERT_FALSE (ctx.ledger.account_info (1));
	ASSERT_EQ (0, ctx.ledger.live_regular_balance (1, 100));
	ASSERT_EQ (0, ctx.ledger.accrued_supply ());
}

TEST (ledger, register_account)
{
	ledger_context ctx;
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.register_account (7, 50));
	ASSERT_TRUE (ctx.ledger.is_registered (7));
	auto info = ctx.ledger.account_info (7);
	ASSERT_TRUE (info);
	ASSERT_TRUE (info->registered);
	ASSERT_EQ (50, info->registration_time);
	ASSERT_EQ (50, info->last_checkpoint);
	ASSERT_EQ (0, info->regular);
	ASSERT_EQ (0, info->restricted);

	// A second registration is rejected and leaves the record untouched
	ASSERT_EQ (stakeq::stake_status::already_registered, ctx.ledger.register_account (7, 80));
	ASSERT_EQ (info, ctx.ledger.account_info (7));
}

TEST (ledger, accrual)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ASSERT_EQ (tokens (100), ctx.ledger.live_regular_balance (1, 100));
	ASSERT_EQ (tokens (50), ctx.ledger.live_restricted_balance (1, 100));
}

TEST (ledger, accrual_partial_interval)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	// Pro rata between interval boundaries
	ASSERT_EQ (tokens (3), ctx.ledger.live_regular_balance (1, 3));
	ASSERT_EQ (stakeq::test::fixed ("1.5"), ctx.ledger.live_restricted_balance (1, 3));
	ASSERT_EQ (0, ctx.ledger.live_regular_balance (1, 0));
}

TEST (ledger, views_are_pure)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	auto before = ctx.ledger.account_info (1);
	ASSERT_EQ (ctx.ledger.live_regular_balance (1, 100), ctx.ledger.live_regular_balance (1, 100));
	ASSERT_EQ (before, ctx.ledger.account_info (1));
	ASSERT_EQ (0, ctx.ledger.accrued_supply ());
}

TEST (ledger, checkpoint)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ctx.ledger.checkpoint (1, 40);
	auto info = ctx.ledger.account_info (1);
	ASSERT_EQ (40, info->last_checkpoint);
	ASSERT_EQ (tokens (40), info->regular);
	ASSERT_EQ (tokens (20), info->restricted);
	ASSERT_EQ (tokens (60), ctx.ledger.accrued_supply ());

	// Checkpointing changes no live balance
	ASSERT_EQ (tokens (100), ctx.ledger.live_regular_balance (1, 100));
	ASSERT_EQ (tokens (50), ctx.ledger.live_restricted_balance (1, 100));

	// Unregistered accounts are ignored
	ctx.ledger.checkpoint (2, 40);
	ASSERT_FALSE (ctx.ledger.account_info (2));
	ASSERT_TRUE (ctx.balanced ());
}

TEST (ledger, time_backwards)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ctx.ledger.checkpoint (1, 100);
	ASSERT_THROW (ctx.ledger.live_regular_balance (1, 99), std::range_error);
	ASSERT_THROW (ctx.ledger.checkpoint (1, 99), std::range_error);
	ASSERT_EQ (100, ctx.ledger.account_info (1)->last_checkpoint);
}

TEST (ledger, transfer_restricted_first)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ctx.ledger.register_account (2, 100);
	// A: restricted 50, regular 100
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 2, tokens (30), 100));

	ASSERT_EQ (tokens (20), ctx.ledger.live_restricted_balance (1, 100));
	ASSERT_EQ (tokens (100), ctx.ledger.live_regular_balance (1, 100));
	ASSERT_EQ (tokens (30), ctx.ledger.live_restricted_balance (2, 100));
	ASSERT_EQ (0, ctx.ledger.live_regular_balance (2, 100));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::ledger, stakeq::stat::detail::restricted_moved));
	ASSERT_TRUE (ctx.balanced ());
}

TEST (ledger, transfer_spills_into_regular)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ctx.ledger.register_account (2, 100);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 2, tokens (80), 100));

	ASSERT_EQ (0, ctx.ledger.live_restricted_balance (1, 100));
	ASSERT_EQ (tokens (70), ctx.ledger.live_regular_balance (1, 100));
	ASSERT_EQ (tokens (50), ctx.ledger.live_restricted_balance (2, 100));
	ASSERT_EQ (tokens (30), ctx.ledger.live_regular_balance (2, 100));
	ASSERT_TRUE (ctx.balanced ());
}

TEST (ledger, transfer_settles_recipient)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ctx.ledger.register_account (2, 0);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 2, tokens (10), 20));
	auto info = ctx.ledger.account_info (2);
	ASSERT_EQ (20, info->last_checkpoint);
	ASSERT_EQ (tokens (20), info->regular);
	ASSERT_EQ (tokens (20), info->restricted);
	ASSERT_TRUE (ctx.balanced ());
}

TEST (ledger, transfer_rejections)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ASSERT_EQ (stakeq::stake_status::unregistered_sender, ctx.ledger.transfer (2, 1, 0, 10));
	ASSERT_EQ (stakeq::stake_status::unregistered_recipient, ctx.ledger.transfer (1, 2, 0, 10));

	auto before = ctx.ledger.account_info (1);
	ASSERT_EQ (stakeq::stake_status::insufficient_balance, ctx.ledger.transfer (1, 1, tokens (16), 10));
	ctx.ledger.register_account (3, 10);
	ASSERT_EQ (stakeq::stake_status::insufficient_balance, ctx.ledger.transfer (1, 3, tokens (15) + 1, 10));
	// Rejections do not checkpoint
	ASSERT_EQ (before, ctx.ledger.account_info (1));
	ASSERT_EQ (0, ctx.ledger.accrued_supply ());
}

TEST (ledger, transfer_everything)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ctx.ledger.register_account (2, 10);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 2, tokens (15), 10));
	ASSERT_EQ (0, ctx.ledger.live_regular_balance (1, 10));
	ASSERT_EQ (0, ctx.ledger.live_restricted_balance (1, 10));
	ASSERT_TRUE (ctx.balanced ());
}

TEST (ledger, transfer_self)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 1, tokens (12), 10));
	ASSERT_EQ (tokens (10), ctx.ledger.live_regular_balance (1, 10));
	ASSERT_EQ (tokens (5), ctx.ledger.live_restricted_balance (1, 10));
	ASSERT_EQ (10, ctx.ledger.account_info (1)->last_checkpoint);
	ASSERT_TRUE (ctx.balanced ());
}

TEST (ledger, burn_mint_destroy)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	// Only the regular balance can be burned
	ASSERT_EQ (stakeq::stake_status::insufficient_balance, ctx.ledger.burn (1, tokens (11), 10));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.burn (1, tokens (10), 10));
	ASSERT_EQ (0, ctx.ledger.live_regular_balance (1, 10));
	ASSERT_EQ (tokens (5), ctx.ledger.live_restricted_balance (1, 10));
	ASSERT_EQ (tokens (10), ctx.ledger.escrowed ());
	ASSERT_TRUE (ctx.balanced ());

	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.mint (1, tokens (4), 10));
	ASSERT_EQ (tokens (4), ctx.ledger.live_regular_balance (1, 10));
	ASSERT_EQ (tokens (6), ctx.ledger.escrowed ());

	ctx.ledger.destroy (tokens (6));
	ASSERT_EQ (0, ctx.ledger.escrowed ());
	ASSERT_EQ (tokens (6), ctx.ledger.destroyed ());
	ASSERT_TRUE (ctx.balanced ());

	ASSERT_EQ (stakeq::stake_status::unregistered, ctx.ledger.burn (2, 0, 10));
	ASSERT_EQ (stakeq::stake_status::unregistered, ctx.ledger.mint (2, 0, 10));
}

TEST (ledger, balanced_after_every_commit)
{
	ledger_context ctx;
	ASSERT_TRUE (ctx.ledger.balanced ());
	ctx.ledger.register_account (1, 0);
	ctx.ledger.register_account (2, 0);
	ASSERT_TRUE (ctx.ledger.balanced ());

	ctx.ledger.checkpoint (1, 10);
	ASSERT_TRUE (ctx.ledger.balanced ());
	ASSERT_EQ (tokens (15), ctx.ledger.accrued_supply ());

	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 1, tokens (3), 20));
	ASSERT_TRUE (ctx.ledger.balanced ());
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.transfer (1, 2, tokens (12), 20));
	ASSERT_TRUE (ctx.ledger.balanced ());
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.burn (2, tokens (20), 20));
	ASSERT_TRUE (ctx.ledger.balanced ());
	ASSERT_EQ (stakeq::stake_status::ok, ctx.ledger.mint (1, tokens (5), 30));
	ASSERT_TRUE (ctx.ledger.balanced ());
	ctx.ledger.destroy (tokens (15));
	ASSERT_TRUE (ctx.ledger.balanced ());

	ASSERT_EQ (0, ctx.ledger.escrowed ());
	ASSERT_EQ (tokens (15), ctx.ledger.destroyed ());
	ASSERT_EQ (ctx.ledger.settled_total () + tokens (15), ctx.ledger.accrued_supply ());
}

TEST (ledger, mint_beyond_escrow)
{
	ledger_context ctx;
	ctx.ledger.register_account (1, 0);
	ASSERT_THROW (ctx.ledger.mint (1, 1, 10), std::range_error);
	ASSERT_EQ (0, ctx.ledger.live_regular_balance (1, 0));
	ASSERT_EQ (0, ctx.ledger.account_info (1)->last_checkpoint);
}

TEST (ledger, accrual_overflow)
{
	stakeq::ledger_constants constants;
	constants.interval = 1;
	constants.regular_rate = std::numeric_limits<stakeq::uint128_t>::max () / 2;
	ledger_context ctx{ constants };
	ctx.ledger.register_account (1, 0);
	ASSERT_EQ (constants.regular_rate * 2, ctx.ledger.live_regular_balance (1, 2));
	ASSERT_THROW (ctx.ledger.live_regular_balance (1, 3), std::overflow_error);
	ASSERT_THROW (ctx.ledger.burn (1, 0, 3), std::overflow_error);
	ASSERT_EQ (0, ctx.ledger.account_info (1)->last_checkpoint);
}

TEST (ledger, accounts_sorted)
{
	ledger_context ctx;
	ctx.ledger.register_account (30, 0);
	ctx.ledger.register_account (10, 0);
	ctx.ledger.register_account (20, 0);
	std::vector<stakeq::account> expected{ 10, 20, 30 };
	ASSERT_EQ (expected, ctx.ledger.accounts ());
	ASSERT_EQ (3, ctx.ledger.account_count ());
}
