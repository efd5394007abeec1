#include <stakeq/lib/stats.hpp>
#include <stakeq/node/registry.hpp>
#include <stakeq/secure/pricing.hpp>
#include <stakeq/test_common/random.hpp>
#include <stakeq/test_common/registry_context.hpp>
#include <stakeq/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_set>

using stakeq::test::fixed;
using stakeq::test::tokens;

namespace
{
/** Checks ordering, positions and unique presence of every live entry */
testing::AssertionResult queue_consistent (stakeq::registry const & registry)
{
	auto contents = registry.queue_contents ();
	std::unordered_set<stakeq::external_id> seen;
	for (std::size_t position = 0; position < contents.size (); ++position)
	{
		auto const & entry = contents[position];
		if (!seen.insert (entry.id).second)
		{
			return testing::AssertionFailure () << "duplicate id " << entry.id;
		}
		if (position > 0 && entry.ranks_ahead_of (contents[position - 1]))
		{
			return testing::AssertionFailure () << "unsorted at " << position << ": " << entry.to_string ();
		}
		if (registry.queue_position (entry.id) != position)
		{
			return testing::AssertionFailure () << "position mismatch for " << entry.id;
		}
	}
	if (contents.size () != registry.queue_size ())
	{
		return testing::AssertionFailure () << "size mismatch";
	}
	return testing::AssertionSuccess ();
}
}

TEST (registry, register_wallet)
{
	stakeq::test::registry_context ctx;
	ASSERT_FALSE (ctx.registry.is_registered (1));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.register_wallet (1, 10));
	ASSERT_TRUE (ctx.registry.is_registered (1));
	ASSERT_EQ (stakeq::stake_status::already_registered, ctx.registry.register_wallet (1, 20));
	ASSERT_EQ (10, ctx.registry.account_info (1)->registration_time);

	ASSERT_EQ (1, ctx.events.wallet_registered.size ());
	ASSERT_EQ (stakeq::account{ 1 }, ctx.events.wallet_registered[0].wallet);
	ASSERT_EQ (10, ctx.events.wallet_registered[0].time);

	ASSERT_EQ (2, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::register_wallet));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::already_registered));
}

TEST (registry, registered_accounts)
{
	stakeq::test::registry_context ctx;
	ctx.add_account (3);
	ctx.add_account (1);
	ctx.add_account (2);
	std::vector<stakeq::account> expected{ 1, 2, 3 };
	ASSERT_EQ (expected, ctx.registry.registered_accounts ());
}

TEST (registry, accrual_scenario)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1, 1000);
	ASSERT_EQ (tokens (100), ctx.registry.live_regular_balance (account, 1100));
	ASSERT_EQ (tokens (50), ctx.registry.live_restricted_balance (account, 1100));
}

TEST (registry, transfer_scenario)
{
	stakeq::test::registry_context ctx;
	auto a = ctx.add_account (1);
	auto b = ctx.add_account (2);
	auto b_restricted = ctx.registry.live_restricted_balance (b, 100);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.transfer (a, b, tokens (30), 100));
	ASSERT_EQ (tokens (20), ctx.registry.live_restricted_balance (a, 100));
	ASSERT_EQ (tokens (100), ctx.registry.live_regular_balance (a, 100));
	ASSERT_EQ (b_restricted + tokens (30), ctx.registry.live_restricted_balance (b, 100));
	ASSERT_TRUE (ctx.supply_balanced ());
}

TEST (registry, set_controller)
{
	stakeq::test::registry_context ctx;
	auto const owner = stakeq::test::registry_context::owner;
	auto const previous = stakeq::test::registry_context::controller;
	ASSERT_EQ (owner, ctx.registry.owner ());
	ASSERT_EQ (previous, ctx.registry.controller ());

	ASSERT_EQ (stakeq::stake_status::not_owner, ctx.registry.set_controller (previous, 5));
	ASSERT_EQ (previous, ctx.registry.controller ());
	ASSERT_TRUE (ctx.events.controller_changed.empty ());

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.set_controller (owner, 5));
	ASSERT_EQ (stakeq::account{ 5 }, ctx.registry.controller ());
	ASSERT_EQ (1, ctx.events.controller_changed.size ());
	ASSERT_EQ (previous, ctx.events.controller_changed[0].previous);
	ASSERT_EQ (stakeq::account{ 5 }, ctx.events.controller_changed[0].controller);

	// Only the new controller can dequeue
	ASSERT_EQ (stakeq::stake_status::not_authorized, ctx.registry.dequeue_item (previous, 0).status);
	ASSERT_EQ (stakeq::stake_status::queue_empty, ctx.registry.dequeue_item (5, 0).status);
}

TEST (registry, accrual_overflow)
{
	auto config = stakeq::test::registry_context::default_config ();
	config.interval = 1;
	config.regular_rate = std::numeric_limits<stakeq::uint128_t>::max () / 2;
	stakeq::test::registry_context ctx{ config };
	auto account = ctx.add_account (1);
	auto other = ctx.add_account (2);

	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 3));
	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.transfer (account, other, 1, 3));
	ASSERT_EQ (0, ctx.registry.queue_size ());
	ASSERT_EQ (0, ctx.registry.account_info (account)->last_checkpoint);
	ASSERT_EQ (0, ctx.registry.supply ().accrued);
	// Registrations only
	ASSERT_EQ (2, ctx.events.names.size ());
	ASSERT_EQ (2, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::arithmetic_error));
}

TEST (registry, cost_overflow)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	auto const max = std::numeric_limits<stakeq::uint128_t>::max ();
	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.enter_queue (account, fixed ("2"), max, 1, 100));
	ASSERT_EQ (0, ctx.registry.queue_size ());
	ASSERT_EQ (tokens (100), ctx.registry.live_regular_balance (account, 100));
	ASSERT_TRUE (ctx.supply_balanced ());
}

TEST (registry, time_backwards)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 200));
	auto info = ctx.registry.account_info (account);

	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 2, 100));
	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (2), 1, 100));
	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.remove_stake_from_queue (account, 1, 100));
	ASSERT_EQ (info, ctx.registry.account_info (account));
	ASSERT_EQ (1, ctx.registry.queue_size ());
	ASSERT_THROW (ctx.registry.live_regular_balance (account, 100), std::range_error);
	ASSERT_TRUE (queue_consistent (ctx.registry));
}

TEST (registry, operation_stats)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));
	ASSERT_EQ (stakeq::stake_status::already_queued, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100).status);

	ASSERT_EQ (2, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::enter_queue));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::already_queued));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::dequeue));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::queue, stakeq::stat::detail::insert));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::queue, stakeq::stat::detail::pop));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::ledger, stakeq::stat::detail::burn));
}

TEST (registry, container_info)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));

	auto info = ctx.registry.container_info ();
	std::stringstream stream;
	info.print (stream, "registry");
	ASSERT_NE (std::string::npos, stream.str ().find ("entries"));
	ASSERT_NE (std::string::npos, stream.str ().find ("accounts"));
}

/*
 * Random sequences of operations keep the queue sorted, positions exact and the supply balanced
 */
TEST (registry, random_operations)
{
	stakeq::test::registry_context ctx;
	stakeq::test::random_generator rng{ 1234 };

	std::vector<stakeq::account> accounts;
	for (int i = 0; i < 8; ++i)
	{
		accounts.push_back (ctx.add_account (stakeq::test::random_account (rng)));
	}

	stakeq::seconds_t now = 0;
	for (int step = 0; step < 2000; ++step)
	{
		now += rng.random (uint64_t{ 0 }, uint64_t{ 5 });
		auto const & account = accounts[rng.random (accounts.size ())];
		auto const id = rng.random (uint64_t{ 0 }, uint64_t{ 40 });
		switch (rng.random (6))
		{
			case 0:
			case 1:
				ctx.registry.enter_queue (account, stakeq::test::random_weight (rng), stakeq::test::random_tokens (rng, 10), id, now);
				break;
			case 2:
				ctx.registry.change_stake_balance (account, stakeq::test::random_weight (rng), stakeq::test::random_tokens (rng, 10), id, now);
				break;
			case 3:
				ctx.registry.remove_stake_from_queue (account, id, now);
				break;
			case 4:
				ctx.registry.dequeue_item (stakeq::test::registry_context::controller, now);
				break;
			case 5:
				ctx.registry.transfer (account, accounts[rng.random (accounts.size ())], stakeq::test::random_tokens (rng, 20), now);
				break;
		}
		ASSERT_TRUE (queue_consistent (ctx.registry)) << "step " << step << " seed " << rng.seed;
		ASSERT_TRUE (ctx.supply_balanced ()) << "step " << step << " seed " << rng.seed;
	}
	ASSERT_EQ (0, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::arithmetic_error));
}

TEST (registry, concurrent_operations)
{
	stakeq::test::registry_context ctx;
	std::vector<stakeq::account> accounts;
	for (uint64_t i = 1; i <= 4; ++i)
	{
		accounts.push_back (ctx.add_account (i));
	}

	// Every thread uses its own ids, timestamps are shared so calls stay monotonic per account
	std::vector<std::thread> threads;
	for (std::size_t n = 0; n < accounts.size (); ++n)
	{
		threads.emplace_back ([&ctx, &accounts, n] () {
			auto const account = accounts[n];
			for (uint64_t i = 0; i < 200; ++i)
			{
				auto const id = n * 1000 + i;
				auto const now = 1000 + i;
				ctx.registry.enter_queue (account, fixed ("1.5"), tokens (1 + i % 7), id, now);
				if (i % 3 == 0)
				{
					ctx.registry.remove_stake_from_queue (account, id, now);
				}
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}

	ASSERT_TRUE (queue_consistent (ctx.registry));
	ASSERT_TRUE (ctx.supply_balanced ());
	ASSERT_EQ (ctx.registry.supply ().locked, ctx.registry.supply ().escrowed);
}

/*
 * Observers run after the operation committed, their exceptions reach the caller instead of becoming a status
 */
TEST (registry, observer_exception_after_commit)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (3), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (2), 2, 100));
	ctx.events.clear ();

	bool throwing{ true };
	ctx.registry.notifications.stake_changed.add ([&throwing] (stakeq::event::stake_changed const &) {
		if (throwing)
		{
			throw std::overflow_error ("observer");
		}
	});

	ASSERT_THROW (ctx.registry.change_stake_balance (account, fixed ("2"), tokens (4), 2, 100), std::overflow_error);
	ASSERT_EQ (tokens (4), ctx.registry.queue_entry (2)->priority);
	ASSERT_EQ (0, ctx.registry.queue_position (2));
	ASSERT_TRUE (ctx.supply_balanced ());
	ASSERT_TRUE (queue_consistent (ctx.registry));
	ASSERT_EQ (1, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::change_stake));
	ASSERT_EQ (0, ctx.stats.count (stakeq::stat::type::registry, stakeq::stat::detail::arithmetic_error));

	// Events after the throwing observer are dropped with the operation
	std::vector<std::string> names{ "stake_changed" };
	ASSERT_EQ (names, ctx.events.names);

	throwing = false;
	ctx.events.clear ();
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.remove_stake_from_queue (account, 1, 100));
	std::vector<std::string> removed{ "stake_removed" };
	ASSERT_EQ (removed, ctx.events.names);
	ASSERT_EQ (1, ctx.events.stake_removed[0].id);
}

TEST (registry, failed_operations_deliver_nothing)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));
	ctx.events.clear ();

	ASSERT_EQ (stakeq::stake_status::already_queued, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));
	ASSERT_EQ (stakeq::stake_status::not_in_queue, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (1), 2, 100));
	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.enter_queue (account, fixed ("2"), std::numeric_limits<stakeq::uint128_t>::max (), 2, 100));
	ASSERT_EQ (stakeq::stake_status::arithmetic_error, ctx.registry.remove_stake_from_queue (account, 1, 50));
	ASSERT_EQ (stakeq::stake_status::not_authorized, ctx.registry.dequeue_item (account, 100).status);
	ASSERT_EQ (stakeq::stake_status::already_registered, ctx.registry.register_wallet (account, 100));
	ASSERT_TRUE (ctx.events.names.empty ());

	// Nothing left behind for the next successful operation
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100).status);
	std::vector<std::string> names{ "item_dequeued" };
	ASSERT_EQ (names, ctx.events.names);
}
