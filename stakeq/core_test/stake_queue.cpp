#include <stakeq/node/registry.hpp>
#include <stakeq/secure/pricing.hpp>
#include <stakeq/test_common/registry_context.hpp>
#include <stakeq/test_common/testutil.hpp>

#include <gtest/gtest.h>

using stakeq::test::fixed;
using stakeq::test::tokens;

namespace
{
std::vector<stakeq::external_id> ids (std::vector<stakeq::stake_entry> const & entries)
{
	std::vector<stakeq::external_id> result;
	for (auto const & entry : entries)
	{
		result.push_back (entry.id);
	}
	return result;
}
}

TEST (stake_queue, construction)
{
	stakeq::test::registry_context ctx;
	ASSERT_EQ (0, ctx.registry.queue_size ());
	ASSERT_TRUE (ctx.registry.queue_contents ().empty ());
	ASSERT_FALSE (ctx.registry.queue_position (0));
	ASSERT_FALSE (ctx.registry.queue_entry (0));
}

TEST (stake_queue, enter_one)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 0, 100));

	// Id zero is a valid id at position zero
	ASSERT_EQ (0, ctx.registry.queue_position (0));
	auto entry = ctx.registry.queue_entry (0);
	ASSERT_TRUE (entry);
	ASSERT_EQ (account, entry->owner);
	ASSERT_EQ (fixed ("2"), entry->weight);
	ASSERT_EQ (tokens (5), entry->priority);
	ASSERT_EQ (stakeq::pricing::cost (fixed ("2"), tokens (5)), entry->staked);
	ASSERT_EQ (100, entry->timestamp);

	ASSERT_EQ (tokens (100) - entry->staked, ctx.registry.live_regular_balance (account, 100));
	ASSERT_EQ (tokens (50), ctx.registry.live_restricted_balance (account, 100));
}

TEST (stake_queue, higher_priority_first)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (10), 2, 100));

	ASSERT_EQ (0, ctx.registry.queue_position (2));
	ASSERT_EQ (1, ctx.registry.queue_position (1));
	std::vector<stakeq::external_id> expected{ 2, 1 };
	ASSERT_EQ (expected, ids (ctx.registry.queue_contents ()));
}

TEST (stake_queue, lower_weight_breaks_priority_tie)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("3"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("1.5"), tokens (5), 2, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 3, 100));

	std::vector<stakeq::external_id> expected{ 2, 3, 1 };
	ASSERT_EQ (expected, ids (ctx.registry.queue_contents ()));
}

TEST (stake_queue, earlier_timestamp_breaks_weight_tie)
{
	stakeq::test::registry_context ctx;
	auto account1 = ctx.add_account (1);
	auto account2 = ctx.add_account (2);
	auto account3 = ctx.add_account (3);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account1, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account2, fixed ("2"), tokens (5), 2, 110));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account3, fixed ("2"), tokens (5), 3, 105));

	std::vector<stakeq::external_id> expected{ 1, 3, 2 };
	ASSERT_EQ (expected, ids (ctx.registry.queue_contents ()));
}

TEST (stake_queue, identical_keys_keep_arrival_order)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	for (stakeq::external_id id = 10; id > 0; --id)
	{
		ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("1.2"), tokens (1), id, 100));
	}
	std::vector<stakeq::external_id> expected{ 10, 9, 8, 7, 6, 5, 4, 3, 2, 1 };
	ASSERT_EQ (expected, ids (ctx.registry.queue_contents ()));
}

TEST (stake_queue, enter_rejections)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::unregistered, ctx.registry.enter_queue (2, fixed ("2"), tokens (1), 1, 100));
	ASSERT_EQ (stakeq::stake_status::invalid_weight, ctx.registry.enter_queue (account, fixed ("1"), tokens (1), 1, 100));
	ASSERT_EQ (stakeq::stake_status::invalid_weight, ctx.registry.enter_queue (account, 0, tokens (1), 1, 100));
	// 30 tokens at weight 2 costs about 114 tokens, only 100 have accrued
	ASSERT_EQ (stakeq::stake_status::insufficient_balance, ctx.registry.enter_queue (account, fixed ("2"), tokens (30), 1, 100));
	ASSERT_EQ (0, ctx.registry.queue_size ());

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));
	ASSERT_EQ (stakeq::stake_status::already_queued, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 1, 100));
	ASSERT_EQ (1, ctx.registry.queue_size ());
	ASSERT_TRUE (ctx.supply_balanced ());
}

TEST (stake_queue, restricted_balance_not_spendable)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	auto other = ctx.add_account (2, 100);
	// Moves only restricted value
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.transfer (account, other, tokens (50), 100));
	ASSERT_EQ (0, ctx.registry.live_regular_balance (other, 100));
	ASSERT_EQ (tokens (50), ctx.registry.live_restricted_balance (other, 100));
	ASSERT_EQ (stakeq::stake_status::insufficient_balance, ctx.registry.enter_queue (other, fixed ("1.2"), tokens (1), 1, 100));
}

TEST (stake_queue, change_moves_up)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	for (stakeq::external_id id = 1; id <= 4; ++id)
	{
		ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5 - id), id, 100));
	}
	ctx.events.clear ();

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (5), 4, 100));
	std::vector<stakeq::external_id> expected{ 4, 1, 2, 3 };
	ASSERT_EQ (expected, ids (ctx.registry.queue_contents ()));

	std::vector<std::string> names{ "stake_changed", "queue_updated" };
	ASSERT_EQ (names, ctx.events.names);
	ASSERT_EQ (0, ctx.events.stake_changed[0].position);
	ASSERT_EQ (4, ctx.events.queue_updated[0].id);
	ASSERT_EQ (0, ctx.events.queue_updated[0].position);
	ASSERT_TRUE (ctx.supply_balanced ());
}

TEST (stake_queue, change_moves_down)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	for (stakeq::external_id id = 1; id <= 4; ++id)
	{
		ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5 - id), id, 100));
	}
	auto before = ctx.registry.live_regular_balance (account, 100);
	auto old_stake = ctx.registry.queue_entry (1)->staked;

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (1) / 2, 1, 100));
	std::vector<stakeq::external_id> expected{ 2, 3, 4, 1 };
	ASSERT_EQ (expected, ids (ctx.registry.queue_contents ()));

	// The difference is minted back
	auto new_stake = ctx.registry.queue_entry (1)->staked;
	ASSERT_EQ (before + (old_stake - new_stake), ctx.registry.live_regular_balance (account, 100));
	ASSERT_TRUE (ctx.supply_balanced ());
}

TEST (stake_queue, change_same_position)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (1), 2, 100));
	ctx.events.clear ();

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (6), 1, 110));
	std::vector<std::string> names{ "stake_changed" };
	ASSERT_EQ (names, ctx.events.names);
	ASSERT_EQ (110, ctx.registry.queue_entry (1)->timestamp);
	ASSERT_EQ (stakeq::pricing::cost (fixed ("2"), tokens (6)), ctx.events.stake_changed[0].staked);
}

TEST (stake_queue, change_rejections)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	auto other = ctx.add_account (2);
	ASSERT_EQ (stakeq::stake_status::not_in_queue, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	auto entry = ctx.registry.queue_entry (1);

	ASSERT_EQ (stakeq::stake_status::not_authorized, ctx.registry.change_stake_balance (other, fixed ("2"), tokens (6), 1, 100));
	ASSERT_EQ (stakeq::stake_status::invalid_weight, ctx.registry.change_stake_balance (account, fixed ("0.9"), tokens (6), 1, 100));
	ASSERT_EQ (stakeq::stake_status::insufficient_balance, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (100), 1, 100));
	ASSERT_EQ (entry, ctx.registry.queue_entry (1));
	ASSERT_TRUE (ctx.supply_balanced ());
}

TEST (stake_queue, remove_round_trip)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 7, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (3), 8, 100));
	auto before = ctx.registry.live_regular_balance (account, 100);

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("1.7"), tokens (4), 9, 100));
	ASSERT_EQ (1, ctx.registry.queue_position (9));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.remove_stake_from_queue (account, 9, 100));

	ASSERT_EQ (before, ctx.registry.live_regular_balance (account, 100));
	ASSERT_FALSE (ctx.registry.queue_position (9));
	ASSERT_EQ (1, ctx.registry.queue_position (8));
	ASSERT_TRUE (ctx.supply_balanced ());

	// The id can be reused once removed
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("1.7"), tokens (4), 9, 100));
}

TEST (stake_queue, remove_authorization)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	auto other = ctx.add_account (2);
	ASSERT_EQ (stakeq::stake_status::not_in_queue, ctx.registry.remove_stake_from_queue (account, 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	auto staked = ctx.registry.queue_entry (1)->staked;

	ASSERT_EQ (stakeq::stake_status::not_authorized, ctx.registry.remove_stake_from_queue (other, 1, 100));
	ASSERT_TRUE (ctx.registry.queue_position (1));

	// The registry owner may evict, the refund still goes to the entry owner
	auto before = ctx.registry.live_regular_balance (account, 100);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.remove_stake_from_queue (stakeq::test::registry_context::owner, 1, 100));
	ASSERT_EQ (before + staked, ctx.registry.live_regular_balance (account, 100));
	ASSERT_EQ (1, ctx.events.stake_removed.size ());
	ASSERT_EQ (account, ctx.events.stake_removed[0].owner);
	ASSERT_EQ (staked, ctx.events.stake_removed[0].refunded);
}

TEST (stake_queue, dequeue)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (10), 2, 100));
	auto balance = ctx.registry.live_regular_balance (account, 100);
	auto head = ctx.registry.queue_entry (2);

	auto result = ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100);
	ASSERT_EQ (stakeq::stake_status::ok, result.status);
	ASSERT_EQ (head, result.entry);
	ASSERT_EQ (0, ctx.registry.queue_position (1));
	ASSERT_FALSE (ctx.registry.queue_position (2));

	// Consumed stakes are not refunded
	ASSERT_EQ (balance, ctx.registry.live_regular_balance (account, 100));
	ASSERT_EQ (head->staked, ctx.registry.supply ().destroyed);
	ASSERT_TRUE (ctx.supply_balanced ());

	ASSERT_EQ (1, ctx.events.item_dequeued.size ());
	ASSERT_EQ (2, ctx.events.item_dequeued[0].id);
	ASSERT_EQ (head->staked, ctx.events.item_dequeued[0].consumed);
}

TEST (stake_queue, dequeue_not_controller)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (10), 2, 100));
	auto contents = ctx.registry.queue_contents ();
	ctx.events.clear ();

	auto result = ctx.registry.dequeue_item (account, 100);
	ASSERT_EQ (stakeq::stake_status::not_authorized, result.status);
	ASSERT_FALSE (result.entry);
	// The owner is not the controller either
	ASSERT_EQ (stakeq::stake_status::not_authorized, ctx.registry.dequeue_item (stakeq::test::registry_context::owner, 100).status);

	ASSERT_EQ (contents, ctx.registry.queue_contents ());
	ASSERT_TRUE (ctx.events.names.empty ());
}

TEST (stake_queue, dequeue_empty)
{
	stakeq::test::registry_context ctx;
	auto result = ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100);
	ASSERT_EQ (stakeq::stake_status::queue_empty, result.status);
	ASSERT_FALSE (result.entry);
}

TEST (stake_queue, enter_events)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ctx.events.clear ();
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (5), 1, 100));
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (10), 2, 100));

	std::vector<std::string> names{ "entered_queue", "queue_updated", "entered_queue", "queue_updated" };
	ASSERT_EQ (names, ctx.events.names);
	ASSERT_EQ (account, ctx.events.entered_queue[1].owner);
	ASSERT_EQ (2, ctx.events.entered_queue[1].id);
	ASSERT_EQ (ctx.registry.queue_entry (2)->staked, ctx.events.entered_queue[1].staked);
	ASSERT_EQ (0, ctx.events.queue_updated[1].position);
}

TEST (stake_queue, top_follows_position_zero)
{
	stakeq::test::registry_context ctx;
	auto account = ctx.add_account (1);
	ASSERT_TRUE (ctx.registry.queue_empty ());
	ASSERT_FALSE (ctx.registry.queue_top ());

	auto top_is_head = [&ctx] () {
		auto top = ctx.registry.queue_top ();
		auto contents = ctx.registry.queue_contents ();
		return top && !contents.empty () && *top == contents.front () && ctx.registry.queue_position (top->id) == 0;
	};

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (3), 1, 100));
	ASSERT_FALSE (ctx.registry.queue_empty ());
	ASSERT_EQ (1, ctx.registry.queue_top ()->id);
	ASSERT_TRUE (top_is_head ());

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.enter_queue (account, fixed ("2"), tokens (2), 2, 100));
	ASSERT_EQ (1, ctx.registry.queue_top ()->id);
	ASSERT_TRUE (top_is_head ());

	// Raising the second stake above the first moves it to the head
	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.change_stake_balance (account, fixed ("2"), tokens (4), 2, 100));
	ASSERT_EQ (2, ctx.registry.queue_top ()->id);
	ASSERT_TRUE (top_is_head ());

	auto top = ctx.registry.queue_top ();
	auto result = ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100);
	ASSERT_EQ (stakeq::stake_status::ok, result.status);
	ASSERT_EQ (top, result.entry);
	ASSERT_EQ (1, ctx.registry.queue_top ()->id);
	ASSERT_TRUE (top_is_head ());

	ASSERT_EQ (stakeq::stake_status::ok, ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100).status);
	ASSERT_TRUE (ctx.registry.queue_empty ());
	ASSERT_FALSE (ctx.registry.queue_top ());
	ASSERT_EQ (stakeq::stake_status::queue_empty, ctx.registry.dequeue_item (stakeq::test::registry_context::controller, 100).status);
}
