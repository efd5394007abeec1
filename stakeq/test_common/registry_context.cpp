#include <stakeq/lib/assert.hpp>
#include <stakeq/test_common/registry_context.hpp>

stakeq::test::event_recorder::event_recorder (stakeq::notifications & notifications)
{
	notifications.wallet_registered.add ([this] (stakeq::event::wallet_registered const & event) {
		names.push_back ("wallet_registered");
		wallet_registered.push_back (event);
	});
	notifications.entered_queue.add ([this] (stakeq::event::entered_queue const & event) {
		names.push_back ("entered_queue");
		entered_queue.push_back (event);
	});
	notifications.queue_updated.add ([this] (stakeq::event::queue_updated const & event) {
		names.push_back ("queue_updated");
		queue_updated.push_back (event);
	});
	notifications.stake_changed.add ([this] (stakeq::event::stake_changed const & event) {
		names.push_back ("stake_changed");
		stake_changed.push_back (event);
	});
	notifications.stake_removed.add ([this] (stakeq::event::stake_removed const & event) {
		names.push_back ("stake_removed");
		stake_removed.push_back (event);
	});
	notifications.item_dequeued.add ([this] (stakeq::event::item_dequeued const & event) {
		names.push_back ("item_dequeued");
		item_dequeued.push_back (event);
	});
	notifications.controller_changed.add ([this] (stakeq::event::controller_changed const & event) {
		names.push_back ("controller_changed");
		controller_changed.push_back (event);
	});
}

void stakeq::test::event_recorder::clear ()
{
	names.clear ();
	wallet_registered.clear ();
	entered_queue.clear ();
	queue_updated.clear ();
	stake_changed.clear ();
	stake_removed.clear ();
	item_dequeued.clear ();
	controller_changed.clear ();
}

/*
 * registry_context
 */

stakeq::account const stakeq::test::registry_context::owner{ 0x0a };
stakeq::account const stakeq::test::registry_context::controller{ 0x0c };

stakeq::registry_config stakeq::test::registry_context::default_config ()
{
	stakeq::registry_config config;
	config.owner = owner;
	config.controller = controller;
	return config;
}

stakeq::test::registry_context::registry_context (stakeq::registry_config const & config) :
	logger{ stakeq::log_config::tests_default (), "test" },
	registry{ config, stats, logger },
	events{ registry.notifications }
{
}

stakeq::account stakeq::test::registry_context::add_account (stakeq::account const & account, stakeq::seconds_t registered)
{
	auto status = registry.register_wallet (account, registered);
	release_assert (status == stakeq::stake_status::ok, stakeq::to_string (status));
	return account;
}

bool stakeq::test::registry_context::supply_balanced () const
{
	auto const supply = registry.supply ();
	return supply.settled + supply.escrowed + supply.destroyed == supply.accrued && supply.locked == supply.escrowed;
}
