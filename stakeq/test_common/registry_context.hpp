#pragma once

#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/node/notifications.hpp>
#include <stakeq/node/registry.hpp>
#include <stakeq/node/registry_config.hpp>

#include <string>
#include <vector>

namespace stakeq::test
{
/**
 * Records every notification in dispatch order
 */
class event_recorder final
{
public:
	explicit event_recorder (stakeq::notifications &);

	/** Event names in the order they were dispatched */
	std::vector<std::string> names;

	std::vector<stakeq::event::wallet_registered> wallet_registered;
	std::vector<stakeq::event::entered_queue> entered_queue;
	std::vector<stakeq::event::queue_updated> queue_updated;
	std::vector<stakeq::event::stake_changed> stake_changed;
	std::vector<stakeq::event::stake_removed> stake_removed;
	std::vector<stakeq::event::item_dequeued> item_dequeued;
	std::vector<stakeq::event::controller_changed> controller_changed;

	void clear ();
};

struct registry_context
{
	static stakeq::account const owner;
	static stakeq::account const controller;

	/** Default rates with distinct owner and controller accounts */
	static stakeq::registry_config default_config ();

	explicit registry_context (stakeq::registry_config const & = default_config ());

	stakeq::logger logger;
	stakeq::stats stats;
	stakeq::registry registry;
	stakeq::test::event_recorder events;

	/** Registers \p account at \p registered and returns it */
	stakeq::account add_account (stakeq::account const &, stakeq::seconds_t registered = 0);

	/** Checks the value conservation identities, settled + escrowed + destroyed == accrued and locked == escrowed */
	bool supply_balanced () const;
};
}
