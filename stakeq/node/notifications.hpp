#pragma once

#include <stakeq/lib/container_info.hpp>
#include <stakeq/lib/numbers.hpp>
#include <stakeq/lib/observer_set.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace stakeq::event
{
struct wallet_registered
{
	stakeq::account wallet;
	stakeq::seconds_t time;
};

struct entered_queue
{
	stakeq::account owner;
	stakeq::external_id id;
	stakeq::uint128_t staked;
};

/** Resulting position of an entry after its slot was assigned */
struct queue_updated
{
	stakeq::external_id id;
	std::size_t position;
};

struct stake_changed
{
	stakeq::account owner;
	stakeq::external_id id;
	stakeq::uint128_t staked;
	std::size_t position;
};

struct stake_removed
{
	stakeq::account owner;
	stakeq::external_id id;
	stakeq::uint128_t refunded;
};

struct item_dequeued
{
	stakeq::account owner;
	stakeq::external_id id;
	stakeq::uint128_t consumed;
};

struct controller_changed
{
	stakeq::account previous;
	stakeq::account controller;
};
}

namespace stakeq
{
/**
 * State change observers. Operations post events once their changes are committed and the registry delivers them
 * with flush () after the operation returned, still holding its lock, which keeps their order identical to the order
 * of operations. Observers must not call back into the registry. An exception thrown by an observer propagates to the
 * caller of the operation, which has already been applied, and drops the remaining events of that operation.
 */
class notifications final
{
public:
	template <typename Event>
	void post (stakeq::observer_set<Event> & observers, Event const & event)
	{
		pending.emplace_back ([&observers, event] () {
			observers.notify (event);
		});
	}

	/** Delivers posted events in posting order */
	void flush ();
	/** Drops posted events without delivering them */
	void discard ();

	stakeq::container_info container_info () const;

public: // Events
	stakeq::observer_set<stakeq::event::wallet_registered> wallet_registered;
	stakeq::observer_set<stakeq::event::entered_queue> entered_queue;
	stakeq::observer_set<stakeq::event::queue_updated> queue_updated;
	stakeq::observer_set<stakeq::event::stake_changed> stake_changed;
	stakeq::observer_set<stakeq::event::stake_removed> stake_removed;
	stakeq::observer_set<stakeq::event::item_dequeued> item_dequeued;
	stakeq::observer_set<stakeq::event::controller_changed> controller_changed;

private:
	std::vector<std::function<void ()>> pending;
};
}
