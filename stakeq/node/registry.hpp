#pragma once

#include <stakeq/lib/container_info.hpp>
#include <stakeq/lib/numbers.hpp>
#include <stakeq/node/access_gate.hpp>
#include <stakeq/node/notifications.hpp>
#include <stakeq/node/registry_config.hpp>
#include <stakeq/node/stake_queue.hpp>
#include <stakeq/secure/common.hpp>
#include <stakeq/secure/ledger.hpp>

#include <mutex>
#include <optional>
#include <vector>

namespace stakeq
{
class logger;
class stats;

/** Totals used to check that no value appears or vanishes outside burn, mint and destroy */
class supply_info final
{
public:
	stakeq::uint128_t accrued;
	stakeq::uint128_t settled;
	stakeq::uint128_t escrowed;
	stakeq::uint128_t locked;
	stakeq::uint128_t destroyed;
};

/**
 * Entry point for all operations on the participant registry: the ledger, the stake queue and the roles.
 * Every public operation runs under a single mutex which gives all mutations one global order.
 * Operations either apply completely or return a non ok status and change nothing. Notifications of an applied operation
 * are delivered after it, a failed operation delivers none.
 */
class registry final
{
public:
	registry (stakeq::registry_config const &, stakeq::stats &, stakeq::logger &);

	stakeq::stake_status register_wallet (stakeq::account const & caller, stakeq::seconds_t now);
	bool is_registered (stakeq::account const &) const;

	stakeq::uint128_t live_regular_balance (stakeq::account const &, stakeq::seconds_t now) const;
	stakeq::uint128_t live_restricted_balance (stakeq::account const &, stakeq::seconds_t now) const;

	stakeq::stake_status transfer (stakeq::account const & caller, stakeq::account const & recipient, stakeq::uint128_t const & amount, stakeq::seconds_t now);

	stakeq::stake_status enter_queue (stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id, stakeq::seconds_t now);
	stakeq::stake_status change_stake_balance (stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id, stakeq::seconds_t now);
	stakeq::stake_status remove_stake_from_queue (stakeq::account const & caller, stakeq::external_id, stakeq::seconds_t now);
	stakeq::stake_queue::dequeue_result dequeue_item (stakeq::account const & caller, stakeq::seconds_t now);

	std::optional<std::size_t> queue_position (stakeq::external_id) const;
	std::optional<stakeq::stake_entry> queue_entry (stakeq::external_id) const;
	/** Entry at position 0, served by the next dequeue */
	std::optional<stakeq::stake_entry> queue_top () const;
	std::vector<stakeq::stake_entry> queue_contents () const;
	std::size_t queue_size () const;
	bool queue_empty () const;

	std::vector<stakeq::account> registered_accounts () const;
	std::optional<stakeq::account_info> account_info (stakeq::account const &) const;

	stakeq::stake_status set_controller (stakeq::account const & caller, stakeq::account const & controller);
	stakeq::account owner () const;
	stakeq::account controller () const;

	stakeq::supply_info supply () const;

	stakeq::container_info container_info () const;

public:
	stakeq::registry_config const config;

private: // Dependencies
	stakeq::stats & stats;
	stakeq::logger & logger;

public:
	stakeq::notifications notifications;

private:
	/**
	 * Runs \p operation under the lock. Checked arithmetic failures inside the operation are reported as
	 * arithmetic_error, operations compute every value before committing so a failure leaves state untouched.
	 * Events posted by the operation are delivered afterwards, exceptions from observers reach the caller.
	 */
	template <typename Operation>
	stakeq::stake_status execute (stakeq::stat::detail, Operation &&);

	void record (stakeq::stat::detail, stakeq::stake_status);

	mutable std::mutex mutex;
	stakeq::ledger ledger;
	stakeq::access_gate gate;
	stakeq::stake_queue queue;
};
}
