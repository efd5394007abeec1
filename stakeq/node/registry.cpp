#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/node/registry.hpp>

#include <stdexcept>

stakeq::registry::registry (stakeq::registry_config const & config_a, stakeq::stats & stats_a, stakeq::logger & logger_a) :
	config{ config_a },
	stats{ stats_a },
	logger{ logger_a },
	ledger{ config_a.ledger_constants (), stats_a, logger_a },
	gate{ ledger, config_a.owner, config_a.controller },
	queue{ ledger, notifications, stats_a, logger_a }
{
	logger.info (stakeq::log::type::registry, "Registry owner: {}, controller: {}, interval: {}s", config.owner.to_string (), config.controller.to_string (), config.interval);
}

template <typename Operation>
stakeq::stake_status stakeq::registry::execute (stakeq::stat::detail operation_type, Operation && operation)
{
	stakeq::stake_status status;
	try
	{
		status = operation ();
	}
	catch (std::overflow_error const & ex)
	{
		logger.warn (stakeq::log::type::registry, "Arithmetic overflow in {}: {}", stakeq::stat::to_string (operation_type), ex.what ());
		status = stakeq::stake_status::arithmetic_error;
	}
	catch (std::range_error const & ex)
	{
		logger.warn (stakeq::log::type::registry, "Arithmetic underflow in {}: {}", stakeq::stat::to_string (operation_type), ex.what ());
		status = stakeq::stake_status::arithmetic_error;
	}
	if (status != stakeq::stake_status::ok)
	{
		notifications.discard ();
	}
	record (operation_type, status);

	// Outside the arithmetic guard, observer failures must not turn a committed operation into an error status
	notifications.flush ();
	return status;
}

void stakeq::registry::record (stakeq::stat::detail operation_type, stakeq::stake_status status)
{
	stats.inc (stakeq::stat::type::registry, operation_type);
	stats.inc (stakeq::stat::type::registry, stakeq::to_stat_detail (status));
	if (status != stakeq::stake_status::ok)
	{
		logger.log (stakeq::log::level::debug, stakeq::log::logger_id{ stakeq::log::type::registry, stakeq::log::detail::rejected }, "Rejected {}: {}", stakeq::stat::to_string (operation_type), stakeq::to_string (status));
	}
}

stakeq::stake_status stakeq::registry::register_wallet (stakeq::account const & caller, stakeq::seconds_t now)
{
	std::lock_guard<std::mutex> lock{ mutex };
	return execute (stakeq::stat::detail::register_wallet, [&] () {
		auto status = ledger.register_account (caller, now);
		if (status == stakeq::stake_status::ok)
		{
			logger.info (stakeq::log::type::registry, "Wallet registered: {}", caller.to_string ());
			notifications.post (notifications.wallet_registered, { caller, now });
		}
		return status;
	});
}

bool stakeq::registry::is_registered (stakeq::account const & account) const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return gate.is_registered (account);
}

stakeq::uint128_t stakeq::registry::live_regular_balance (stakeq::account const & account, stakeq::seconds_t now) const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return ledger.live_regular_balance (account, now);
}

stakeq::uint128_t stakeq::registry::live_restricted_balance (stakeq::account const & account, stakeq::seconds_t now) const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return ledger.live_restricted_balance (account, now);
}

stakeq::stake_status stakeq::registry::transfer (stakeq::account const & caller, stakeq::account const & recipient, stakeq::uint128_t const & amount, stakeq::seconds_t now)
{
	std::lock_guard<std::mutex> lock{ mutex };
	return execute (stakeq::stat::detail::transfer, [&] () {
		return ledger.transfer (caller, recipient, amount, now);
	});
}

stakeq::stake_status stakeq::registry::enter_queue (stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id id, stakeq::seconds_t now)
{
	std::lock_guard<std::mutex> lock{ mutex };
	return execute (stakeq::stat::detail::enter_queue, [&] () {
		return queue.enter (gate, caller, weight, priority, id, now);
	});
}

stakeq::stake_status stakeq::registry::change_stake_balance (stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id id, stakeq::seconds_t now)
{
	std::lock_guard<std::mutex> lock{ mutex };
	return execute (stakeq::stat::detail::change_stake, [&] () {
		return queue.change (caller, weight, priority, id, now);
	});
}

stakeq::stake_status stakeq::registry::remove_stake_from_queue (stakeq::account const & caller, stakeq::external_id id, stakeq::seconds_t now)
{
	std::lock_guard<std::mutex> lock{ mutex };
	return execute (stakeq::stat::detail::remove_stake, [&] () {
		return queue.remove (gate, caller, id, now);
	});
}

stakeq::stake_queue::dequeue_result stakeq::registry::dequeue_item (stakeq::account const & caller, stakeq::seconds_t now)
{
	std::lock_guard<std::mutex> lock{ mutex };
	stakeq::stake_queue::dequeue_result result{ stakeq::stake_status::ok, std::nullopt };
	result.status = execute (stakeq::stat::detail::dequeue, [&] () {
		result = queue.dequeue (gate, caller, now);
		return result.status;
	});
	return result;
}

std::optional<std::size_t> stakeq::registry::queue_position (stakeq::external_id id) const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return queue.position (id);
}

std::optional<stakeq::stake_entry> stakeq::registry::queue_entry (stakeq::external_id id) const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return queue.entry (id);
}

std::optional<stakeq::stake_entry> stakeq::registry::queue_top () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return queue.top ();
}

std::vector<stakeq::stake_entry> stakeq::registry::queue_contents () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return queue.contents ();
}

std::size_t stakeq::registry::queue_size () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return queue.size ();
}

bool stakeq::registry::queue_empty () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return queue.empty ();
}

std::vector<stakeq::account> stakeq::registry::registered_accounts () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return ledger.accounts ();
}

std::optional<stakeq::account_info> stakeq::registry::account_info (stakeq::account const & account) const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return ledger.account_info (account);
}

stakeq::stake_status stakeq::registry::set_controller (stakeq::account const & caller, stakeq::account const & controller)
{
	std::lock_guard<std::mutex> lock{ mutex };
	return execute (stakeq::stat::detail::set_controller, [&] () {
		auto const previous = gate.controller ();
		auto status = gate.set_controller (caller, controller);
		if (status == stakeq::stake_status::ok)
		{
			logger.info (stakeq::log::type::registry, "Controller changed from {} to {}", previous.to_string (), controller.to_string ());
			notifications.post (notifications.controller_changed, { previous, controller });
		}
		return status;
	});
}

stakeq::account stakeq::registry::owner () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return gate.owner ();
}

stakeq::account stakeq::registry::controller () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	return gate.controller ();
}

stakeq::supply_info stakeq::registry::supply () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	stakeq::supply_info result;
	result.accrued = ledger.accrued_supply ();
	result.settled = ledger.settled_total ();
	result.escrowed = ledger.escrowed ();
	result.locked = queue.locked ();
	result.destroyed = ledger.destroyed ();
	return result;
}

stakeq::container_info stakeq::registry::container_info () const
{
	std::lock_guard<std::mutex> lock{ mutex };
	stakeq::container_info info;
	info.add ("ledger", ledger.container_info ());
	info.add ("queue", queue.container_info ());
	info.add ("notifications", notifications.container_info ());
	return info;
}
