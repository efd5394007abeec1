#include <stakeq/lib/assert.hpp>
#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/secure/ledger.hpp>

#include <algorithm>

stakeq::ledger::ledger (stakeq::ledger_constants const & constants_a, stakeq::stats & stats_a, stakeq::logger & logger_a) :
	constants{ constants_a },
	stats{ stats_a },
	logger{ logger_a }
{
	release_assert (constants.interval > 0, "accrual interval must be non zero");
}

stakeq::stake_status stakeq::ledger::register_account (stakeq::account const & account, stakeq::seconds_t now)
{
	if (is_registered (account))
	{
		return stakeq::stake_status::already_registered;
	}

	stakeq::account_info info;
	info.registered = true;
	info.registration_time = now;
	info.last_checkpoint = now;
	infos[account] = info;

	logger.debug (stakeq::log::type::ledger, "Registered account {} at {}", account.to_string (), now);
	return stakeq::stake_status::ok;
}

bool stakeq::ledger::is_registered (stakeq::account const & account) const
{
	auto existing = infos.find (account);
	return existing != infos.end () && existing->second.registered;
}

stakeq::uint128_t stakeq::ledger::accrued (stakeq::uint128_t const & rate, stakeq::seconds_t elapsed) const
{
	// Multiply before dividing so partial intervals do not truncate per step
	return stakeq::narrow (stakeq::widen (rate) * elapsed / constants.interval);
}

auto stakeq::ledger::settle (stakeq::account_info const & info, stakeq::seconds_t now) const -> settled
{
	auto const elapsed = stakeq::elapsed (info.last_checkpoint, now);
	auto const regular_accrual = accrued (constants.regular_rate, elapsed);
	auto const restricted_accrual = accrued (constants.restricted_rate, elapsed);

	settled result{ info, regular_accrual + restricted_accrual };
	result.info.regular += regular_accrual;
	result.info.restricted += restricted_accrual;
	result.info.last_checkpoint = now;
	return result;
}

void stakeq::ledger::checkpoint (stakeq::account const & account, stakeq::seconds_t now)
{
	auto existing = infos.find (account);
	if (existing == infos.end () || !existing->second.registered)
	{
		return;
	}

	auto [info, accrual] = settle (existing->second, now);
	auto const supply = accrued_supply_m + accrual;

	// Commit
	existing->second = info;
	accrued_supply_m = supply;
	debug_assert (balanced ());

	stats.inc (stakeq::stat::type::ledger, stakeq::stat::detail::checkpoint);
}

stakeq::uint128_t stakeq::ledger::live_regular_balance (stakeq::account const & account, stakeq::seconds_t now) const
{
	auto existing = infos.find (account);
	if (existing == infos.end ())
	{
		return 0;
	}
	return settle (existing->second, now).info.regular;
}

stakeq::uint128_t stakeq::ledger::live_restricted_balance (stakeq::account const & account, stakeq::seconds_t now) const
{
	auto existing = infos.find (account);
	if (existing == infos.end ())
	{
		return 0;
	}
	return settle (existing->second, now).info.restricted;
}

stakeq::stake_status stakeq::ledger::transfer (stakeq::account const & from, stakeq::account const & to, stakeq::uint128_t const & amount, stakeq::seconds_t now)
{
	if (!is_registered (from))
	{
		return stakeq::stake_status::unregistered_sender;
	}
	if (!is_registered (to))
	{
		return stakeq::stake_status::unregistered_recipient;
	}

	auto sender = settle (infos.at (from), now);
	if (amount > sender.info.regular + sender.info.restricted)
	{
		return stakeq::stake_status::insufficient_balance;
	}

	auto const restricted_portion = std::min (amount, sender.info.restricted);
	auto const regular_portion = amount - restricted_portion;

	sender.info.restricted -= restricted_portion;
	sender.info.regular -= regular_portion;

	auto supply = accrued_supply_m + sender.accrual;
	if (from == to)
	{
		// Self transfer only settles accrual, every portion returns to the balance it came from
		sender.info.restricted += restricted_portion;
		sender.info.regular += regular_portion;

		infos[from] = sender.info;
		accrued_supply_m = supply;
		debug_assert (balanced ());
		return stakeq::stake_status::ok;
	}

	auto recipient = settle (infos.at (to), now);
	recipient.info.restricted += restricted_portion;
	recipient.info.regular += regular_portion;
	supply += recipient.accrual;

	// Commit
	infos[from] = sender.info;
	infos[to] = recipient.info;
	accrued_supply_m = supply;
	debug_assert (balanced ());

	if (!restricted_portion.is_zero ())
	{
		stats.inc (stakeq::stat::type::ledger, stakeq::stat::detail::restricted_moved);
	}
	logger.log (stakeq::log::level::debug, stakeq::log::logger_id{ stakeq::log::type::ledger, stakeq::log::detail::transfer }, "Transferred {} ({} restricted) from {} to {}", stakeq::to_string (amount), stakeq::to_string (restricted_portion), from.to_string (), to.to_string ());
	return stakeq::stake_status::ok;
}

stakeq::stake_status stakeq::ledger::burn (stakeq::account const & account, stakeq::uint128_t const & amount, stakeq::seconds_t now)
{
	if (!is_registered (account))
	{
		return stakeq::stake_status::unregistered;
	}

	auto [info, accrual] = settle (infos.at (account), now);
	if (info.regular < amount)
	{
		return stakeq::stake_status::insufficient_balance;
	}
	info.regular -= amount;
	auto const supply = accrued_supply_m + accrual;
	auto const escrowed = escrowed_m + amount;

	// Commit
	infos[account] = info;
	accrued_supply_m = supply;
	escrowed_m = escrowed;
	debug_assert (balanced ());

	stats.inc (stakeq::stat::type::ledger, stakeq::stat::detail::burn);
	logger.log (stakeq::log::level::trace, stakeq::log::logger_id{ stakeq::log::type::ledger, stakeq::log::detail::burn }, "Burned {} from {}", stakeq::to_string (amount), account.to_string ());
	return stakeq::stake_status::ok;
}

stakeq::stake_status stakeq::ledger::mint (stakeq::account const & account, stakeq::uint128_t const & amount, stakeq::seconds_t now)
{
	if (!is_registered (account))
	{
		return stakeq::stake_status::unregistered;
	}

	auto [info, accrual] = settle (infos.at (account), now);
	info.regular += amount;
	auto const supply = accrued_supply_m + accrual;
	auto const escrowed = escrowed_m - amount;

	// Commit
	infos[account] = info;
	accrued_supply_m = supply;
	escrowed_m = escrowed;
	debug_assert (balanced ());

	stats.inc (stakeq::stat::type::ledger, stakeq::stat::detail::mint);
	logger.log (stakeq::log::level::trace, stakeq::log::logger_id{ stakeq::log::type::ledger, stakeq::log::detail::mint }, "Minted {} to {}", stakeq::to_string (amount), account.to_string ());
	return stakeq::stake_status::ok;
}

void stakeq::ledger::destroy (stakeq::uint128_t const & amount)
{
	auto const escrowed = escrowed_m - amount;
	auto const destroyed = destroyed_m + amount;

	escrowed_m = escrowed;
	destroyed_m = destroyed;
	debug_assert (balanced ());
}

std::optional<stakeq::account_info> stakeq::ledger::account_info (stakeq::account const & account) const
{
	if (auto existing = infos.find (account); existing != infos.end ())
	{
		return existing->second;
	}
	return std::nullopt;
}

std::vector<stakeq::account> stakeq::ledger::accounts () const
{
	std::vector<stakeq::account> result;
	result.reserve (infos.size ());
	for (auto const & [account, info] : infos)
	{
		if (info.registered)
		{
			result.push_back (account);
		}
	}
	std::sort (result.begin (), result.end ());
	return result;
}

std::size_t stakeq::ledger::account_count () const
{
	return infos.size ();
}

stakeq::uint128_t stakeq::ledger::accrued_supply () const
{
	return accrued_supply_m;
}

stakeq::uint128_t stakeq::ledger::escrowed () const
{
	return escrowed_m;
}

stakeq::uint128_t stakeq::ledger::destroyed () const
{
	return destroyed_m;
}

stakeq::uint128_t stakeq::ledger::settled_total () const
{
	stakeq::uint128_t total{ 0 };
	for (auto const & [account, info] : infos)
	{
		total += info.regular;
		total += info.restricted;
	}
	return total;
}

bool stakeq::ledger::balanced () const
{
	return settled_total () + escrowed_m + destroyed_m == accrued_supply_m;
}

stakeq::container_info stakeq::ledger::container_info () const
{
	stakeq::container_info info;
	info.put ("accounts", infos.size (), sizeof (decltype (infos)::value_type));
	return info;
}
