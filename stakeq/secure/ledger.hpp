#pragma once

#include <stakeq/lib/container_info.hpp>
#include <stakeq/lib/numbers.hpp>
#include <stakeq/secure/common.hpp>

#include <optional>
#include <unordered_map>
#include <vector>

namespace stakeq
{
class logger;
class stats;

/** Accrual rates, each rate is credited once per `interval` seconds and pro rata in between */
class ledger_constants final
{
public:
	stakeq::seconds_t interval{ 10 };
	stakeq::uint128_t regular_rate{ 10 * stakeq::token_ratio };
	stakeq::uint128_t restricted_rate{ 5 * stakeq::token_ratio };
};

/**
 * Per account dual balance ledger with lazy time based accrual.
 * Every mutation first checkpoints the accounts involved and either applies completely or not at all.
 * Checked arithmetic failures propagate as std::overflow_error / std::range_error before any state is written.
 * Not thread safe, callers serialize access.
 */
class ledger final
{
public:
	ledger (stakeq::ledger_constants const &, stakeq::stats &, stakeq::logger &);

	stakeq::stake_status register_account (stakeq::account const &, stakeq::seconds_t now);
	bool is_registered (stakeq::account const &) const;

	/** Materializes accrual up to \p now into settled balances. No-op for unregistered accounts. */
	void checkpoint (stakeq::account const &, stakeq::seconds_t now);

	stakeq::uint128_t live_regular_balance (stakeq::account const &, stakeq::seconds_t now) const;
	stakeq::uint128_t live_restricted_balance (stakeq::account const &, stakeq::seconds_t now) const;

	/** Moves \p amount spending restricted value first, the restricted part stays restricted at the recipient */
	stakeq::stake_status transfer (stakeq::account const & from, stakeq::account const & to, stakeq::uint128_t const & amount, stakeq::seconds_t now);

	/** Debits the regular balance into escrow */
	stakeq::stake_status burn (stakeq::account const &, stakeq::uint128_t const & amount, stakeq::seconds_t now);
	/** Credits escrowed value back to the regular balance */
	stakeq::stake_status mint (stakeq::account const &, stakeq::uint128_t const & amount, stakeq::seconds_t now);
	/** Permanently removes escrowed value */
	void destroy (stakeq::uint128_t const & amount);

	std::optional<stakeq::account_info> account_info (stakeq::account const &) const;
	/** Registered accounts in ascending order */
	std::vector<stakeq::account> accounts () const;
	std::size_t account_count () const;

	/** Value created by accrual that has been settled into balances */
	stakeq::uint128_t accrued_supply () const;
	/** Value burned into escrow and not yet minted back or destroyed */
	stakeq::uint128_t escrowed () const;
	stakeq::uint128_t destroyed () const;
	/** Sum of settled regular and restricted balances */
	stakeq::uint128_t settled_total () const;
	/** Every unit accrued so far is settled in a balance, escrowed or destroyed */
	bool balanced () const;

	stakeq::ledger_constants const constants;

	stakeq::container_info container_info () const;

private: // Dependencies
	stakeq::stats & stats;
	stakeq::logger & logger;

private:
	struct settled
	{
		stakeq::account_info info;
		stakeq::uint128_t accrual;
	};

	/** Returns \p info with accrual settled up to \p now, throws on arithmetic failure */
	settled settle (stakeq::account_info const & info, stakeq::seconds_t now) const;
	stakeq::uint128_t accrued (stakeq::uint128_t const & rate, stakeq::seconds_t elapsed) const;

	std::unordered_map<stakeq::account, stakeq::account_info> infos;

	stakeq::uint128_t accrued_supply_m{ 0 };
	stakeq::uint128_t escrowed_m{ 0 };
	stakeq::uint128_t destroyed_m{ 0 };
};
}
