#pragma once

#include <stakeq/lib/numbers.hpp>
#include <stakeq/lib/stats_enums.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace stakeq
{
/**
 * Result of every public operation. Anything other than `ok` means the operation had no effect.
 */
enum class stake_status
{
	ok,
	already_registered,
	unregistered,
	unregistered_sender,
	unregistered_recipient,
	already_queued,
	not_in_queue,
	invalid_weight,
	insufficient_balance,
	not_authorized,
	not_owner,
	queue_empty,
	arithmetic_error,
};

/** Coarse grouping of rejection reasons */
enum class status_category
{
	none,
	validation,
	balance,
	authorization,
	arithmetic,
};

std::string_view to_string (stakeq::stake_status);
std::string_view to_string (stakeq::status_category);
stakeq::status_category category (stakeq::stake_status);
stakeq::stat::detail to_stat_detail (stakeq::stake_status);

/**
 * Settled state of a registered account. Balances only change at checkpoints and value movements,
 * the live balance adds accrual since `last_checkpoint`.
 */
class account_info final
{
public:
	bool registered{ false };
	stakeq::seconds_t registration_time{ 0 };
	stakeq::seconds_t last_checkpoint{ 0 };
	stakeq::uint128_t regular{ 0 };
	stakeq::uint128_t restricted{ 0 };

	bool operator== (account_info const &) const = default;
};

/**
 * Value escrowed by an account to occupy a ranked slot in the queue
 */
class stake_entry final
{
public:
	stakeq::external_id id{ 0 };
	stakeq::account owner;
	stakeq::uint128_t weight{ 0 };
	stakeq::uint128_t priority{ 0 };
	stakeq::uint128_t staked{ 0 };
	stakeq::seconds_t timestamp{ 0 };

	/**
	 * True if this entry is served before \p other: higher priority first,
	 * then lower weight, then earlier timestamp
	 */
	bool ranks_ahead_of (stake_entry const & other) const;

	bool operator== (stake_entry const &) const = default;

	std::string to_string () const;
};
}
