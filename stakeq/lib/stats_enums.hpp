#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace stakeq::stat
{
/** Primary statistics type */
enum class type
{
	_invalid = 0, // Default value, should not be used

	registry,
	ledger,
	queue,
	script,

	_last // Must be the last enum
};

/** Optional detail type */
enum class detail
{
	_invalid = 0, // Default value, should not be used

	all,

	// operations
	register_wallet,
	transfer,
	enter_queue,
	change_stake,
	remove_stake,
	dequeue,
	set_controller,

	// outcomes
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

	// ledger
	checkpoint,
	burn,
	mint,
	restricted_moved,

	// queue
	insert,
	reposition,
	unchanged_position,
	erase,
	pop,

	// script
	command,
	command_failed,

	_last // Must be the last enum
};
}

namespace stakeq::stat
{
std::string_view to_string (type);
std::string_view to_string (detail);

std::vector<type> const & all_types ();
std::vector<detail> const & all_details ();
}
