#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace stakeq::log
{
enum class level
{
	trace,
	debug,
	info,
	warn,
	error,
	critical,
	off,
};

enum class type
{
	all = 0, // reserved

	generic,
	config,
	cli,
	script,
	registry,
	ledger,
	queue,
	notifications,
	test,
};

enum class detail
{
	all = 0, // reserved

	// notifications
	wallet_registered,
	entered_queue,
	queue_updated,
	stake_changed,
	stake_removed,
	item_dequeued,
	controller_changed,

	// registry
	rejected,

	// ledger
	transfer,
	burn,
	mint,

	// script
	command,
};
}

namespace stakeq
{
std::string_view to_string (stakeq::log::type);
std::string_view to_string (stakeq::log::detail);
std::string_view to_string (stakeq::log::level);
}

namespace stakeq::log
{
/// @returns level enum value, throws std::invalid_argument if the name is not recognized
stakeq::log::level parse_level (std::string_view);
/// @returns type enum value, throws std::invalid_argument if the name is not recognized
stakeq::log::type parse_type (std::string_view);
/// @returns detail enum value, throws std::invalid_argument if the name is not recognized
stakeq::log::detail parse_detail (std::string_view);

std::vector<stakeq::log::level> const & all_levels ();
std::vector<stakeq::log::type> const & all_types ();
}
