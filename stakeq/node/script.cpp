#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/node/registry.hpp>
#include <stakeq/node/script.hpp>

#include <boost/algorithm/string.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace
{
class argument_error : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

class argument_count_error : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

stakeq::account parse_account (std::string const & text)
{
	stakeq::account result;
	if (result.decode (text))
	{
		throw argument_error ("invalid account: " + text);
	}
	return result;
}

stakeq::uint128_t parse_fixed (std::string const & text)
{
	stakeq::uint128_t result;
	if (stakeq::decode_fixed (text, result))
	{
		throw argument_error ("invalid amount: " + text);
	}
	return result;
}

uint64_t parse_number (std::string const & text)
{
	if (text.empty () || !std::all_of (text.begin (), text.end (), [] (unsigned char ch) { return std::isdigit (ch); }))
	{
		throw argument_error ("invalid number: " + text);
	}
	try
	{
		return std::stoull (text);
	}
	catch (std::out_of_range const &)
	{
		throw argument_error ("number out of range: " + text);
	}
}
}

stakeq::script_runner::script_runner (stakeq::registry & registry_a, std::ostream & output_a, stakeq::stats & stats_a, stakeq::logger & logger_a) :
	registry{ registry_a },
	output{ output_a },
	stats{ stats_a },
	logger{ logger_a }
{
}

stakeq::error stakeq::script_runner::run (std::istream & stream)
{
	stakeq::error error;
	std::string line;
	std::size_t line_number = 0;
	while (!error && std::getline (stream, line))
	{
		++line_number;
		error = execute (line);
		if (error)
		{
			error.set_message (fmt::format ("line {}: {}", line_number, error.get_message ()));
		}
	}
	return error;
}

stakeq::error stakeq::script_runner::execute (std::string const & line)
{
	auto trimmed = boost::algorithm::trim_copy (line);
	if (trimmed.empty () || trimmed.front () == '#')
	{
		return {};
	}

	std::vector<std::string> tokens;
	boost::algorithm::split (tokens, trimmed, boost::algorithm::is_space (), boost::algorithm::token_compress_on);

	logger.log (stakeq::log::level::debug, stakeq::log::logger_id{ stakeq::log::type::script, stakeq::log::detail::command }, "Executing: {}", trimmed);

	auto error = dispatch (tokens);
	if (error)
	{
		stats.inc (stakeq::stat::type::script, stakeq::stat::detail::command_failed);
		logger.error (stakeq::log::type::script, "Failed to execute '{}': {}", trimmed, error.get_message ());
	}
	else
	{
		stats.inc (stakeq::stat::type::script, stakeq::stat::detail::command);
		++executed_m;
	}
	return error;
}

stakeq::error stakeq::script_runner::dispatch (std::vector<std::string> const & tokens)
{
	auto const & command = tokens.front ();
	auto const arguments = tokens.size () - 1;

	auto expect = [&] (std::size_t count) {
		if (arguments != count)
		{
			throw argument_count_error (fmt::format ("{} expects {} arguments, got {}", command, count, arguments));
		}
	};
	auto print_status = [this, &command] (stakeq::stake_status status) {
		output << command << ": " << stakeq::to_string (status) << std::endl;
	};

	stakeq::error error;
	try
	{
		if (command == "register")
		{
			expect (2);
			print_status (registry.register_wallet (parse_account (tokens[1]), parse_number (tokens[2])));
		}
		else if (command == "transfer")
		{
			expect (4);
			print_status (registry.transfer (parse_account (tokens[1]), parse_account (tokens[2]), parse_fixed (tokens[3]), parse_number (tokens[4])));
		}
		else if (command == "enter")
		{
			expect (5);
			print_status (registry.enter_queue (parse_account (tokens[1]), parse_fixed (tokens[2]), parse_fixed (tokens[3]), parse_number (tokens[4]), parse_number (tokens[5])));
		}
		else if (command == "change")
		{
			expect (5);
			print_status (registry.change_stake_balance (parse_account (tokens[1]), parse_fixed (tokens[2]), parse_fixed (tokens[3]), parse_number (tokens[4]), parse_number (tokens[5])));
		}
		else if (command == "remove")
		{
			expect (3);
			print_status (registry.remove_stake_from_queue (parse_account (tokens[1]), parse_number (tokens[2]), parse_number (tokens[3])));
		}
		else if (command == "dequeue")
		{
			expect (2);
			auto result = registry.dequeue_item (parse_account (tokens[1]), parse_number (tokens[2]));
			print_status (result.status);
			if (result.entry)
			{
				output << "  consumed " << result.entry->id << " owner " << result.entry->owner.to_string () << " staked " << stakeq::to_string_fixed (result.entry->staked) << std::endl;
			}
		}
		else if (command == "set_controller")
		{
			expect (2);
			print_status (registry.set_controller (parse_account (tokens[1]), parse_account (tokens[2])));
		}
		else if (command == "balance")
		{
			expect (2);
			auto account = parse_account (tokens[1]);
			auto now = parse_number (tokens[2]);
			output << "balance: " << account.to_string () << " regular " << stakeq::to_string_fixed (registry.live_regular_balance (account, now)) << " restricted " << stakeq::to_string_fixed (registry.live_restricted_balance (account, now)) << std::endl;
		}
		else if (command == "position")
		{
			expect (1);
			auto id = parse_number (tokens[1]);
			if (auto position = registry.queue_position (id))
			{
				output << "position: " << id << " at " << *position << std::endl;
			}
			else
			{
				print_status (stakeq::stake_status::not_in_queue);
			}
		}
		else if (command == "queue")
		{
			expect (0);
			auto contents = registry.queue_contents ();
			output << "queue: " << contents.size () << " entries" << std::endl;
			for (std::size_t position = 0; position < contents.size (); ++position)
			{
				auto const & entry = contents[position];
				output << "  " << position << " id " << entry.id << " owner " << entry.owner.to_string () << " weight " << stakeq::to_string_fixed (entry.weight) << " priority " << stakeq::to_string_fixed (entry.priority) << " staked " << stakeq::to_string_fixed (entry.staked) << std::endl;
			}
		}
		else if (command == "accounts")
		{
			expect (0);
			auto accounts = registry.registered_accounts ();
			output << "accounts: " << accounts.size () << std::endl;
			for (auto const & account : accounts)
			{
				output << "  " << account.to_string () << std::endl;
			}
		}
		else if (command == "supply")
		{
			expect (0);
			auto supply = registry.supply ();
			output << "supply: accrued " << stakeq::to_string_fixed (supply.accrued) << " settled " << stakeq::to_string_fixed (supply.settled) << " locked " << stakeq::to_string_fixed (supply.locked) << " destroyed " << stakeq::to_string_fixed (supply.destroyed) << std::endl;
		}
		else
		{
			error.set ("unknown command: " + command, stakeq::error_script::unknown_command);
		}
	}
	catch (argument_count_error const & ex)
	{
		error.set (ex.what (), stakeq::error_script::wrong_argument_count);
	}
	catch (argument_error const & ex)
	{
		error.set (ex.what (), stakeq::error_script::invalid_argument);
	}
	catch (std::range_error const & ex)
	{
		// Balance views reject timestamps that precede the last checkpoint
		error.set (ex.what (), stakeq::error_script::invalid_argument);
	}
	catch (std::overflow_error const & ex)
	{
		error.set (ex.what (), stakeq::error_script::invalid_argument);
	}
	return error;
}

std::size_t stakeq::script_runner::executed () const
{
	return executed_m;
}

void stakeq::log_notifications (stakeq::notifications & notifications, stakeq::logger & logger)
{
	notifications.wallet_registered.add ([&logger] (stakeq::event::wallet_registered const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::wallet_registered }, "WalletRegistered {} at {}", event.wallet.to_string (), event.time);
	});
	notifications.entered_queue.add ([&logger] (stakeq::event::entered_queue const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::entered_queue }, "EnteredQueue {} by {} staked {}", event.id, event.owner.to_string (), stakeq::to_string (event.staked));
	});
	notifications.queue_updated.add ([&logger] (stakeq::event::queue_updated const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::queue_updated }, "QueueUpdated {} position {}", event.id, event.position);
	});
	notifications.stake_changed.add ([&logger] (stakeq::event::stake_changed const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::stake_changed }, "StakeChanged {} by {} staked {} position {}", event.id, event.owner.to_string (), stakeq::to_string (event.staked), event.position);
	});
	notifications.stake_removed.add ([&logger] (stakeq::event::stake_removed const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::stake_removed }, "StakeRemoved {} refunded {} to {}", event.id, stakeq::to_string (event.refunded), event.owner.to_string ());
	});
	notifications.item_dequeued.add ([&logger] (stakeq::event::item_dequeued const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::item_dequeued }, "ItemDequeued {} owner {} consumed {}", event.id, event.owner.to_string (), stakeq::to_string (event.consumed));
	});
	notifications.controller_changed.add ([&logger] (stakeq::event::controller_changed const & event) {
		logger.log (stakeq::log::level::info, stakeq::log::logger_id{ stakeq::log::type::notifications, stakeq::log::detail::controller_changed }, "ControllerChanged {} -> {}", event.previous.to_string (), event.controller.to_string ());
	});
}
