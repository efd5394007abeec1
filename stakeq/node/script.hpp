#pragma once

#include <stakeq/lib/errors.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace stakeq
{
class logger;
class notifications;
class registry;
class stats;

/**
 * Replays a line based script of registry operations and prints one result line per command.
 *
 *   register <account> <now>
 *   transfer <from> <to> <amount> <now>
 *   enter <account> <weight> <priority> <id> <now>
 *   change <account> <weight> <priority> <id> <now>
 *   remove <account> <id> <now>
 *   dequeue <account> <now>
 *   set_controller <caller> <controller>
 *   balance <account> <now>
 *   position <id>
 *   queue
 *   accounts
 *   supply
 *
 * Amounts, weights and priorities are decimals scaled by 10^18. Blank lines and lines starting with '#' are skipped.
 * A rejected operation is a result, not a script error. Malformed lines stop the replay.
 */
class script_runner final
{
public:
	script_runner (stakeq::registry &, std::ostream &, stakeq::stats &, stakeq::logger &);

	stakeq::error run (std::istream &);
	stakeq::error execute (std::string const & line);

	std::size_t executed () const;

private: // Dependencies
	stakeq::registry & registry;
	std::ostream & output;
	stakeq::stats & stats;
	stakeq::logger & logger;

private:
	stakeq::error dispatch (std::vector<std::string> const & tokens);

	std::size_t executed_m{ 0 };
};

/** Logs every notification at info level */
void log_notifications (stakeq::notifications &, stakeq::logger &);
}
