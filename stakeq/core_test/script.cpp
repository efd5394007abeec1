#include <stakeq/lib/stats.hpp>
#include <stakeq/node/script.hpp>
#include <stakeq/test_common/registry_context.hpp>

#include <gtest/gtest.h>

#include <sstream>

namespace
{
class script_context final
{
public:
	script_context () :
		runner{ ctx.registry, output, ctx.stats, ctx.logger }
	{
	}

	stakeq::error run (std::string const & script)
	{
		std::stringstream stream{ script };
		return runner.run (stream);
	}

	stakeq::test::registry_context ctx;
	std::stringstream output;
	stakeq::script_runner runner;
};
}

TEST (script, replay)
{
	script_context script;
	auto error = script.run (R"script(
# owner is acc_..0a, controller is acc_..0c
register 1 0
register 1 0
balance 1 100
enter 1 2 5 7 100
position 7
position 8
dequeue 1 100
dequeue acc_000000000000000c 100
queue
accounts
supply
)script");
	ASSERT_FALSE (error) << error.get_message ();
	ASSERT_EQ (11, script.runner.executed ());

	std::string expected = "register: ok\n"
						   "register: already_registered\n"
						   "balance: acc_0000000000000001 regular 100 restricted 50\n"
						   "enter: ok\n"
						   "position: 7 at 0\n"
						   "position: not_in_queue\n"
						   "dequeue: not_authorized\n"
						   "dequeue: ok\n"
						   "  consumed 7 owner acc_0000000000000001 staked 19.00892008461965221\n"
						   "queue: 0 entries\n"
						   "accounts: 1\n"
						   "  acc_0000000000000001\n"
						   "supply: accrued 150 settled 130.99107991538034779 locked 0 destroyed 19.00892008461965221\n";
	ASSERT_EQ (expected, script.output.str ());
}

TEST (script, transfer_change_remove)
{
	script_context script;
	auto error = script.run (R"script(
register 1 0
register 2 0
transfer 1 2 30 100
balance 1 100
balance 2 100
enter 2 1.2 10 1 100
enter 2 1.2 20 2 100
change 2 1.2 30 1 100
queue
remove 1 1 100
remove 2 1 100
set_controller 2 2
set_controller acc_000000000000000a 2
)script");
	ASSERT_FALSE (error) << error.get_message ();

	std::string expected = "register: ok\n"
						   "register: ok\n"
						   "transfer: ok\n"
						   "balance: acc_0000000000000001 regular 100 restricted 20\n"
						   "balance: acc_0000000000000002 regular 100 restricted 80\n"
						   "enter: ok\n"
						   "enter: ok\n"
						   "change: ok\n"
						   "queue: 2 entries\n"
						   "  0 id 1 owner acc_0000000000000002 weight 1.2 priority 30 staked 30\n"
						   "  1 id 2 owner acc_0000000000000002 weight 1.2 priority 20 staked 20\n"
						   "remove: not_authorized\n"
						   "remove: ok\n"
						   "set_controller: not_owner\n"
						   "set_controller: ok\n";
	ASSERT_EQ (expected, script.output.str ());
	ASSERT_EQ (stakeq::account{ 2 }, script.ctx.registry.controller ());
}

TEST (script, unknown_command)
{
	script_context script;
	auto error = script.run ("register 1 0\nfly 1\nregister 2 0\n");
	ASSERT_TRUE (error);
	ASSERT_EQ (error, stakeq::error_script::unknown_command);
	ASSERT_EQ (0, error.get_message ().find ("line 2: "));
	// Replay stops at the failing line
	ASSERT_EQ (1, script.runner.executed ());
	ASSERT_FALSE (script.ctx.registry.is_registered (2));
	ASSERT_EQ (1, script.ctx.stats.count (stakeq::stat::type::script, stakeq::stat::detail::command_failed));
}

TEST (script, argument_errors)
{
	script_context script;
	ASSERT_EQ (script.runner.execute ("register 1"), stakeq::error_script::wrong_argument_count);
	ASSERT_EQ (script.runner.execute ("queue extra"), stakeq::error_script::wrong_argument_count);
	ASSERT_EQ (script.runner.execute ("register x 0"), stakeq::error_script::invalid_argument);
	ASSERT_EQ (script.runner.execute ("register 1 -5"), stakeq::error_script::invalid_argument);
	ASSERT_EQ (script.runner.execute ("transfer 1 2 1.0000000000000000001 0"), stakeq::error_script::invalid_argument);
	ASSERT_EQ (0, script.runner.executed ());
	ASSERT_TRUE (script.output.str ().empty ());
}

// The count is checked before any argument is parsed, malformed arguments in a line of the wrong length are not reported
TEST (script, argument_count_checked_first)
{
	script_context script;
	auto error = script.runner.execute ("enter x y z");
	ASSERT_EQ (error, stakeq::error_script::wrong_argument_count);
	ASSERT_EQ ("enter expects 5 arguments, got 3", error.get_message ());

	error = script.runner.execute ("enter x 2 5 7 100");
	ASSERT_EQ (error, stakeq::error_script::invalid_argument);
	ASSERT_EQ (2, script.ctx.stats.count (stakeq::stat::type::script, stakeq::stat::detail::command_failed));
	ASSERT_EQ (0, script.runner.executed ());
}

TEST (script, balance_in_the_past)
{
	script_context script;
	ASSERT_FALSE (script.runner.execute ("register 1 100"));
	ASSERT_EQ (script.runner.execute ("balance 1 50"), stakeq::error_script::invalid_argument);
}

TEST (script, comments_and_blank_lines)
{
	script_context script;
	ASSERT_FALSE (script.run ("\n   \n# nothing\n\taccounts\n"));
	ASSERT_EQ ("accounts: 0\n", script.output.str ());
	ASSERT_EQ (1, script.runner.executed ());
}
