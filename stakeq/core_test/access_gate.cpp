#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/node/access_gate.hpp>
#include <stakeq/secure/ledger.hpp>

#include <gtest/gtest.h>

namespace
{
class gate_context final
{
public:
	gate_context () :
		logger{ stakeq::log_config::tests_default () },
		ledger{ stakeq::ledger_constants{}, stats, logger },
		gate{ ledger, 1, 2 }
	{
	}

	stakeq::logger logger;
	stakeq::stats stats;
	stakeq::ledger ledger;
	stakeq::access_gate gate;
};
}

TEST (access_gate, roles)
{
	gate_context ctx;
	ASSERT_TRUE (ctx.gate.is_owner (1));
	ASSERT_FALSE (ctx.gate.is_owner (2));
	ASSERT_TRUE (ctx.gate.is_controller (2));
	ASSERT_FALSE (ctx.gate.is_controller (1));
	ASSERT_EQ (stakeq::account{ 1 }, ctx.gate.owner ());
	ASSERT_EQ (stakeq::account{ 2 }, ctx.gate.controller ());
}

TEST (access_gate, registration_follows_ledger)
{
	gate_context ctx;
	ASSERT_FALSE (ctx.gate.is_registered (3));
	ctx.ledger.register_account (3, 0);
	ASSERT_TRUE (ctx.gate.is_registered (3));
	// Roles do not imply registration
	ASSERT_FALSE (ctx.gate.is_registered (1));
}

TEST (access_gate, set_controller)
{
	gate_context ctx;
	ASSERT_EQ (stakeq::stake_status::not_owner, ctx.gate.set_controller (2, 3));
	ASSERT_TRUE (ctx.gate.is_controller (2));

	ASSERT_EQ (stakeq::stake_status::ok, ctx.gate.set_controller (1, 3));
	ASSERT_TRUE (ctx.gate.is_controller (3));
	ASSERT_FALSE (ctx.gate.is_controller (2));

	// The owner may take the role itself
	ASSERT_EQ (stakeq::stake_status::ok, ctx.gate.set_controller (1, 1));
	ASSERT_TRUE (ctx.gate.is_controller (1));
	ASSERT_TRUE (ctx.gate.is_owner (1));
}
