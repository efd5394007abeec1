#include <stakeq/lib/errors.hpp>
#include <stakeq/secure/common.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

TEST (error, codes)
{
	std::error_code code = stakeq::error_config::missing_value;
	ASSERT_EQ ("error_config", std::string{ code.category ().name () });
	ASSERT_FALSE (code.message ().empty ());

	stakeq::error error;
	ASSERT_FALSE (error);
	error = stakeq::error_common::parse_failed;
	ASSERT_TRUE (error);
	ASSERT_EQ (error, stakeq::error_common::parse_failed);
	ASSERT_FALSE (error == stakeq::error_config::generic);
}

TEST (error, messages)
{
	stakeq::error error;
	error.set ("Bad things", stakeq::error_script::unknown_command);
	ASSERT_EQ ("Bad things", error.get_message ());
	ASSERT_EQ (error, stakeq::error_script::unknown_command);

	error.clear ();
	ASSERT_FALSE (error);
	ASSERT_EQ (0, error.error_code_as_int ());

	stakeq::error from_exception{ std::runtime_error ("thrown") };
	ASSERT_TRUE (from_exception);
	ASSERT_EQ ("thrown", from_exception.get_message ());
}

TEST (error, then_and_accept)
{
	stakeq::error error;
	bool called = false;
	error.then ([&] () -> stakeq::error & {
		called = true;
		return error;
	});
	ASSERT_TRUE (called);

	error = stakeq::error_config::missing_value;
	called = false;
	error.then ([&] () -> stakeq::error & {
		called = true;
		return error;
	});
	ASSERT_FALSE (called);

	error.accept (stakeq::error_config::missing_value);
	ASSERT_FALSE (error);
}

TEST (stake_status, categories)
{
	ASSERT_EQ (stakeq::status_category::none, stakeq::category (stakeq::stake_status::ok));
	ASSERT_EQ (stakeq::status_category::validation, stakeq::category (stakeq::stake_status::already_registered));
	ASSERT_EQ (stakeq::status_category::validation, stakeq::category (stakeq::stake_status::not_in_queue));
	ASSERT_EQ (stakeq::status_category::validation, stakeq::category (stakeq::stake_status::invalid_weight));
	ASSERT_EQ (stakeq::status_category::balance, stakeq::category (stakeq::stake_status::insufficient_balance));
	ASSERT_EQ (stakeq::status_category::authorization, stakeq::category (stakeq::stake_status::not_authorized));
	ASSERT_EQ (stakeq::status_category::authorization, stakeq::category (stakeq::stake_status::not_owner));
	ASSERT_EQ (stakeq::status_category::arithmetic, stakeq::category (stakeq::stake_status::arithmetic_error));
	ASSERT_EQ ("insufficient_balance", stakeq::to_string (stakeq::stake_status::insufficient_balance));
	ASSERT_EQ ("authorization", stakeq::to_string (stakeq::status_category::authorization));
}

TEST (stake_entry, ranking)
{
	stakeq::stake_entry a;
	a.priority = 10;
	a.weight = 2;
	a.timestamp = 5;
	auto b = a;

	ASSERT_FALSE (a.ranks_ahead_of (b));
	ASSERT_FALSE (b.ranks_ahead_of (a));

	b.timestamp = 6;
	ASSERT_TRUE (a.ranks_ahead_of (b));

	// Weight decides before timestamp
	b.weight = 1;
	ASSERT_TRUE (b.ranks_ahead_of (a));

	// Priority decides before weight
	a.priority = 11;
	ASSERT_TRUE (a.ranks_ahead_of (b));
	ASSERT_FALSE (b.ranks_ahead_of (a));
}
