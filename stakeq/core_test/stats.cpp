#include <stakeq/lib/stats.hpp>
#include <stakeq/secure/common.hpp>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

TEST (stats, counters)
{
	stakeq::stats stats;
	ASSERT_EQ (0, stats.count (stakeq::stat::type::queue, stakeq::stat::detail::insert));
	stats.inc (stakeq::stat::type::queue, stakeq::stat::detail::insert);
	stats.inc (stakeq::stat::type::queue, stakeq::stat::detail::insert, 4);
	stats.inc (stakeq::stat::type::queue, stakeq::stat::detail::pop);
	ASSERT_EQ (5, stats.count (stakeq::stat::type::queue, stakeq::stat::detail::insert));
	ASSERT_EQ (1, stats.count (stakeq::stat::type::queue, stakeq::stat::detail::pop));
	// The aggregate counts every detail
	ASSERT_EQ (6, stats.count (stakeq::stat::type::queue));
	ASSERT_EQ (0, stats.count (stakeq::stat::type::ledger));

	stats.clear ();
	ASSERT_EQ (0, stats.count (stakeq::stat::type::queue));
}

TEST (stats, dump)
{
	stakeq::stats stats;
	stats.inc (stakeq::stat::type::ledger, stakeq::stat::detail::burn, 3);
	auto dump = stats.dump ();
	ASSERT_NE (std::string::npos, dump.find ("ledger::burn 3"));
	ASSERT_NE (std::string::npos, dump.find ("ledger::all 3"));
}

TEST (stats, concurrent_increments)
{
	stakeq::stats stats;
	std::vector<std::thread> threads;
	for (int i = 0; i < 4; ++i)
	{
		threads.emplace_back ([&stats] () {
			for (int j = 0; j < 1000; ++j)
			{
				stats.inc (stakeq::stat::type::registry, stakeq::stat::detail::transfer);
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ (4000, stats.count (stakeq::stat::type::registry, stakeq::stat::detail::transfer));
}

TEST (stats, enum_names)
{
	ASSERT_EQ ("queue", stakeq::stat::to_string (stakeq::stat::type::queue));
	ASSERT_EQ ("insufficient_balance", stakeq::stat::to_string (stakeq::stat::detail::insufficient_balance));
	for (auto type : stakeq::stat::all_types ())
	{
		ASSERT_NE ('_', stakeq::stat::to_string (type).front ());
	}
	for (auto detail : stakeq::stat::all_details ())
	{
		ASSERT_NE ('_', stakeq::stat::to_string (detail).front ());
	}
}

TEST (stats, status_details)
{
	// Every outcome has a counter of the same name
	for (auto status : { stakeq::stake_status::ok, stakeq::stake_status::queue_empty, stakeq::stake_status::arithmetic_error, stakeq::stake_status::not_owner })
	{
		ASSERT_EQ (stakeq::to_string (status), stakeq::stat::to_string (stakeq::to_stat_detail (status)));
	}
}
