#include <stakeq/lib/observer_set.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST (observer_set, notify_in_order)
{
	stakeq::observer_set<int, std::string> observers;
	ASSERT_TRUE (observers.empty ());

	std::vector<std::string> calls;
	observers.add ([&calls] (int value, std::string const & text) {
		calls.push_back ("first " + std::to_string (value) + text);
	});
	observers.add ([&calls] (int value, std::string const & text) {
		calls.push_back ("second " + std::to_string (value) + text);
	});
	ASSERT_EQ (2, observers.size ());

	observers.notify (1, "a");
	std::vector<std::string> expected{ "first 1a", "second 1a" };
	ASSERT_EQ (expected, calls);
}

TEST (observer_set, add_during_notify)
{
	stakeq::observer_set<> observers;
	int count = 0;
	observers.add ([&] () {
		++count;
		// Takes effect from the next notification
		observers.add ([&count] () { ++count; });
	});
	observers.notify ();
	ASSERT_EQ (1, count);
	ASSERT_EQ (2, observers.size ());
}

TEST (observer_set, container_info)
{
	stakeq::observer_set<int> observers;
	observers.add ([] (int) {});
	auto info = observers.container_info ();
	ASSERT_EQ (1, info.size_of ("observers"));
}
