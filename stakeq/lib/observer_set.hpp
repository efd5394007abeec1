#pragma once

#include <stakeq/lib/container_info.hpp>

#include <functional>
#include <mutex>
#include <vector>

namespace stakeq
{
template <typename... T>
class observer_set final
{
public:
	using observer_t = std::function<void (T const &...)>;

	void add (observer_t const & observer_a)
	{
		std::lock_guard<std::mutex> lock{ mutex };
		observers.push_back (observer_a);
	}

	void notify (T const &... args) const
	{
		// Make observers copy to allow adding observers from within a notification
		std::unique_lock<std::mutex> lock{ mutex };
		auto observers_copy = observers;
		lock.unlock ();

		for (auto & i : observers_copy)
		{
			i (args...);
		}
	}

	bool empty () const
	{
		std::lock_guard<std::mutex> lock{ mutex };
		return observers.empty ();
	}

	std::size_t size () const
	{
		std::lock_guard<std::mutex> lock{ mutex };
		return observers.size ();
	}

	stakeq::container_info container_info () const
	{
		std::lock_guard<std::mutex> lock{ mutex };

		stakeq::container_info info;
		info.put ("observers", observers.size (), sizeof (observer_t));
		return info;
	}

private:
	mutable std::mutex mutex;
	std::vector<observer_t> observers;
};
}
