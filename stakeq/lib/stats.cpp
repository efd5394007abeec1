#include <stakeq/lib/stats.hpp>

#include <fmt/format.h>

#include <sstream>

void stakeq::stats::inc (stakeq::stat::type type, stakeq::stat::detail detail, uint64_t value)
{
	counter ({ type, detail }) += value;
	if (detail != stakeq::stat::detail::all)
	{
		counter ({ type, stakeq::stat::detail::all }) += value;
	}
}

uint64_t stakeq::stats::count (stakeq::stat::type type, stakeq::stat::detail detail) const
{
	std::shared_lock lock{ mutex };
	if (auto it = counters.find ({ type, detail }); it != counters.end ())
	{
		return it->second->load ();
	}
	return 0;
}

void stakeq::stats::clear ()
{
	std::unique_lock lock{ mutex };
	counters.clear ();
}

std::string stakeq::stats::dump () const
{
	std::shared_lock lock{ mutex };
	std::stringstream ss;
	for (auto const & [key, value] : counters)
	{
		auto const & [type, detail] = key;
		if (auto current = value->load (); current > 0)
		{
			ss << fmt::format ("{}::{} {}", stakeq::stat::to_string (type), stakeq::stat::to_string (detail), current) << std::endl;
		}
	}
	return ss.str ();
}

stakeq::container_info stakeq::stats::container_info () const
{
	std::shared_lock lock{ mutex };
	stakeq::container_info info;
	info.put ("counters", counters.size (), sizeof (decltype (counters)::value_type));
	return info;
}

std::atomic<uint64_t> & stakeq::stats::counter (counter_key const & key)
{
	// This is a two-step process to avoid exclusively locking the mutex in the common case
	{
		std::shared_lock lock{ mutex };
		if (auto it = counters.find (key); it != counters.end ())
		{
			return *it->second;
		}
	}
	{
		std::unique_lock lock{ mutex };
		auto [it, inserted] = counters.try_emplace (key, std::make_unique<std::atomic<uint64_t>> (0));
		return *it->second;
	}
}
