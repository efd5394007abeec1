#pragma once

#include <stakeq/lib/container_info.hpp>
#include <stakeq/lib/stats_enums.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace stakeq
{
/**
 * Collects counters keyed by (type, detail). Every increment also bumps the (type, all) aggregate.
 * Thread safe.
 */
class stats final
{
public:
	stats () = default;
	stats (stats const &) = delete;

	/** Increments the counter for \p type and \p detail by \p value */
	void inc (stakeq::stat::type type, stakeq::stat::detail detail = stakeq::stat::detail::all, uint64_t value = 1);

	/** Returns the current value of the counter, zero if it was never incremented */
	uint64_t count (stakeq::stat::type type, stakeq::stat::detail detail = stakeq::stat::detail::all) const;

	/** Not safe to call concurrently with inc () */
	void clear ();

	/** One `type::detail value` line per non zero counter */
	std::string dump () const;

	stakeq::container_info container_info () const;

private:
	using counter_key = std::pair<stakeq::stat::type, stakeq::stat::detail>;

	std::atomic<uint64_t> & counter (counter_key const &);

	std::map<counter_key, std::unique_ptr<std::atomic<uint64_t>>> counters;
	mutable std::shared_mutex mutex;
};
}
