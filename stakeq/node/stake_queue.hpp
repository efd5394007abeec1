#pragma once

#include <stakeq/lib/container_info.hpp>
#include <stakeq/lib/numbers.hpp>
#include <stakeq/secure/common.hpp>

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/identity.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ranked_index.hpp>
#include <boost/multi_index_container.hpp>

#include <optional>
#include <vector>

namespace mi = boost::multi_index;

namespace stakeq
{
class access_gate;
class ledger;
class logger;
class notifications;
class stats;

/**
 * Waitlist of stakes ordered by priority (descending), weight (ascending) and timestamp (ascending).
 * Position 0 is served next. Positions are derived from a ranked index so the position of every live
 * entry always equals its place in the ordering.
 *
 * Stakes are escrowed through the ledger: entering and raising a stake burns, lowering or removing a stake
 * mints the difference back to the owner, dequeuing destroys the stake.
 */
class stake_queue final
{
public:
	stake_queue (stakeq::ledger &, stakeq::notifications &, stakeq::stats &, stakeq::logger &);

	stakeq::stake_status enter (stakeq::access_gate const &, stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id, stakeq::seconds_t now);
	stakeq::stake_status change (stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id, stakeq::seconds_t now);
	stakeq::stake_status remove (stakeq::access_gate const &, stakeq::account const & caller, stakeq::external_id, stakeq::seconds_t now);

	struct dequeue_result
	{
		stakeq::stake_status status;
		std::optional<stakeq::stake_entry> entry;
	};
	/** Consumes the head entry, the stake is not refunded */
	dequeue_result dequeue (stakeq::access_gate const &, stakeq::account const & caller, stakeq::seconds_t now);

	std::optional<std::size_t> position (stakeq::external_id) const;
	std::optional<stakeq::stake_entry> entry (stakeq::external_id) const;
	std::optional<stakeq::stake_entry> top () const;
	/** Entries in serving order */
	std::vector<stakeq::stake_entry> contents () const;

	bool exists (stakeq::external_id) const;
	std::size_t size () const;
	bool empty () const;
	/** Sum of staked coins of all live entries */
	stakeq::uint128_t locked () const;

	stakeq::container_info container_info () const;

private: // Dependencies
	stakeq::ledger & ledger;
	stakeq::notifications & notifications;
	stakeq::stats & stats;
	stakeq::logger & logger;

private:
	struct value_type
	{
		stakeq::stake_entry entry;
		// Breaks ties between entries with equal keys, earlier (re)pricing is served first
		uint64_t sequence;

		stakeq::external_id id () const
		{
			return entry.id;
		}
	};

	struct serving_order
	{
		bool operator() (value_type const & lhs, value_type const & rhs) const
		{
			if (lhs.entry.ranks_ahead_of (rhs.entry))
			{
				return true;
			}
			if (rhs.entry.ranks_ahead_of (lhs.entry))
			{
				return false;
			}
			return lhs.sequence < rhs.sequence;
		}
	};

	// clang-format off
	class tag_id {};
	class tag_rank {};

	using ordered_entries = boost::multi_index_container<value_type,
	mi::indexed_by<
		mi::hashed_unique<mi::tag<tag_id>,
			mi::const_mem_fun<value_type, stakeq::external_id, &value_type::id>>,
		mi::ranked_unique<mi::tag<tag_rank>,
			mi::identity<value_type>, serving_order>
	>>;
	// clang-format on

	using id_iterator = ordered_entries::index<tag_id>::type::iterator;
	std::size_t rank (id_iterator) const;

	ordered_entries entries;
	uint64_t next_sequence{ 0 };
	stakeq::uint128_t locked_m{ 0 };
};
}
