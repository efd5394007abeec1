#include <stakeq/lib/assert.hpp>
#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/node/access_gate.hpp>
#include <stakeq/node/notifications.hpp>
#include <stakeq/node/stake_queue.hpp>
#include <stakeq/secure/ledger.hpp>
#include <stakeq/secure/pricing.hpp>

stakeq::stake_queue::stake_queue (stakeq::ledger & ledger_a, stakeq::notifications & notifications_a, stakeq::stats & stats_a, stakeq::logger & logger_a) :
	ledger{ ledger_a },
	notifications{ notifications_a },
	stats{ stats_a },
	logger{ logger_a }
{
}

stakeq::stake_status stakeq::stake_queue::enter (stakeq::access_gate const & gate, stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id id, stakeq::seconds_t now)
{
	if (!gate.is_registered (caller))
	{
		return stakeq::stake_status::unregistered;
	}
	if (exists (id))
	{
		return stakeq::stake_status::already_queued;
	}

	auto cost = stakeq::pricing::cost (weight, priority);
	if (!cost)
	{
		return stakeq::stake_status::invalid_weight;
	}
	auto const locked = locked_m + *cost;

	if (auto status = ledger.burn (caller, *cost, now); status != stakeq::stake_status::ok)
	{
		return status;
	}

	stakeq::stake_entry entry;
	entry.id = id;
	entry.owner = caller;
	entry.weight = weight;
	entry.priority = priority;
	entry.staked = *cost;
	entry.timestamp = now;

	auto [it, inserted] = entries.insert (value_type{ entry, next_sequence++ });
	release_assert (inserted);
	locked_m = locked;
	debug_assert (locked_m == ledger.escrowed ());

	auto const position = rank (it);

	stats.inc (stakeq::stat::type::queue, stakeq::stat::detail::insert);
	logger.debug (stakeq::log::type::queue, "Entered queue: {} at position {}", entry.to_string (), position);

	notifications.post (notifications.entered_queue, { caller, id, entry.staked });
	notifications.post (notifications.queue_updated, { id, position });
	return stakeq::stake_status::ok;
}

stakeq::stake_status stakeq::stake_queue::change (stakeq::account const & caller, stakeq::uint128_t const & weight, stakeq::uint128_t const & priority, stakeq::external_id id, stakeq::seconds_t now)
{
	auto & index = entries.get<tag_id> ();
	auto existing = index.find (id);
	if (existing == index.end ())
	{
		return stakeq::stake_status::not_in_queue;
	}
	if (existing->entry.owner != caller)
	{
		return stakeq::stake_status::not_authorized;
	}

	auto new_cost = stakeq::pricing::cost (weight, priority);
	if (!new_cost)
	{
		return stakeq::stake_status::invalid_weight;
	}

	auto const & old_cost = existing->entry.staked;
	auto const old_position = rank (existing);

	// Settle the difference with the owner, locked total is computed first so a failure leaves no trace
	if (*new_cost > old_cost)
	{
		auto const delta = *new_cost - old_cost;
		auto const locked = locked_m + delta;
		if (auto status = ledger.burn (caller, delta, now); status != stakeq::stake_status::ok)
		{
			return status;
		}
		locked_m = locked;
	}
	else if (*new_cost < old_cost)
	{
		auto const delta = old_cost - *new_cost;
		auto const locked = locked_m - delta;
		if (auto status = ledger.mint (caller, delta, now); status != stakeq::stake_status::ok)
		{
			return status;
		}
		locked_m = locked;
	}

	auto const sequence = next_sequence++;
	auto modified = index.modify (existing, [&] (value_type & value) {
		value.entry.weight = weight;
		value.entry.priority = priority;
		value.entry.staked = *new_cost;
		value.entry.timestamp = now;
		value.sequence = sequence;
	});
	release_assert (modified);
	debug_assert (locked_m == ledger.escrowed ());

	auto const new_position = rank (existing);

	stats.inc (stakeq::stat::type::queue, old_position == new_position ? stakeq::stat::detail::unchanged_position : stakeq::stat::detail::reposition);
	logger.debug (stakeq::log::type::queue, "Changed stake: {} moved from {} to {}", existing->entry.to_string (), old_position, new_position);

	notifications.post (notifications.stake_changed, { caller, id, *new_cost, new_position });
	if (old_position != new_position)
	{
		notifications.post (notifications.queue_updated, { id, new_position });
	}
	return stakeq::stake_status::ok;
}

stakeq::stake_status stakeq::stake_queue::remove (stakeq::access_gate const & gate, stakeq::account const & caller, stakeq::external_id id, stakeq::seconds_t now)
{
	auto & index = entries.get<tag_id> ();
	auto existing = index.find (id);
	if (existing == index.end ())
	{
		return stakeq::stake_status::not_in_queue;
	}
	if (existing->entry.owner != caller && !gate.is_owner (caller))
	{
		return stakeq::stake_status::not_authorized;
	}

	auto const entry = existing->entry;
	auto const locked = locked_m - entry.staked;

	// Refund goes to the entry owner regardless of who removed it
	if (auto status = ledger.mint (entry.owner, entry.staked, now); status != stakeq::stake_status::ok)
	{
		return status;
	}

	index.erase (existing);
	locked_m = locked;
	debug_assert (locked_m == ledger.escrowed ());

	stats.inc (stakeq::stat::type::queue, stakeq::stat::detail::erase);
	logger.debug (stakeq::log::type::queue, "Removed stake: {}", entry.to_string ());

	notifications.post (notifications.stake_removed, { entry.owner, id, entry.staked });
	return stakeq::stake_status::ok;
}

auto stakeq::stake_queue::dequeue (stakeq::access_gate const & gate, stakeq::account const & caller, stakeq::seconds_t now) -> dequeue_result
{
	if (!gate.is_controller (caller))
	{
		return { stakeq::stake_status::not_authorized, std::nullopt };
	}
	if (empty ())
	{
		return { stakeq::stake_status::queue_empty, std::nullopt };
	}

	auto const entry = *top ();
	auto const locked = locked_m - entry.staked;

	ledger.destroy (entry.staked);
	entries.get<tag_id> ().erase (entry.id);
	locked_m = locked;
	debug_assert (locked_m == ledger.escrowed ());

	stats.inc (stakeq::stat::type::queue, stakeq::stat::detail::pop);
	logger.debug (stakeq::log::type::queue, "Dequeued at {}: {}", now, entry.to_string ());

	notifications.post (notifications.item_dequeued, { entry.owner, entry.id, entry.staked });
	return { stakeq::stake_status::ok, entry };
}

std::size_t stakeq::stake_queue::rank (id_iterator it) const
{
	auto const & index = entries.get<tag_rank> ();
	return index.rank (entries.project<tag_rank> (it));
}

std::optional<std::size_t> stakeq::stake_queue::position (stakeq::external_id id) const
{
	auto const & index = entries.get<tag_id> ();
	if (auto existing = index.find (id); existing != index.end ())
	{
		return rank (existing);
	}
	return std::nullopt;
}

std::optional<stakeq::stake_entry> stakeq::stake_queue::entry (stakeq::external_id id) const
{
	auto const & index = entries.get<tag_id> ();
	if (auto existing = index.find (id); existing != index.end ())
	{
		return existing->entry;
	}
	return std::nullopt;
}

std::optional<stakeq::stake_entry> stakeq::stake_queue::top () const
{
	auto const & index = entries.get<tag_rank> ();
	if (index.empty ())
	{
		return std::nullopt;
	}
	return index.begin ()->entry;
}

std::vector<stakeq::stake_entry> stakeq::stake_queue::contents () const
{
	std::vector<stakeq::stake_entry> result;
	result.reserve (entries.size ());
	for (auto const & value : entries.get<tag_rank> ())
	{
		result.push_back (value.entry);
	}
	return result;
}

bool stakeq::stake_queue::exists (stakeq::external_id id) const
{
	auto const & index = entries.get<tag_id> ();
	return index.find (id) != index.end ();
}

std::size_t stakeq::stake_queue::size () const
{
	return entries.size ();
}

bool stakeq::stake_queue::empty () const
{
	return entries.empty ();
}

stakeq::uint128_t stakeq::stake_queue::locked () const
{
	return locked_m;
}

stakeq::container_info stakeq::stake_queue::container_info () const
{
	stakeq::container_info info;
	info.put ("entries", entries.size (), sizeof (decltype (entries)::value_type));
	return info;
}
