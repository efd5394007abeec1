#include <stakeq/node/notifications.hpp>

void stakeq::notifications::flush ()
{
	// Swap first so an observer that throws leaves nothing behind for the next operation
	decltype (pending) events;
	events.swap (pending);
	for (auto const & event : events)
	{
		event ();
	}
}

void stakeq::notifications::discard ()
{
	pending.clear ();
}

stakeq::container_info stakeq::notifications::container_info () const
{
	stakeq::container_info info;
	info.put ("pending", pending.size (), sizeof (decltype (pending)::value_type));
	info.add ("wallet_registered", wallet_registered.container_info ());
	info.add ("entered_queue", entered_queue.container_info ());
	info.add ("queue_updated", queue_updated.container_info ());
	info.add ("stake_changed", stake_changed.container_info ());
	info.add ("stake_removed", stake_removed.container_info ());
	info.add ("item_dequeued", item_dequeued.container_info ());
	info.add ("controller_changed", controller_changed.container_info ());
	return info;
}
