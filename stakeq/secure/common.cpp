#define MAGIC_ENUM_RANGE_MIN 0
#define MAGIC_ENUM_RANGE_MAX 256

#include <stakeq/lib/assert.hpp>
#include <stakeq/secure/common.hpp>

#include <fmt/format.h>
#include <magic_enum.hpp>

std::string_view stakeq::to_string (stakeq::stake_status status)
{
	return magic_enum::enum_name (status);
}

std::string_view stakeq::to_string (stakeq::status_category category)
{
	return magic_enum::enum_name (category);
}

stakeq::status_category stakeq::category (stakeq::stake_status status)
{
	switch (status)
	{
		case stakeq::stake_status::ok:
			return stakeq::status_category::none;
		case stakeq::stake_status::already_registered:
		case stakeq::stake_status::unregistered:
		case stakeq::stake_status::unregistered_sender:
		case stakeq::stake_status::unregistered_recipient:
		case stakeq::stake_status::already_queued:
		case stakeq::stake_status::not_in_queue:
		case stakeq::stake_status::invalid_weight:
		case stakeq::stake_status::queue_empty:
			return stakeq::status_category::validation;
		case stakeq::stake_status::insufficient_balance:
			return stakeq::status_category::balance;
		case stakeq::stake_status::not_authorized:
		case stakeq::stake_status::not_owner:
			return stakeq::status_category::authorization;
		case stakeq::stake_status::arithmetic_error:
			return stakeq::status_category::arithmetic;
	}
	return stakeq::status_category::none;
}

stakeq::stat::detail stakeq::to_stat_detail (stakeq::stake_status status)
{
	auto value = magic_enum::enum_cast<stakeq::stat::detail> (magic_enum::enum_name (status));
	debug_assert (value.has_value ());
	return value.value_or (stakeq::stat::detail{});
}

bool stakeq::stake_entry::ranks_ahead_of (stake_entry const & other) const
{
	if (priority != other.priority)
	{
		return priority > other.priority;
	}
	if (weight != other.weight)
	{
		return weight < other.weight;
	}
	return timestamp < other.timestamp;
}

std::string stakeq::stake_entry::to_string () const
{
	return fmt::format ("id: {}, owner: {}, weight: {}, priority: {}, staked: {}, timestamp: {}", id, owner.to_string (), stakeq::to_string (weight), stakeq::to_string (priority), stakeq::to_string (staked), timestamp);
}
