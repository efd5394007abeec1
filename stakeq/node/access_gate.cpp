#include <stakeq/node/access_gate.hpp>
#include <stakeq/secure/ledger.hpp>

stakeq::access_gate::access_gate (stakeq::ledger const & ledger_a, stakeq::account const & owner_a, stakeq::account const & controller_a) :
	ledger{ ledger_a },
	owner_m{ owner_a },
	controller_m{ controller_a }
{
}

bool stakeq::access_gate::is_registered (stakeq::account const & account) const
{
	return ledger.is_registered (account);
}

bool stakeq::access_gate::is_controller (stakeq::account const & account) const
{
	return account == controller_m;
}

bool stakeq::access_gate::is_owner (stakeq::account const & account) const
{
	return account == owner_m;
}

stakeq::stake_status stakeq::access_gate::set_controller (stakeq::account const & caller, stakeq::account const & controller)
{
	if (!is_owner (caller))
	{
		return stakeq::stake_status::not_owner;
	}
	controller_m = controller;
	return stakeq::stake_status::ok;
}

stakeq::account stakeq::access_gate::owner () const
{
	return owner_m;
}

stakeq::account stakeq::access_gate::controller () const
{
	return controller_m;
}
