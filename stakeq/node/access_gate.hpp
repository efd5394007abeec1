#pragma once

#include <stakeq/lib/numbers.hpp>
#include <stakeq/secure/common.hpp>

namespace stakeq
{
class ledger;

/**
 * Role table consulted by queue operations. Registration state is read from the ledger,
 * ownership and the controller role are held here.
 */
class access_gate final
{
public:
	access_gate (stakeq::ledger const &, stakeq::account const & owner, stakeq::account const & controller);

	bool is_registered (stakeq::account const &) const;
	bool is_controller (stakeq::account const &) const;
	bool is_owner (stakeq::account const &) const;

	/** Only the owner may appoint the controller */
	stakeq::stake_status set_controller (stakeq::account const & caller, stakeq::account const & controller);

	stakeq::account owner () const;
	stakeq::account controller () const;

private: // Dependencies
	stakeq::ledger const & ledger;

private:
	stakeq::account const owner_m;
	stakeq::account controller_m;
};
}
