#include <stakeq/lib/logging.hpp>

#include <gtest/gtest.h>

int main (int argc, char ** argv)
{
	stakeq::initialize_logging ();
	testing::InitGoogleTest (&argc, argv);
	auto res = RUN_ALL_TESTS ();
	stakeq::release_logging ();
	return res;
}
