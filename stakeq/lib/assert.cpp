#include <stakeq/lib/assert.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>

/*
 * Backing code for "release_assert" & "debug_assert", which are macros
 */
void assert_internal (char const * check_expr, char const * func, char const * file, unsigned int line, bool is_release_assert, std::string_view error_msg)
{
	std::stringstream ss;
	ss << "Assertion (" << check_expr << ") failed";
	if (!error_msg.empty ())
	{
		ss << ": " << error_msg;
	}
	ss << "\n"
	   << file << ":" << line << " [" << func << "]"
	   << "'\n";

	// Output to stderr before the logger so the failure is visible even when logging is not set up
	std::cerr << ss.str () << std::endl;

	if (!is_release_assert)
	{
		std::cerr << "(debug assertion)" << std::endl;
	}

	std::abort ();
}
