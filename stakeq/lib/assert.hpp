#pragma once

#include <boost/current_function.hpp>

#include <string_view>

[[noreturn]] void assert_internal (char const * check_expr, char const * func, char const * file, unsigned int line, bool is_release_assert, std::string_view error = "");

#define release_assert_1(check) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, true)
#define release_assert_2(check, error_msg) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, true, error_msg)
#define _GET_RELEASE_ASSERT_MACRO(_1, _2, NAME, ...) NAME

/* Runtime assert checks that are kept in release builds */
#define release_assert(...)                                                        \
	_GET_RELEASE_ASSERT_MACRO (__VA_ARGS__, release_assert_2, release_assert_1, _) \
	(__VA_ARGS__)

#ifdef NDEBUG
#define debug_assert(...) (void)0
#else
#define debug_assert_1(check) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, false)
#define debug_assert_2(check, error_msg) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, false, error_msg)
#define _GET_DEBUG_ASSERT_MACRO(_1, _2, NAME, ...) NAME
/* Runtime assert checks that are only active in debug builds */
#define debug_assert(...)                                                      \
	_GET_DEBUG_ASSERT_MACRO (__VA_ARGS__, debug_assert_2, debug_assert_1, _) \
	(__VA_ARGS__)
#endif
