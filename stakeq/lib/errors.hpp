#pragma once

#include <algorithm>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>

namespace stakeq
{
/** Common error codes */
enum class error_common
{
	generic = 1,
	exception,
	invalid_argument,
	invalid_type_conversion,
	missing_file,
	parse_failed,
};

/** Configuration related errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value,
};

/** Script replay errors */
enum class error_script
{
	generic = 1,
	unknown_command,
	wrong_argument_count,
	invalid_argument,
};

std::string error_message (stakeq::error_common);
std::string error_message (stakeq::error_config);
std::string error_message (stakeq::error_script);
}

#define STAKEQ_REGISTER_ERROR_CODES(namespace_name, enum_type)                                  \
	namespace namespace_name                                                                    \
	{                                                                                           \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1"); \
		class enum_type##_messages : public std::error_category                                 \
		{                                                                                       \
		public:                                                                                 \
			char const * name () const noexcept override                                        \
			{                                                                                   \
				return #enum_type;                                                              \
			}                                                                                   \
                                                                                                \
			std::string message (int ev) const override                                         \
			{                                                                                   \
				return namespace_name::error_message (static_cast<namespace_name::enum_type> (ev)); \
			}                                                                                   \
		};                                                                                      \
                                                                                                \
		inline std::error_category const & enum_type##_category ()                              \
		{                                                                                       \
			static enum_type##_messages instance;                                               \
			return instance;                                                                    \
		}                                                                                       \
                                                                                                \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                \
		{                                                                                       \
			return { static_cast<int> (err), enum_type##_category () };                         \
		}                                                                                       \
	}                                                                                           \
	namespace std                                                                               \
	{                                                                                           \
		template <>                                                                             \
		struct is_error_code_enum<::namespace_name::enum_type> : public std::true_type          \
		{                                                                                       \
		};                                                                                      \
	}

STAKEQ_REGISTER_ERROR_CODES (stakeq, error_common);
STAKEQ_REGISTER_ERROR_CODES (stakeq, error_config);
STAKEQ_REGISTER_ERROR_CODES (stakeq, error_script);

namespace stakeq
{
/** Adapter for std/boost::error_code, std::exception and bool flags to facilitate unified error handling */
class error
{
public:
	error () = default;
	error (stakeq::error const & error_a) = default;
	error (stakeq::error && error_a) = default;

	error (std::error_code code_a);
	error (std::string message_a);
	error (std::exception const & exception_a);
	error & operator= (stakeq::error const & err_a);
	error & operator= (stakeq::error && err_a);
	error & operator= (std::error_code code_a);
	error & operator= (std::string message_a);
	error & operator= (std::exception const & exception_a);
	bool operator== (std::error_code code_a) const;
	error & then (std::function<stakeq::error &()> next);
	template <typename... ErrorCode>
	error & accept (ErrorCode... err)
	{
		// Convert variadic arguments to std::error_code
		auto codes = { std::error_code (err)... };
		if (std::any_of (codes.begin (), codes.end (), [this] (auto & code_a) { return code == code_a; }))
		{
			code.clear ();
		}

		return *this;
	}
	std::error_code error_code () const;
	explicit operator bool () const;
	explicit operator std::error_code () const;
	std::string get_message () const;
	/**
	 * The error code as an integer. Note that some error codes have platform dependent values.
	 * A return value of 0 signifies there is no error.
	 */
	int error_code_as_int () const;
	error & on_error (std::string message_a);
	error & on_error (std::error_code code_a, std::string message_a);
	error & set (std::string const & message_a, std::error_code code_a = stakeq::error_common::generic);
	error & set_message (std::string const & message_a);
	error & clear ();

private:
	std::error_code code;
	std::string message;
};
}
