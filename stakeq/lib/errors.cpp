#include <stakeq/lib/errors.hpp>

#include <algorithm>
#include <functional>

std::string stakeq::error_message (stakeq::error_common ev)
{
	switch (ev)
	{
		case stakeq::error_common::generic:
			return "Unknown error";
		case stakeq::error_common::exception:
			return "An unexpected exception was thrown";
		case stakeq::error_common::invalid_argument:
			return "Invalid argument";
		case stakeq::error_common::invalid_type_conversion:
			return "Invalid type conversion";
		case stakeq::error_common::missing_file:
			return "File not found";
		case stakeq::error_common::parse_failed:
			return "Parsing failed";
	}

	return "Invalid error code";
}

std::string stakeq::error_message (stakeq::error_config ev)
{
	switch (ev)
	{
		case stakeq::error_config::generic:
			return "Unknown error";
		case stakeq::error_config::invalid_value:
			return "Invalid configuration value";
		case stakeq::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

std::string stakeq::error_message (stakeq::error_script ev)
{
	switch (ev)
	{
		case stakeq::error_script::generic:
			return "Unknown error";
		case stakeq::error_script::unknown_command:
			return "Unknown command";
		case stakeq::error_script::wrong_argument_count:
			return "Wrong number of arguments";
		case stakeq::error_script::invalid_argument:
			return "Invalid argument";
	}

	return "Invalid error code";
}

stakeq::error::error (std::error_code code_a)
{
	code = code_a;
}

stakeq::error::error (std::string message_a)
{
	code = stakeq::error_common::generic;
	message = std::move (message_a);
}

stakeq::error::error (std::exception const & exception_a)
{
	code = stakeq::error_common::exception;
	message = exception_a.what ();
}

stakeq::error & stakeq::error::operator= (stakeq::error const & err_a)
{
	code = err_a.code;
	message = err_a.message;
	return *this;
}

stakeq::error & stakeq::error::operator= (stakeq::error && err_a)
{
	code = err_a.code;
	message = std::move (err_a.message);
	return *this;
}

/** Assign error code */
stakeq::error & stakeq::error::operator= (std::error_code const code_a)
{
	code = code_a;
	message.clear ();
	return *this;
}

/** Set the error to error_common::generic and the error message to \p message_a */
stakeq::error & stakeq::error::operator= (std::string message_a)
{
	code = stakeq::error_common::generic;
	message = std::move (message_a);
	return *this;
}

/** Sets the error to error_common::exception and adopts the exception error message. */
stakeq::error & stakeq::error::operator= (std::exception const & exception_a)
{
	code = stakeq::error_common::exception;
	message = exception_a.what ();
	return *this;
}

/** Return true if this#error_code equals the parameter */
bool stakeq::error::operator== (std::error_code const code_a) const
{
	return code == code_a;
}

/** Call the function iff the current error is zero */
stakeq::error & stakeq::error::then (std::function<stakeq::error &()> next)
{
	return code ? *this : next ();
}

/** Implicit stakeq::error to bool conversion; true if there's an error */
stakeq::error::operator bool () const
{
	return code.value () != 0;
}

/** Implicit conversion to std::error_code */
stakeq::error::operator std::error_code () const
{
	return code;
}

std::error_code stakeq::error::error_code () const
{
	return code;
}

int stakeq::error::error_code_as_int () const
{
	return code.value ();
}

/** Get error message, or an empty string if there's no error. If a custom error message is set, that will be returned, otherwise the error_code#message() is returned. */
std::string stakeq::error::get_message () const
{
	std::string res = message;
	if (code && res.empty ())
	{
		res = code.message ();
	}
	return res;
}

/** Set an error message, but only if the error code is already set */
stakeq::error & stakeq::error::on_error (std::string message_a)
{
	if (code.value () != 0)
	{
		message = std::move (message_a);
	}
	return *this;
}

/** Set an error message if the current error code matches \p code_a */
stakeq::error & stakeq::error::on_error (std::error_code code_a, std::string message_a)
{
	if (code == code_a)
	{
		message = std::move (message_a);
	}
	return *this;
}

/** Set an error message and an error code */
stakeq::error & stakeq::error::set (std::string const & message_a, std::error_code code_a)
{
	message = message_a;
	code = code_a;
	return *this;
}

/** Set a custom error message. If the error code is not set, it will be set to error_common::generic. */
stakeq::error & stakeq::error::set_message (std::string const & message_a)
{
	if (code.value () == 0)
	{
		code = stakeq::error_common::generic;
	}
	message = message_a;
	return *this;
}

/** Clear an errors */
stakeq::error & stakeq::error::clear ()
{
	code.clear ();
	message.clear ();
	return *this;
}
