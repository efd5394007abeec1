#pragma once

#include <stakeq/lib/errors.hpp>

#include <cpptoml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <string>
#include <utility>
#include <vector>

namespace stakeq
{
/** Manages a table in a toml configuration table hierarchy */
class tomlconfig
{
public:
	tomlconfig ();
	tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<stakeq::error> const & error_a = nullptr);

	stakeq::error & read (std::filesystem::path const & path_a);
	stakeq::error & read (std::istream & stream_overrides, std::filesystem::path const & path_a);
	stakeq::error & read (std::istream & stream_a);
	stakeq::error & read (std::istream & stream_first_a, std::istream & stream_second_a);
	/** Reads \p path_a when it exists, \p overrides_a are `key=value` toml lines that take precedence */
	stakeq::error & read_with_overrides (std::filesystem::path const & path_a, std::vector<std::string> const & overrides_a);
	void write (std::filesystem::path const & path_a);
	void write (std::ostream & stream_a) const;
	void read (std::string const & toml_a);
	std::string to_string () const;

	std::shared_ptr<cpptoml::table> get_tree ();
	bool empty () const;
	std::optional<tomlconfig> get_optional_child (std::string const & key_a);
	tomlconfig get_required_child (std::string const & key_a);
	tomlconfig & put_child (std::string const & key_a, tomlconfig & conf_a);
	tomlconfig & replace_child (std::string const & key_a, tomlconfig & conf_a);
	bool has_key (std::string const & key_a);
	tomlconfig & erase (std::string const & key_a);
	stakeq::error & get_error ();

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	tomlconfig & put (std::string const & key, T const & value)
	{
		tree->insert (key, value);
		return *this;
	}

	/**
	 * Get optional value, using the current value of \p target_a as the default if missing.
	 * @return May return stakeq::error_config::invalid_value
	 */
	template <typename T>
	tomlconfig & get (std::string const & key, T & target)
	{
		get_config<T> (true, key, target, target);
		return *this;
	}

	/**
	 * Get value of optional key, using \p default_value_a if missing.
	 * @return May return stakeq::error_config::invalid_value
	 */
	template <typename T>
	tomlconfig & get_optional (std::string const & key, T & target, T default_value)
	{
		get_config<T> (true, key, target, default_value);
		return *this;
	}

	/**
	 * Get required value.
	 * @note May set stakeq::error_config::missing_value if \p key_a is missing, stakeq::error_config::invalid_value if value is invalid.
	 */
	template <typename T>
	tomlconfig & get_required (std::string const & key, T & target)
	{
		get_config<T> (false, key, target);
		return *this;
	}

	/** Returns the value for key, or throws std::runtime_error if missing or not convertible */
	template <typename T>
	T get (std::string const & key)
	{
		auto value = tree->get_qualified_as<T> (key);
		if (!value)
		{
			throw std::runtime_error ("Missing or invalid value for key: " + key);
		}
		return *value;
	}

	/** All scalar values of type T directly in this table, as key/value pairs */
	template <typename T>
	std::vector<std::pair<std::string, T>> get_values ()
	{
		std::vector<std::pair<std::string, T>> result;
		for (auto & [key, value] : *tree)
		{
			if (auto converted = value->template as<T> ())
			{
				result.emplace_back (key, converted->get ());
			}
		}
		return result;
	}

protected:
	template <typename T, typename = std::enable_if_t<!std::is_same<T, bool>::value>>
	tomlconfig & get_config (bool optional, std::string const & key, T & target, T default_value = T ())
	{
		try
		{
			if (tree->contains_qualified (key))
			{
				auto val (tree->get_qualified_as<T> (key));
				if (val)
				{
					target = *val;
				}
				else
				{
					conditionally_set_error<T> (stakeq::error_config::invalid_value, optional, key);
				}
			}
			else if (!optional)
			{
				conditionally_set_error<T> (stakeq::error_config::missing_value, optional, key);
			}
			else
			{
				target = default_value;
			}
		}
		catch (std::runtime_error & ex)
		{
			conditionally_set_error<T> (ex, optional, key);
		}

		return *this;
	}

	// boolean specialization; toml only allows `true` and `false` literals
	template <typename T, typename = std::enable_if_t<std::is_same<T, bool>::value>>
	tomlconfig & get_config (bool optional, std::string const & key, bool & target, bool default_value = false)
	{
		try
		{
			if (tree->contains_qualified (key))
			{
				auto val (tree->get_qualified_as<bool> (key));
				if (val)
				{
					target = *val;
				}
				else
				{
					conditionally_set_error<bool> (stakeq::error_config::invalid_value, optional, key);
				}
			}
			else if (!optional)
			{
				conditionally_set_error<bool> (stakeq::error_config::missing_value, optional, key);
			}
			else
			{
				target = default_value;
			}
		}
		catch (std::runtime_error & ex)
		{
			conditionally_set_error<bool> (ex, optional, key);
		}
		return *this;
	}

private:
	template <typename T, typename Exception>
	void conditionally_set_error (Exception const & error_a, bool optional_a, std::string const & key_a)
	{
		if (!*error)
		{
			*error = error_a;
			error->set_message ("Missing or invalid value for key: " + key_a);
		}
	}

	/** The config node is being managed by this instance */
	std::shared_ptr<cpptoml::table> tree;

	/** Compound children add their errors to the parent's error object */
	std::shared_ptr<stakeq::error> error;

	/** Merges the tables of \p source_a into \p target_a, \p source_a wins on conflicts */
	static void merge (std::shared_ptr<cpptoml::table> const & target_a, std::shared_ptr<cpptoml::table> const & source_a);
};
}
