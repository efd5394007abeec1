#include <stakeq/lib/tomlconfig.hpp>

#include <fstream>

stakeq::tomlconfig::tomlconfig () :
	tree (cpptoml::make_table ())
{
	error = std::make_shared<stakeq::error> ();
}

stakeq::tomlconfig::tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<stakeq::error> const & error_a) :
	tree (tree_a), error (error_a)
{
	if (!error)
	{
		error = std::make_shared<stakeq::error> ();
	}
}

/**
 * Reads a toml document from the file
 * @return stakeq::errror&, including a descriptive error message if the config file is malformed.
 */
stakeq::error & stakeq::tomlconfig::read (std::filesystem::path const & path_a)
{
	std::stringstream stream_override_empty;
	stream_override_empty << std::endl;
	return read (stream_override_empty, path_a);
}

stakeq::error & stakeq::tomlconfig::read (std::istream & stream_overrides, std::filesystem::path const & path_a)
{
	std::fstream stream;
	stream.open (path_a, std::ios_base::in);
	if (!stream.fail ())
	{
		read (stream_overrides, stream);
		stream.close ();
	}
	else
	{
		error->set ("Unable to open " + path_a.string (), stakeq::error_common::missing_file);
	}
	return *error;
}

/** Read from two streams where keys in the first will take precedence over those in the second stream. */
stakeq::error & stakeq::tomlconfig::read (std::istream & stream_first_a, std::istream & stream_second_a)
{
	try
	{
		tree = cpptoml::parser (stream_second_a).parse ();
		auto overrides = cpptoml::parser (stream_first_a).parse ();
		merge (tree, overrides);
	}
	catch (std::runtime_error const & ex)
	{
		error->set (ex.what (), stakeq::error_common::parse_failed);
	}
	return *error;
}

stakeq::error & stakeq::tomlconfig::read_with_overrides (std::filesystem::path const & path_a, std::vector<std::string> const & overrides_a)
{
	std::stringstream overrides_stream;
	for (auto const & line : overrides_a)
	{
		overrides_stream << line << std::endl;
	}
	overrides_stream << std::endl;

	// Running without a config file is the default, only overrides apply then
	if (std::filesystem::exists (path_a))
	{
		return read (overrides_stream, path_a);
	}
	return read (overrides_stream);
}

stakeq::error & stakeq::tomlconfig::read (std::istream & stream_a)
{
	try
	{
		tree = cpptoml::parser (stream_a).parse ();
	}
	catch (std::runtime_error const & ex)
	{
		error->set (ex.what (), stakeq::error_common::parse_failed);
	}
	return *error;
}

void stakeq::tomlconfig::read (std::string const & toml_a)
{
	std::stringstream stream;
	stream << toml_a;
	read (stream);
}

void stakeq::tomlconfig::write (std::filesystem::path const & path_a)
{
	std::fstream stream;
	stream.open (path_a, std::ios_base::out | std::ios_base::trunc);
	if (stream.fail ())
	{
		error->set ("Unable to write " + path_a.string (), stakeq::error_common::missing_file);
		return;
	}
	write (stream);
}

void stakeq::tomlconfig::write (std::ostream & stream_a) const
{
	stream_a << *tree;
}

std::string stakeq::tomlconfig::to_string () const
{
	std::stringstream ss;
	write (ss);
	return ss.str ();
}

std::shared_ptr<cpptoml::table> stakeq::tomlconfig::get_tree ()
{
	return tree;
}

bool stakeq::tomlconfig::empty () const
{
	return tree->empty ();
}

std::optional<stakeq::tomlconfig> stakeq::tomlconfig::get_optional_child (std::string const & key_a)
{
	std::optional<tomlconfig> child_config;
	if (tree->contains (key_a))
	{
		auto child = tree->get_table (key_a);
		if (child)
		{
			child_config = tomlconfig (child, error);
		}
		else
		{
			error->set ("Value for key " + key_a + " is not a table", stakeq::error_config::invalid_value);
		}
	}
	return child_config;
}

stakeq::tomlconfig stakeq::tomlconfig::get_required_child (std::string const & key_a)
{
	auto child = tree->get_table (key_a);
	if (!child)
	{
		*error = stakeq::error_config::missing_value;
		error->set_message ("Missing configuration node: " + key_a);
		return tomlconfig (cpptoml::make_table (), error);
	}
	return tomlconfig (child, error);
}

stakeq::tomlconfig & stakeq::tomlconfig::put_child (std::string const & key_a, stakeq::tomlconfig & conf_a)
{
	tree->insert (key_a, conf_a.get_tree ());
	return *this;
}

stakeq::tomlconfig & stakeq::tomlconfig::replace_child (std::string const & key_a, stakeq::tomlconfig & conf_a)
{
	tree->erase (key_a);
	put_child (key_a, conf_a);
	return *this;
}

bool stakeq::tomlconfig::has_key (std::string const & key_a)
{
	return tree->contains (key_a);
}

stakeq::tomlconfig & stakeq::tomlconfig::erase (std::string const & key_a)
{
	tree->erase (key_a);
	return *this;
}

stakeq::error & stakeq::tomlconfig::get_error ()
{
	return *error;
}

void stakeq::tomlconfig::merge (std::shared_ptr<cpptoml::table> const & target_a, std::shared_ptr<cpptoml::table> const & source_a)
{
	for (auto & [key, value] : *source_a)
	{
		if (value->is_table () && target_a->contains (key) && target_a->get (key)->is_table ())
		{
			merge (target_a->get_table (key), value->as_table ());
		}
		else
		{
			target_a->insert (key, value);
		}
	}
}
