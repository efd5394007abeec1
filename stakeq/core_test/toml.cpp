#include <stakeq/lib/tomlconfig.hpp>

#include <gtest/gtest.h>

#include <sstream>

TEST (toml, get_and_put)
{
	stakeq::tomlconfig toml;
	toml.put ("flag", true);
	toml.put ("count", 12);
	toml.put ("name", std::string{ "queue" });

	bool flag = false;
	int count = 0;
	std::string name;
	toml.get ("flag", flag);
	toml.get ("count", count);
	toml.get ("name", name);
	ASSERT_FALSE (toml.get_error ());
	ASSERT_TRUE (flag);
	ASSERT_EQ (12, count);
	ASSERT_EQ ("queue", name);
	ASSERT_EQ (12, toml.get<int> ("count"));
	ASSERT_THROW (toml.get<int> ("missing"), std::runtime_error);
}

TEST (toml, optional_keeps_default)
{
	stakeq::tomlconfig toml;
	int value = 5;
	toml.get ("missing", value);
	ASSERT_EQ (5, value);
	toml.get_optional ("missing", value, 9);
	ASSERT_EQ (9, value);
	ASSERT_FALSE (toml.get_error ());
}

TEST (toml, required_missing)
{
	stakeq::tomlconfig toml;
	int value = 5;
	toml.get_required ("missing", value);
	ASSERT_TRUE (toml.get_error ());
	ASSERT_EQ (toml.get_error (), stakeq::error_config::missing_value);
}

TEST (toml, type_mismatch)
{
	std::stringstream stream;
	stream << "number = \"text\"\nflag = 1\n";
	stakeq::tomlconfig toml;
	toml.read (stream);
	ASSERT_FALSE (toml.get_error ());

	int number = 0;
	toml.get ("number", number);
	ASSERT_EQ (toml.get_error (), stakeq::error_config::invalid_value);

	toml.get_error ().clear ();
	bool flag = false;
	toml.get ("flag", flag);
	ASSERT_EQ (toml.get_error (), stakeq::error_config::invalid_value);
}

TEST (toml, children_share_error)
{
	std::stringstream stream;
	stream << "[outer]\nvalue = 1\n[outer.inner]\nvalue = 2\n";
	stakeq::tomlconfig toml;
	toml.read (stream);

	auto outer = toml.get_optional_child ("outer");
	ASSERT_TRUE (outer);
	auto inner = outer->get_required_child ("inner");
	int value = 0;
	inner.get ("value", value);
	ASSERT_EQ (2, value);

	ASSERT_FALSE (toml.get_optional_child ("absent"));
	toml.get_required_child ("absent");
	ASSERT_EQ (toml.get_error (), stakeq::error_config::missing_value);
}

TEST (toml, overrides_take_precedence)
{
	std::stringstream base;
	base << "[registry]\ninterval = 10\nowner = \"acc_0000000000000001\"\n";
	std::stringstream overrides;
	overrides << "registry.interval = 20\n";

	stakeq::tomlconfig toml;
	toml.read (overrides, base);
	ASSERT_FALSE (toml.get_error ());

	auto registry = toml.get_required_child ("registry");
	ASSERT_EQ (20, registry.get<int64_t> ("interval"));
	ASSERT_EQ ("acc_0000000000000001", registry.get<std::string> ("owner"));
}

TEST (toml, parse_error)
{
	std::stringstream stream;
	stream << "key = = 1";
	stakeq::tomlconfig toml;
	toml.read (stream);
	ASSERT_EQ (toml.get_error (), stakeq::error_common::parse_failed);
}

TEST (toml, write_read)
{
	stakeq::tomlconfig toml;
	stakeq::tomlconfig child;
	child.put ("level", std::string{ "debug" });
	toml.put_child ("log", child);

	stakeq::tomlconfig parsed;
	parsed.read (toml.to_string ());
	ASSERT_EQ ("debug", parsed.get_required_child ("log").get<std::string> ("level"));

	parsed.erase ("log");
	ASSERT_FALSE (parsed.has_key ("log"));
	ASSERT_TRUE (parsed.empty ());
}

TEST (toml, get_values)
{
	std::stringstream stream;
	stream << "ledger = \"debug\"\nqueue = \"trace\"\ncount = 3\n";
	stakeq::tomlconfig toml;
	toml.read (stream);

	auto values = toml.get_values<std::string> ();
	ASSERT_EQ (2, values.size ());
}
