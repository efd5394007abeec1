#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace stakeq
{
/*
 * Collects sizes of internal containers for diagnostics. Nested components add their own info as named children.
 */
class container_info
{
public:
	// Child represented as < name, container_info > pair
	using child = std::pair<std::string, container_info>;

	struct entry
	{
		std::string name;
		std::size_t size;
		std::size_t sizeof_element;
	};

public:
	/**
	 * Adds a subcontainer
	 */
	void add (std::string const & name, container_info const & info)
	{
		children_m.emplace_back (name, info);
	}

	void put (std::string const & name, std::size_t size, std::size_t sizeof_element = 0)
	{
		entries_m.push_back ({ name, size, sizeof_element });
	}

	template <class T>
	void put (std::string const & name, std::size_t size)
	{
		put (name, size, sizeof (T));
	}

public:
	bool children_empty () const
	{
		return children_m.empty ();
	}

	std::vector<child> const & children () const
	{
		return children_m;
	}

	bool entries_empty () const
	{
		return entries_m.empty ();
	}

	std::vector<entry> const & entries () const
	{
		return entries_m;
	}

	/** Finds the size recorded for \p name in this node, zero if not present */
	std::size_t size_of (std::string const & name) const
	{
		for (auto const & entry : entries_m)
		{
			if (entry.name == name)
			{
				return entry.size;
			}
		}
		return 0;
	}

	/** Writes an indented tree of `name: size` lines */
	void print (std::ostream & stream, std::string const & name, unsigned indent = 0) const
	{
		stream << std::string (indent * 2, ' ') << name << std::endl;
		for (auto const & entry : entries_m)
		{
			stream << std::string ((indent + 1) * 2, ' ') << entry.name << ": " << entry.size << std::endl;
		}
		for (auto const & [child_name, child] : children_m)
		{
			child.print (stream, child_name, indent + 1);
		}
	}

private:
	std::vector<child> children_m;
	std::vector<entry> entries_m;
};
}
