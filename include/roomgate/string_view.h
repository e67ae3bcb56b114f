// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#pragma once
#define HAVE_ROOMGATE_STRING_VIEW_H

namespace roomgate
{
	struct string_view;

	bool empty(const string_view &);
	bool operator!(const string_view &);
	bool defined(const string_view &);
}

/// Customized std::string_view
///
/// This class adds iterator-based (char*, char*) construction which the
/// parsers in this project use to produce views over their input without
/// copying, and a boolean conversion testing for non-emptiness. An undefined
/// string_view has a null data(); a defined but empty string_view points
/// at something with size zero. The JSON layer relies on this distinction to
/// tell a missing member from an empty string.
///
struct roomgate::string_view
:std::string_view
{
	// (non-standard)
	explicit operator bool() const
	{
		return !empty();
	}

	bool undefined() const
	{
		return data() == nullptr;
	}

	bool defined() const
	{
		return !undefined();
	}

	// (non-standard) intuitive wrapper for remove_prefix.
	const char &pop_front()
	{
		const char &ret(front());
		remove_prefix(1);
		return ret;
	}

	// (non-standard) intuitive wrapper for remove_suffix.
	const char &pop_back()
	{
		const char &ret(back());
		remove_suffix(1);
		return ret;
	}

	// (non-standard) our iterator-based constructor
	string_view(const char *const &begin, const char *const &end)
	:std::string_view{begin, size_t(end - begin)}
	{}

	string_view(const std::string &string)
	:std::string_view{string.data(), string.size()}
	{}

	constexpr string_view(const std::string_view &sv)
	:std::string_view{sv}
	{}

	constexpr string_view(const char *const &start, const size_t &size)
	:std::string_view{start, size}
	{}

	constexpr string_view(const char *const cstr)
	:std::string_view{cstr}
	{}

	/// Our default constructor sets the elements to 0 for best behavior by
	/// defined() and undefined().
	constexpr string_view()
	:std::string_view{}
	{}
};

/// Specialization for std::hash<> participation
template<>
struct std::hash<roomgate::string_view>
:std::hash<std::string_view>
{
	using std::hash<std::string_view>::operator();
};

inline bool
roomgate::defined(const string_view &str)
{
	return str.defined();
}

inline bool
roomgate::operator!(const string_view &str)
{
	return str.empty();
}

inline bool
roomgate::empty(const string_view &str)
{
	return str.empty();
}
