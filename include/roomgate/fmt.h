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
#define HAVE_ROOMGATE_FMT_H

/// Typesafe format strings from formal grammars & standard RTTI
///
/// The printf-style format string is interpreted by boost::format which
/// matches each directive against the argument's stream insertion; a
/// mismatch between directive and argument type is not an error, the value
/// is simply printed the way the stream would print it. Surplus or missing
/// arguments are tolerated as well: generating a message must never throw
/// on behalf of the caller's mistake because messages are generated inside
/// exception constructors and log calls.
///
namespace roomgate::fmt
{
	struct sprintf;

	template<class... args> std::string snstringf(const string_view &fmt, args&&...);
	template<class T> decltype(auto) arg(T &&) noexcept;

	boost::format make_format(const string_view &fmt);
}

/// Formats into the caller's fixed buffer; the result is truncated to fit and
/// always terminated. The object converts to the view of what was written.
struct roomgate::fmt::sprintf
{
	string_view out;

	operator const string_view &() const
	{
		return out;
	}

	template<class... args>
	sprintf(char *const &buf, const size_t &max, const string_view &fmt, args&&... a)
	{
		const auto str
		{
			snstringf(fmt, std::forward<args>(a)...)
		};

		const size_t len
		{
			max? std::min(str.size(), max - 1): 0UL
		};

		if(max)
		{
			std::memcpy(buf, str.data(), len);
			buf[len] = '\0';
		}

		out = string_view{buf, len};
	}
};

template<class T>
decltype(auto)
roomgate::fmt::arg(T &&t)
noexcept
{
	using type = std::decay_t<T>;

	if constexpr(std::is_base_of<std::string_view, type>())
		return static_cast<std::string_view>(t);
	else if constexpr(std::is_same<type, const char *>() || std::is_same<type, char *>())
		return t? static_cast<const char *>(t): "(null)";
	else
		return std::forward<T>(t);
}

template<class... args>
std::string
roomgate::fmt::snstringf(const string_view &fmt,
                         args&&... a)
try
{
	auto format
	{
		make_format(fmt)
	};

	(format % ... % arg(std::forward<args>(a)));
	return format.str();
}
catch(const std::exception &e)
{
	return std::string{fmt};
}
