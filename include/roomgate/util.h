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
#define HAVE_ROOMGATE_UTIL_H

/// Macro to arrange a function overload scheme based on the following
/// convention: An available `name` is chosen, from this name a strong type
/// is created by appending `_t`. The name itself becomes a static constexpr
/// instance of this `name_t`. Functions can be declared with an argument
/// accepting `name_t`, and called by passing `name`
///
/// ROOMGATE_OVERLOAD(foo)                         // declare overload
/// void function(int, foo_t) {}                   // overloaded version
/// void function(int) { function(0, foo); }       // calls overloaded version
/// function(0);                                   // calls regular version
///
#define ROOMGATE_OVERLOAD(NAME) \
    static constexpr struct NAME##_t {} NAME {};

namespace roomgate::util
{
	template<class F> struct unwind;

	using token_view = std::function<void (const string_view &)>;

	// Tokenize; empty tokens are skipped.
	void tokens(const string_view &str, const char &sep, const token_view &);

	// Split at the first occurrence of sep; second is empty if not found.
	std::pair<string_view, string_view> split(const string_view &str, const char &sep);
	std::pair<string_view, string_view> rsplit(const string_view &str, const char &sep);

	string_view rstrip(const string_view &str, const char &c = ' ');

	bool startswith(const string_view &str, const string_view &prefix);
	bool iequals(const string_view &a, const string_view &b);
	string_view trunc(const string_view &str, const size_t &max);
}

/// Unconditionally executes the provided code when the object goes out of scope.
template<class F>
struct roomgate::util::unwind
{
	const F func;

	unwind(F&& func)
	:func{std::forward<F>(func)}
	{}

	unwind(const unwind &) = delete;
	unwind &operator=(const unwind &) = delete;
	~unwind() noexcept
	{
		func();
	}
};

namespace roomgate
{
	using namespace util;

	constexpr size_t operator ""_KiB(const unsigned long long val)
	{
		return val * 1024UL;
	}
}
