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
#define HAVE_ROOMGATE_LEX_CAST_H

namespace roomgate
{
	ROOMGATE_EXCEPTION(error, bad_lex_cast)

	template<class T> bool try_lex_cast(const string_view &) noexcept;
	template<class T> T lex_cast(const string_view &);
	template<class T> std::string lex_cast(const T &);
}

template<class T>
bool
roomgate::try_lex_cast(const string_view &s)
noexcept
{
	T out;
	return boost::conversion::try_lexical_convert(s.data(), s.size(), out);
}

template<class T>
T
roomgate::lex_cast(const string_view &s)
{
	T out;
	if(!boost::conversion::try_lexical_convert(s.data(), s.size(), out))
		throw bad_lex_cast
		{
			"Invalid lexical conversion of '%s'", s
		};

	return out;
}

template<class T>
std::string
roomgate::lex_cast(const T &t)
{
	return boost::lexical_cast<std::string>(t);
}
