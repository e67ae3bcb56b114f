// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <roomgate/roomgate.h>

void
roomgate::util::tokens(const string_view &str,
                       const char &sep,
                       const token_view &closure)
{
	size_t pos(0);
	while(pos <= str.size())
	{
		const size_t end
		{
			std::min(str.find(sep, pos), str.size())
		};

		const string_view token
		{
			str.substr(pos, end - pos)
		};

		if(!token.empty())
			closure(token);

		pos = end + 1;
	}
}

std::pair<roomgate::string_view, roomgate::string_view>
roomgate::util::split(const string_view &str,
                      const char &sep)
{
	const auto pos(str.find(sep));
	if(pos == str.npos)
		return { str, string_view{} };

	return { str.substr(0, pos), str.substr(pos + 1) };
}

std::pair<roomgate::string_view, roomgate::string_view>
roomgate::util::rsplit(const string_view &str,
                       const char &sep)
{
	const auto pos(str.rfind(sep));
	if(pos == str.npos)
		return { str, string_view{} };

	return { str.substr(0, pos), str.substr(pos + 1) };
}

roomgate::string_view
roomgate::util::rstrip(const string_view &str,
                       const char &c)
{
	const auto pos(str.find_last_not_of(c));
	return pos != str.npos? str.substr(0, pos + 1) : str.substr(0, 0);
}

bool
roomgate::util::startswith(const string_view &str,
                           const string_view &prefix)
{
	return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

bool
roomgate::util::iequals(const string_view &a,
                        const string_view &b)
{
	return a.size() == b.size() && std::equal(begin(a), end(a), begin(b), []
	(const char &x, const char &y)
	{
		return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
	});
}

roomgate::string_view
roomgate::util::trunc(const string_view &str,
                      const size_t &max)
{
	return str.substr(0, max);
}
