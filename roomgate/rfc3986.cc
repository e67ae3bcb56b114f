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
#include <boost/spirit/include/qi.hpp>

namespace roomgate::rfc3986
{
	static bool unreserved(const char &c);
}

roomgate::rfc3986::uri::uri(const string_view &input)
{
	string_view s{input};
	const auto scheme_end(s.find("://"));
	if(scheme_end != s.npos)
	{
		scheme = s.substr(0, scheme_end);
		s.remove_prefix(scheme_end + 3);
	}

	const auto query_split(split(s, '?'));
	query = query_split.second;

	const auto path_start(query_split.first.find('/'));
	remote = query_split.first.substr(0, path_start);
	if(path_start != query_split.first.npos)
		path = query_split.first.substr(path_start);
}

std::string
roomgate::rfc3986::encode(const json::members &members)
{
	std::string ret;
	for(auto it(members.begin()); it != members.end(); ++it)
	{
		if(it != members.begin())
			ret += '&';

		const string_view serial
		{
			it->second.serial
		};

		ret += encode(it->first);
		ret += '=';
		ret += json::type(serial, std::nothrow) == json::STRING?
			encode(json::unescape(json::string(serial))):
			encode(serial);
	}

	return ret;
}

std::string
roomgate::rfc3986::encode(const string_view &url)
{
	static const char *const hex
	{
		"0123456789ABCDEF"
	};

	std::string ret;
	ret.reserve(url.size() * 3);
	for(const char &c : url)
	{
		if(unreserved(c))
		{
			ret += c;
			continue;
		}

		ret += '%';
		ret += hex[uint8_t(c) >> 4];
		ret += hex[uint8_t(c) & 0x0F];
	}

	return ret;
}

bool
roomgate::rfc3986::unreserved(const char &c)
{
	return (c >= 'a' && c <= 'z')
	|| (c >= 'A' && c <= 'Z')
	|| (c >= '0' && c <= '9')
	|| c == '-' || c == '.' || c == '_' || c == '~';
}

uint16_t
roomgate::rfc3986::port(const string_view &remote)
{
	namespace qi = boost::spirit::qi;

	// Bracketed IPv6 literals carry colons of their own.
	const auto close(remote.rfind(']'));
	const auto colon(remote.rfind(':'));
	if(colon == remote.npos || (close != remote.npos && colon < close))
		return 0;

	const string_view digits
	{
		remote.substr(colon + 1)
	};

	uint16_t ret {0};
	const char *start(digits.data()), *const stop(digits.data() + digits.size());
	if(!qi::parse(start, stop, qi::uint_parser<uint16_t, 10, 1, 5>{} >> qi::eoi, ret))
		throw error
		{
			"Invalid port number in remote '%s'", remote
		};

	return ret;
}

roomgate::string_view
roomgate::rfc3986::host(const string_view &remote)
{
	const auto close(remote.rfind(']'));
	if(startswith(remote, "[") && close != remote.npos)
		return remote.substr(1, close - 1);

	const auto colon(remote.rfind(':'));
	if(colon == remote.npos)
		return remote;

	// Bare IPv6 address without brackets has no port.
	if(remote.find(':') != colon)
		return remote;

	return remote.substr(0, colon);
}
