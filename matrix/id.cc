// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <roomgate/matrix.h>

roomgate::m::id::id(const enum sigil &sigil,
                    const string_view &id)
:string_view{id}
{
	validate(sigil, id);
}

roomgate::m::id::id(const string_view &id)
:string_view{id}
{
}

roomgate::string_view
roomgate::m::id::local()
const
{
	return split(*this, ':').first;
}

roomgate::string_view
roomgate::m::id::host()
const
{
	return split(*this, ':').second;
}

roomgate::string_view
roomgate::m::id::localname()
const
{
	string_view ret{local()};
	if(!ret.empty() && is_sigil(ret.front()))
		ret.pop_front();

	return ret;
}

roomgate::string_view
roomgate::m::id::hostname()
const
{
	return rfc3986::host(host());
}

uint16_t
roomgate::m::id::port()
const
{
	return rfc3986::port(host());
}

//
// util
//

bool
roomgate::m::valid(const id::sigil &sigil,
                   const string_view &id)
noexcept try
{
	validate(sigil, id);
	return true;
}
catch(const std::exception &e)
{
	return false;
}

void
roomgate::m::validate(const id::sigil &sigil,
                      const string_view &id)
{
	if(id.size() > id::MAX_SIZE)
		throw INVALID_MXID
		{
			"'%s' ID is longer than %u characters",
			reflect(sigil),
			id::MAX_SIZE
		};

	if(id.empty() || id.front() != sigil)
		throw BAD_SIGIL
		{
			"Not a valid '%s' ID: missing '%c' sigil",
			reflect(sigil),
			char(sigil)
		};

	const auto &[local, host]
	{
		split(id, ':')
	};

	if(local.size() < 2)
		throw INVALID_MXID
		{
			"'%s' ID has an empty localpart", reflect(sigil)
		};

	if(host.empty())
		throw INVALID_MXID
		{
			"'%s' ID requires a server name", reflect(sigil)
		};

	if(std::any_of(begin(id), end(id), [](const char &c) { return std::isspace(static_cast<unsigned char>(c)); }))
		throw INVALID_MXID
		{
			"'%s' ID contains whitespace", reflect(sigil)
		};

	// The server name must at least have a host, and a valid port if any.
	if(!rfc3986::host(host))
		throw INVALID_MXID
		{
			"'%s' ID has an invalid server name", reflect(sigil)
		};

	try
	{
		rfc3986::port(host);
	}
	catch(const rfc3986::error &e)
	{
		throw INVALID_MXID
		{
			"'%s' ID has an invalid port :%s", reflect(sigil), e.what()
		};
	}
}

roomgate::m::id::sigil
roomgate::m::sigil(const string_view &s)
{
	if(s.empty())
		throw BAD_SIGIL
		{
			"no sigil provided"
		};

	return sigil(s.front());
}

roomgate::m::id::sigil
roomgate::m::sigil(const char &c)
{
	switch(c)
	{
		case '$':  return id::EVENT;
		case '@':  return id::USER;
		case '#':  return id::ROOM_ALIAS;
		case '!':  return id::ROOM;
	}

	throw BAD_SIGIL
	{
		"'%c' is not a valid sigil", c
	};
}

roomgate::string_view
roomgate::m::reflect(const id::sigil &c)
{
	switch(c)
	{
		case id::EVENT:        return "EVENT";
		case id::USER:         return "USER";
		case id::ROOM:         return "ROOM";
		case id::ROOM_ALIAS:   return "ROOM_ALIAS";
	}

	return "?????";
}

bool
roomgate::m::has_sigil(const string_view &s)
noexcept
{
	return !s.empty() && is_sigil(s.front());
}

bool
roomgate::m::is_sigil(const char &c)
noexcept
{
	switch(c)
	{
		case '$':
		case '@':
		case '#':
		case '!':
			return true;
	}

	return false;
}
