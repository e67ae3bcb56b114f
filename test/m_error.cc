// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <catch2/catch.hpp>
#include <roomgate/matrix.h>

using namespace roomgate;

SCENARIO("matrix errors carry status, errcode and message", "[m][error]")
{
	try
	{
		throw m::FORBIDDEN
		{
			"%s may not invite %s", "@a:b", "@c:d"
		};
	}
	catch(const m::error &e)
	{
		REQUIRE(e.code == http::FORBIDDEN);
		REQUIRE(e.errcode() == "M_FORBIDDEN");
		REQUIRE(e.errstr() == "@a:b may not invite @c:d");
		REQUIRE(json::valid(e.content));
		REQUIRE(string_view{e.what()}.find("403") == 0);
	}
}

SCENARIO("invalid parameters are client errors", "[m][error]")
{
	REQUIRE_THROWS_AS(m::access_rules::parse("open"), m::INVALID_PARAM);

	try
	{
		m::access_rules::parse("open");
	}
	catch(const http::error &e)
	{
		REQUIRE(e.code == http::BAD_REQUEST);
	}
}

SCENARIO("state precondition failures are internal errors with their own type", "[m][error]")
{
	const auto thrower{[]
	{
		throw m::access_rules::precondition
		{
			"No state in %s", "!r:h"
		};
	}};

	REQUIRE_THROWS_AS(thrower(), m::access_rules::precondition);
	REQUIRE_THROWS_AS(thrower(), m::UNKNOWN);

	try
	{
		thrower();
	}
	catch(const m::error &e)
	{
		REQUIRE(e.code == http::INTERNAL_SERVER_ERROR);
		REQUIRE(e.errcode() == "M_UNKNOWN");
		REQUIRE(e.errstr() == "No state in !r:h");
	}
}

SCENARIO("user ids split into local and server parts", "[m][id]")
{
	const m::id::user user
	{
		"@alice:example.org:8448"
	};

	REQUIRE(user.local() == "@alice");
	REQUIRE(user.localname() == "alice");
	REQUIRE(user.host() == "example.org:8448");
	REQUIRE(user.hostname() == "example.org");
	REQUIRE(user.port() == 8448);
	REQUIRE(m::sigil(user) == m::id::USER);
}

SCENARIO("malformed ids are refused", "[m][id]")
{
	REQUIRE_THROWS_AS(m::id::user{"alice:example.org"}, m::BAD_SIGIL);
	REQUIRE_THROWS_AS(m::id::user{"!room:example.org"}, m::BAD_SIGIL);
	REQUIRE_THROWS_AS(m::id::user{"@alice"}, m::INVALID_MXID);
	REQUIRE_THROWS_AS(m::id::user{"@:example.org"}, m::INVALID_MXID);
	REQUIRE_THROWS_AS(m::id::room{"!r m:example.org"}, m::INVALID_MXID);
	REQUIRE_THROWS_AS(m::id::user{"@alice:example.org:port"}, m::INVALID_MXID);
	REQUIRE(m::valid(m::id::ROOM, "!abc:example.org"));
	REQUIRE(!m::valid(m::id::ROOM, ""));
}
