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
#include <roomgate/roomgate.h>

using namespace roomgate;

SCENARIO("object members are found by name without copying", "[json]")
{
	const json::object object
	{
		R"({"rule": "direct", "n": 42, "flag": true, "nested": {"a": [1, 2, 3]}})"
	};

	REQUIRE(json::valid(object));
	REQUIRE(json::type(object) == json::OBJECT);
	REQUIRE(object.size() == 4);
	REQUIRE(object.has("nested"));
	REQUIRE(!object.has("absent"));

	REQUIRE(json::string(object["rule"]) == "direct");
	REQUIRE(object.get("n", 0L) == 42L);
	REQUIRE(object.get("flag", false));
	REQUIRE(object.get("missing", 7) == 7);

	const json::array a
	{
		json::object(object["nested"])["a"]
	};

	REQUIRE(a.size() == 3);
	REQUIRE(a.at(2) == "3");
	REQUIRE(a[1] == "2");
}

SCENARIO("absent members are undefined and at() throws", "[json]")
{
	const json::object object
	{
		R"({"a": ""})"
	};

	REQUIRE(object.get("b").undefined());
	REQUIRE(json::string(object.get("a")).defined());
	REQUIRE(json::string(object.get("a")).empty());
	REQUIRE_THROWS_AS(object.at("b"), json::not_found);
}

SCENARIO("typed access of the wrong type throws type_error", "[json]")
{
	const json::object object
	{
		R"({"flag": "yes", "n": "1"})"
	};

	REQUIRE_THROWS_AS(object.get("flag", false), json::type_error);
	REQUIRE_THROWS_AS(object.get("n", 0), json::type_error);
}

SCENARIO("malformed documents are not valid", "[json]")
{
	REQUIRE(!json::valid(R"({"a": })"));
	REQUIRE(!json::valid(R"({"a": 1,})"));
	REQUIRE(!json::valid(R"({"a": 1} trailing)"));
	REQUIRE(!json::valid(R"(["unterminated)"));
	REQUIRE(!json::valid(""));
	REQUIRE(json::valid(R"( [ ] )"));

	std::string deep(100, '[');
	deep += std::string(100, ']');
	REQUIRE(!json::valid(deep));
}

SCENARIO("strings are escaped on output and unescaped on input", "[json]")
{
	REQUIRE(json::escape("a\"b\\c\n") == R"(a\"b\\c\n)");
	REQUIRE(json::unescape(R"(a\"b\\c\n)") == "a\"b\\c\n");
	REQUIRE(json::unescape(R"(\u00e9)") == "\xc3\xa9");
	REQUIRE(json::unescape(R"(\ud83d\ude00)") == "\xf0\x9f\x98\x80");
}

SCENARIO("composed members serialize to an object which reads back", "[json]")
{
	const json::strung strung
	{
		json::members
		{
			{ "rule",     "restricted"                 },
			{ "count",    2                            },
			{ "direct",   false                        },
			{ "domains",  std::vector<std::string>{"a", "b"} },
			{ "content",  json::members{{ "k", "v\"" }} },
		}
	};

	const json::object object
	{
		strung
	};

	REQUIRE(json::valid(object));
	REQUIRE(json::string(object["rule"]) == "restricted");
	REQUIRE(object.get("count", 0) == 2);
	REQUIRE(!object.get("direct", true));
	REQUIRE(json::array(object["domains"]).size() == 2);
	REQUIRE(json::unescape(json::string(json::object(object["content"])["k"])) == "v\"");
}
