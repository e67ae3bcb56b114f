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
#include "fixture.h"

using namespace roomgate;
using namespace roomgate::m::access_rules;

namespace
{
	rule
	create(const hooks &hooks,
	       const string_view &body)
	{
		return hooks.on_room_create(m::createroom{json::object{body}, "@kermit:test"});
	}
}

SCENARIO("rules reflect to and from their state content", "[access_rules]")
{
	REQUIRE(reflect(RESTRICTED) == "restricted");
	REQUIRE(reflect(UNRESTRICTED) == "unrestricted");
	REQUIRE(reflect(DIRECT) == "direct");
	REQUIRE(parse("direct") == DIRECT);
	REQUIRE(!parse(std::nothrow, "Direct"));
	REQUIRE_THROWS_AS(parse(""), m::INVALID_PARAM);
	REQUIRE(json::string(json::object(content(UNRESTRICTED))["rule"]) == "unrestricted");
}

SCENARIO("the initial rule follows is_direct unless one is requested", "[access_rules]")
{
	REQUIRE(resolve(false, std::nullopt) == RESTRICTED);
	REQUIRE(resolve(true, std::nullopt) == DIRECT);
	REQUIRE(resolve(false, UNRESTRICTED) == UNRESTRICTED);
	REQUIRE(resolve(false, RESTRICTED) == RESTRICTED);
	REQUIRE(resolve(true, DIRECT) == DIRECT);
}

SCENARIO("a rule contradicting is_direct is rejected and never coerced", "[access_rules]")
{
	REQUIRE_THROWS_AS(resolve(false, DIRECT), m::INVALID_PARAM);
	REQUIRE_THROWS_AS(resolve(true, RESTRICTED), m::INVALID_PARAM);
	REQUIRE_THROWS_AS(resolve(true, UNRESTRICTED), m::INVALID_PARAM);

	REQUIRE(!valid(DIRECT, false));
	REQUIRE(valid(DIRECT, true));
	REQUIRE(default_rule(false) == RESTRICTED);
}

SCENARIO("the denylist applies to restricted rooms by exact server name", "[access_rules]")
{
	const denylist denied
	{
		"forbidden_domain", "evil.example:8448"
	};

	REQUIRE(!domain_allowed("forbidden_domain", RESTRICTED, denied));
	REQUIRE(domain_allowed("other_domain", RESTRICTED, denied));
	REQUIRE(domain_allowed("sub.forbidden_domain", RESTRICTED, denied));
	REQUIRE(domain_allowed("evil.example", RESTRICTED, denied));
	REQUIRE(!domain_allowed("evil.example:8448", RESTRICTED, denied));
	REQUIRE(domain_allowed("forbidden_domain", UNRESTRICTED, denied));
	REQUIRE(domain_allowed("forbidden_domain", DIRECT, denied));
}

SCENARIO("room creation resolves the rule from the request body", "[access_rules]")
{
	m::state::memory state;
	const fixture::lookup lookup;
	const engine engine
	{
		state, fixture::config(), lookup
	};

	GIVEN("no requested rule")
	{
		REQUIRE(create(engine, R"({"is_direct": false})") == RESTRICTED);
		REQUIRE(create(engine, R"({})") == RESTRICTED);
		REQUIRE(create(engine, R"({"is_direct": true})") == DIRECT);
	}

	GIVEN("a requested rule in initial_state")
	{
		REQUIRE(create(engine, R"({"initial_state": [{"type": "im.vector.room.access_rules", "state_key": "", "content": {"rule": "unrestricted"}}]})") == UNRESTRICTED);
		REQUIRE_THROWS_AS(create(engine, R"({"initial_state": [{"type": "im.vector.room.access_rules", "state_key": "", "content": {"rule": "direct"}}]})"), m::INVALID_PARAM);
		REQUIRE_THROWS_AS(create(engine, R"({"is_direct": true, "initial_state": [{"type": "im.vector.room.access_rules", "state_key": "", "content": {"rule": "restricted"}}]})"), m::INVALID_PARAM);
	}

	GIVEN("a requested rule which is not one of the three")
	{
		REQUIRE_THROWS_AS(create(engine, R"({"initial_state": [{"type": "im.vector.room.access_rules", "state_key": "", "content": {"rule": "open"}}]})"), m::INVALID_PARAM);
		REQUIRE_THROWS_AS(create(engine, R"({"initial_state": [{"type": "im.vector.room.access_rules", "state_key": "", "content": {"rule": 1}}]})"), m::INVALID_PARAM);
	}

	GIVEN("an access rules event with a state_key")
	{
		REQUIRE(create(engine, R"({"is_direct": true, "initial_state": [{"type": "im.vector.room.access_rules", "state_key": "x", "content": {"rule": "restricted"}}]})") == DIRECT);
	}
}

SCENARIO("direct rooms created with several invitees are flagged", "[access_rules][log]")
{
	m::state::memory state;
	const fixture::lookup lookup;
	const engine engine{state, fixture::config(), lookup};

	std::vector<std::string> warnings;
	const log::hook hook{[&warnings]
	(const log::log &facility, const log::level &level, const string_view &msg)
	{
		if(&facility == &m::access_rules::log && level == log::level::WARNING)
			warnings.emplace_back(msg);
	}};

	WHEN("a direct room invites two users and a third-party identifier")
	{
		REQUIRE(create(engine, R"({"is_direct": true, "invite": ["@a:test", "@b:test"], "invite_3pid": [{"id_server": "testis", "medium": "email", "address": "c@test"}]})") == DIRECT);

		THEN("the creation is allowed with one warning naming the count")
		{
			REQUIRE(warnings.size() == 1);
			REQUIRE(warnings.at(0).find("3 initial invitees") != std::string::npos);
		}
	}

	WHEN("a direct room invites one user")
	{
		REQUIRE(create(engine, R"({"is_direct": true, "invite": ["@a:test"]})") == DIRECT);

		THEN("nothing is flagged")
		{
			REQUIRE(warnings.empty());
		}
	}

	WHEN("a non-direct room invites several users")
	{
		REQUIRE(create(engine, R"({"invite": ["@a:test", "@b:test"]})") == RESTRICTED);

		THEN("nothing is flagged")
		{
			REQUIRE(warnings.empty());
		}
	}
}

SCENARIO("options come from a module configuration block", "[access_rules][conf]")
{
	const auto config
	{
		fixture::config()
	};

	REQUIRE(config.id_server == "testis");
	REQUIRE(config.domains_forbidden_when_restricted.count("forbidden_domain"));
	REQUIRE(config.lookup_timeout == milliseconds{5000});

	REQUIRE_THROWS_AS(opts(json::object{R"({"domains_forbidden_when_restricted": []})"}), conf::error);
	REQUIRE_THROWS_AS(opts(json::object{R"({"id_server": ""})"}), conf::error);
	REQUIRE_THROWS_AS(opts(json::object{R"({"id_server": "i", "domains_forbidden_when_restricted": "d"})"}), conf::bad_value);
	REQUIRE(opts(json::object{R"({"id_server": "i"})"}).domains_forbidden_when_restricted.empty());
}

SCENARIO("options come from the conf items", "[access_rules][conf]")
{
	conf::set("roomgate.m.access_rules.domains_forbidden_when_restricted", "a.example  b.example");
	conf::set("roomgate.m.access_rules.id_server", "id.example");
	const auto config
	{
		opts::from_conf()
	};

	conf::fault("roomgate.m.access_rules.domains_forbidden_when_restricted");
	conf::fault("roomgate.m.access_rules.id_server");

	REQUIRE(config.id_server == "id.example");
	REQUIRE(config.domains_forbidden_when_restricted.size() == 2);
	REQUIRE(config.domains_forbidden_when_restricted.count("b.example"));
	REQUIRE_THROWS_AS(opts::from_conf(), conf::error);
}

SCENARIO("an engine without an identity server cannot be built", "[access_rules][conf]")
{
	m::state::memory state;
	REQUIRE_THROWS_AS(engine(state, opts{}), conf::error);
}
