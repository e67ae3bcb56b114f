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
	const string_view kermit {"@kermit:test"};
	const string_view invitee {"@invitee:test"};
	const string_view restricted_room {"!restricted:test"};
	const string_view unrestricted_room {"!unrestricted:test"};
	const string_view direct_room {"!direct:test"};

	struct rooms
	{
		m::state::memory state;
		fixture::lookup lookup;
		const m::access_rules::engine engine
		{
			state, fixture::config(), lookup
		};

		decision invite(const string_view &room_id, const string_view &target)
		{
			return engine.on_membership_event(fixture::member(room_id, kermit, target, "invite"));
		}

		rooms()
		{
			fixture::room(state, restricted_room, kermit, "restricted");
			fixture::room(state, unrestricted_room, kermit, "unrestricted");
			fixture::room(state, direct_room, kermit, "direct");
			state.append(fixture::member(direct_room, kermit, invitee, "invite"));
		}
	};
}

SCENARIO("restricted rooms refuse invites to denied servers", "[access_rules][engine]")
{
	rooms rooms;

	const auto denied
	{
		rooms.invite(restricted_room, "@test:forbidden_domain")
	};

	REQUIRE(!denied);
	REQUIRE(denied.code == http::FORBIDDEN);
	REQUIRE(denied.reason == "target server is not permitted");
	REQUIRE_THROWS_AS(denied.enforce(), m::FORBIDDEN);

	const auto allowed
	{
		rooms.invite(restricted_room, "@test:not_forbidden_domain")
	};

	REQUIRE(bool(allowed));
	REQUIRE_NOTHROW(allowed.enforce());
}

SCENARIO("unrestricted rooms admit every invite", "[access_rules][engine]")
{
	rooms rooms;
	REQUIRE(bool(rooms.invite(unrestricted_room, "@test:forbidden_domain")));
	REQUIRE(bool(rooms.invite(unrestricted_room, "@test:not_forbidden_domain")));
}

SCENARIO("only invites are gated", "[access_rules][engine]")
{
	rooms rooms;
	const auto join
	{
		fixture::member(restricted_room, "@test:forbidden_domain", "@test:forbidden_domain", "join")
	};

	REQUIRE(bool(rooms.engine.on_membership_event(join)));
	REQUIRE(bool(rooms.engine.on_membership_event(fixture::member(direct_room, "@x:test", "@x:test", "knock"))));
	REQUIRE(bool(rooms.engine.on_membership_event(fixture::member(direct_room, kermit, "@x:test", "ban"))));

	const m::event message
	{
		std::string{R"({"room_id": "!unknown:test", "type": "m.room.message", "content": {"body": "hi"}})"}
	};

	REQUIRE(bool(rooms.engine.on_membership_event(message)));
}

SCENARIO("direct rooms are closed to their original pair", "[access_rules][engine]")
{
	rooms rooms;

	WHEN("a third user is invited")
	{
		const auto denied
		{
			rooms.invite(direct_room, "@not_invited:test")
		};

		THEN("it is denied")
		{
			REQUIRE(!denied);
			REQUIRE(denied.code == http::FORBIDDEN);
			REQUIRE(denied.reason == "direct rooms are limited to their original participants");
		}
	}

	WHEN("the invitee joins, leaves and is invited again")
	{
		rooms.state.append(fixture::member(direct_room, invitee, invitee, "join"));
		rooms.state.append(fixture::member(direct_room, invitee, invitee, "leave"));

		THEN("the invite is allowed")
		{
			REQUIRE(bool(rooms.invite(direct_room, invitee)));
		}

		THEN("a third user is still denied")
		{
			REQUIRE(!rooms.invite(direct_room, "@not_invited:test"));
		}

		THEN("the creator may be invited back")
		{
			REQUIRE(bool(rooms.invite(direct_room, kermit)));
		}
	}
}

SCENARIO("the first invite into a fresh direct room establishes the pair", "[access_rules][engine]")
{
	rooms rooms;
	const string_view fresh {"!fresh:test"};
	fixture::room(rooms.state, fresh, kermit, "direct");

	REQUIRE(bool(rooms.invite(fresh, "@first:test")));
	rooms.state.append(fixture::member(fresh, kermit, "@first:test", "invite"));
	REQUIRE(!rooms.invite(fresh, "@second:test"));
	REQUIRE(bool(rooms.invite(fresh, "@first:test")));
}

SCENARIO("identities beyond the pair in history are ignored", "[access_rules][engine]")
{
	rooms rooms;
	const string_view crowded {"!crowded:test"};
	fixture::room(rooms.state, crowded, kermit, "direct");
	rooms.state.append(fixture::member(crowded, kermit, "@first:test", "invite"));
	rooms.state.append(fixture::member(crowded, kermit, "@second:test", "invite"));

	const direct set
	{
		rooms.state, crowded
	};

	REQUIRE(set.creator == kermit);
	REQUIRE(set.full());
	REQUIRE(set.has("@first:test"));
	REQUIRE(!set.has("@second:test"));
	REQUIRE(set.ignored == 1);
	REQUIRE(!rooms.invite(crowded, "@second:test"));
}

SCENARIO("the creator comes from the create event", "[access_rules][engine]")
{
	m::state::memory state;
	state.append(json::members
	{
		{ "room_id",    "!r:test"                                   },
		{ "sender",     "@sender:test"                              },
		{ "type",       "m.room.create"                             },
		{ "state_key",  ""                                          },
		{ "content",    json::members{{ "room_version", "1" }}      },
	});

	REQUIRE(direct{state, "!r:test"}.creator == "@sender:test");

	state.append(fixture::create("!r:test", "@creator:test"));
	REQUIRE(direct{state, "!r:test"}.creator == "@creator:test");
}

SCENARIO("decisions are idempotent over unchanged state", "[access_rules][engine]")
{
	rooms rooms;
	for(size_t i(0); i < 3; ++i)
	{
		REQUIRE(!rooms.invite(direct_room, "@not_invited:test"));
		REQUIRE(bool(rooms.invite(direct_room, invitee)));
		REQUIRE(!rooms.invite(restricted_room, "@x:forbidden_domain"));
	}
}

SCENARIO("unreadable room state is a precondition failure", "[access_rules][engine]")
{
	rooms rooms;

	GIVEN("an unknown room")
	{
		REQUIRE_THROWS_AS(rooms.invite("!unknown:test", "@x:test"), precondition);
	}

	GIVEN("a room without a rule")
	{
		rooms.state.append(fixture::create("!norule:test", kermit));
		REQUIRE_THROWS_AS(rooms.invite("!norule:test", "@x:test"), precondition);
	}

	GIVEN("a room with an unrecognized rule")
	{
		fixture::room(rooms.state, "!garbage:test", kermit, "everyone");
		REQUIRE_THROWS_AS(rooms.invite("!garbage:test", "@x:test"), precondition);

		try
		{
			rooms.invite("!garbage:test", "@x:test");
		}
		catch(const m::error &e)
		{
			REQUIRE(e.code == http::INTERNAL_SERVER_ERROR);
		}
	}

	GIVEN("a direct room without a create event")
	{
		rooms.state.append(fixture::rules("!uncreated:test", kermit, "direct"));
		REQUIRE_THROWS_AS(rooms.invite("!uncreated:test", "@x:test"), precondition);
	}

	GIVEN("a rule which is not a string")
	{
		rooms.state.append(m::event{json::members
		{
			{ "room_id",    "!number:test"                   },
			{ "sender",     kermit                           },
			{ "type",       TYPE                             },
			{ "state_key",  ""                               },
			{ "content",    json::members{{ "rule", 1 }}     },
		}});

		REQUIRE_THROWS_AS(rooms.invite("!number:test", "@x:test"), precondition);
	}
}

SCENARIO("invites of malformed user ids are client errors", "[access_rules][engine]")
{
	rooms rooms;
	REQUIRE_THROWS_AS(rooms.invite(restricted_room, "not-a-user"), m::INVALID_MXID);
	REQUIRE_THROWS_AS(rooms.invite(restricted_room, "@x:host:notaport"), m::INVALID_MXID);
	REQUIRE_THROWS_AS(rooms.invite(direct_room, "@x:host:99999"), m::INVALID_MXID);
}

SCENARIO("invite targets are compared unescaped", "[access_rules][engine]")
{
	rooms rooms;

	GIVEN("a re-invite of the direct partner with an escaped state_key")
	{
		const m::event event
		{
			R"({"room_id":"!direct:test","sender":"@kermit:test","type":"m.room.member",)"
			R"("state_key":"@\u0069nvitee:test","content":{"membership":"invite"}})"
		};

		THEN("the partner is recognized")
		{
			REQUIRE(rooms.engine.on_membership_event(event));
		}
	}

	GIVEN("an invite to a denied server spelled with an escape")
	{
		const m::event event
		{
			R"({"room_id":"!restricted:test","sender":"@kermit:test","type":"m.room.member",)"
			R"("state_key":"@x:forbidden\u005fdomain","content":{"membership":"invite"}})"
		};

		THEN("the server is still denied")
		{
			const auto decision(rooms.engine.on_membership_event(event));
			REQUIRE(!decision);
			REQUIRE(decision.code == http::FORBIDDEN);
		}
	}
}

SCENARIO("pending third-party invites hold a slot in direct rooms", "[access_rules][engine][threepid]")
{
	rooms rooms;
	const string_view pending {"!pending:test"};
	fixture::room(rooms.state, pending, kermit, "direct");

	const auto third_party_invite
	{
		fixture::third_party_invite(pending, kermit, "tok1")
	};

	REQUIRE(bool(rooms.engine.on_membership_event(third_party_invite)));
	rooms.state.append(third_party_invite);

	// The pair is complete: a second pending invite and a plain invite fail.
	REQUIRE(!rooms.engine.on_membership_event(fixture::third_party_invite(pending, kermit, "tok2")));
	REQUIRE(!rooms.invite(pending, "@other:test"));

	// The re-sent pending invite is part of the pair.
	REQUIRE(bool(rooms.engine.on_membership_event(third_party_invite)));

	// Redeeming the token binds the slot to the user.
	const auto redeem
	{
		fixture::member_3pid(pending, kermit, "@bound:test", "tok1")
	};

	REQUIRE(bool(rooms.engine.on_membership_event(redeem)));
	REQUIRE(!rooms.engine.on_membership_event(fixture::member_3pid(pending, kermit, "@bound:test", "tok2")));

	rooms.state.append(redeem);
	const direct set
	{
		rooms.state, pending
	};

	REQUIRE(set.has("@bound:test"));
	REQUIRE(!set.has_token("tok1"));
	REQUIRE(bool(rooms.invite(pending, "@bound:test")));
	REQUIRE(!rooms.invite(pending, "@other:test"));
}

SCENARIO("third-party invite events pass outside direct rooms", "[access_rules][engine][threepid]")
{
	rooms rooms;
	REQUIRE(bool(rooms.engine.on_membership_event(fixture::third_party_invite(restricted_room, kermit, "t"))));
	REQUIRE(bool(rooms.engine.on_membership_event(fixture::third_party_invite(unrestricted_room, kermit, "t"))));
	REQUIRE(!rooms.engine.on_membership_event(fixture::third_party_invite(direct_room, kermit, "t")));
}

SCENARIO("third-party invites resolve the address before deciding", "[access_rules][engine][threepid]")
{
	rooms rooms;

	GIVEN("an address bound to a denied server")
	{
		rooms.lookup.hs = "forbidden_domain";
		REQUIRE(!rooms.engine.on_threepid_invite(restricted_room, "email", "test@forbidden_domain"));
		REQUIRE(bool(rooms.engine.on_threepid_invite(unrestricted_room, "email", "test@forbidden_domain")));
		REQUIRE(rooms.lookup.calls == 2);
	}

	GIVEN("an address bound to another server")
	{
		rooms.lookup.hs = "not_forbidden_domain";
		REQUIRE(bool(rooms.engine.on_threepid_invite(restricted_room, "email", "test@example.com")));
		REQUIRE(bool(rooms.engine.on_threepid_invite(restricted_room, "msisdn", "447700900000")));
	}

	GIVEN("a direct room whose pair is complete")
	{
		rooms.lookup.hs = "test";
		REQUIRE(!rooms.engine.on_threepid_invite(direct_room, "email", "test@example.com"));
	}

	GIVEN("a direct room with a free slot")
	{
		rooms.lookup.hs = "test";
		fixture::room(rooms.state, "!alone:test", kermit, "direct");
		REQUIRE(bool(rooms.engine.on_threepid_invite("!alone:test", "email", "test@example.com")));
	}

	GIVEN("a lookup failure")
	{
		rooms.lookup.fail = true;

		THEN("every rule denies")
		{
			REQUIRE(!rooms.engine.on_threepid_invite(unrestricted_room, "email", "test@example.com"));
			REQUIRE(!rooms.engine.on_threepid_invite(restricted_room, "email", "test@example.com"));
			REQUIRE(rooms.engine.on_threepid_invite(restricted_room, "email", "test@example.com").code == http::FORBIDDEN);
		}
	}

	GIVEN("an unsupported medium or a malformed address")
	{
		rooms.lookup.hs = "not_forbidden_domain";
		REQUIRE(!rooms.engine.on_threepid_invite(unrestricted_room, "carrier_pigeon", "coo"));
		REQUIRE(!rooms.engine.on_threepid_invite(unrestricted_room, "email", "Test <test@example.com>"));
		REQUIRE(!rooms.engine.on_threepid_invite(unrestricted_room, "email", "a@b.com, c@d.com"));
		REQUIRE(!rooms.engine.on_threepid_invite(unrestricted_room, "email", "no-at-sign"));
		REQUIRE(rooms.lookup.calls == 0);
	}
}
