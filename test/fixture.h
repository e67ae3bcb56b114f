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
#define HAVE_ROOMGATE_TEST_FIXTURE_H

//
// Event and room builders shared by the unit tests
//

namespace fixture
{
	using namespace roomgate;

	inline m::event
	create(const string_view &room_id,
	       const string_view &creator)
	{
		return json::members
		{
			{ "room_id",    room_id                              },
			{ "sender",     creator                              },
			{ "type",       "m.room.create"                      },
			{ "state_key",  ""                                   },
			{ "content",    json::members{{ "creator", creator }} },
		};
	}

	inline m::event
	rules(const string_view &room_id,
	      const string_view &sender,
	      const string_view &rule)
	{
		return json::members
		{
			{ "room_id",    room_id                           },
			{ "sender",     sender                            },
			{ "type",       m::access_rules::TYPE             },
			{ "state_key",  ""                                },
			{ "content",    json::members{{ "rule", rule }}   },
		};
	}

	inline m::event
	member(const string_view &room_id,
	       const string_view &sender,
	       const string_view &target,
	       const string_view &membership)
	{
		return json::members
		{
			{ "room_id",    room_id                                     },
			{ "sender",     sender                                      },
			{ "type",       "m.room.member"                             },
			{ "state_key",  target                                      },
			{ "content",    json::members{{ "membership", membership }} },
		};
	}

	// Member invite redeeming a third-party invite by its token.
	inline m::event
	member_3pid(const string_view &room_id,
	            const string_view &sender,
	            const string_view &target,
	            const string_view &token)
	{
		return json::members
		{
			{ "room_id",    room_id          },
			{ "sender",     sender           },
			{ "type",       "m.room.member"  },
			{ "state_key",  target           },
			{ "content",    json::members
			{
				{ "membership",          "invite" },
				{ "third_party_invite",  json::members
				{
					{ "display_name",  "a***"  },
					{ "signed",        json::members
					{
						{ "mxid",   target  },
						{ "token",  token   },
					}},
				}},
			}},
		};
	}

	inline m::event
	third_party_invite(const string_view &room_id,
	                   const string_view &sender,
	                   const string_view &token)
	{
		return json::members
		{
			{ "room_id",    room_id                                      },
			{ "sender",     sender                                       },
			{ "type",       "m.room.third_party_invite"                  },
			{ "state_key",  token                                        },
			{ "content",    json::members{{ "display_name", "a***" }}    },
		};
	}

	// A room as it stands after createRoom with the given rule: the create
	// event, the creator's join, and the rule.
	inline void
	room(m::state::memory &state,
	     const string_view &room_id,
	     const string_view &creator,
	     const string_view &rule)
	{
		state.append(create(room_id, creator));
		state.append(member(room_id, creator, creator, "join"));
		state.append(rules(room_id, creator, rule));
	}

	inline m::access_rules::opts
	config()
	{
		return m::access_rules::opts
		{
			json::object
			{
				R"({"domains_forbidden_when_restricted": ["forbidden_domain"], "id_server": "testis"})"
			}
		};
	}

	/// Identity lookup answering from a fixed binding.
	struct lookup final
	:m::identity::lookup
	{
		std::string hs;
		bool fail {false};
		mutable size_t calls {0};

		std::string resolve(const string_view &medium, const string_view &address) const override
		{
			++calls;
			if(fail)
				throw m::identity::error
				{
					"identity server unreachable"
				};

			return hs;
		}

		lookup(std::string hs = {})
		:hs{std::move(hs)}
		{}
	};
}
