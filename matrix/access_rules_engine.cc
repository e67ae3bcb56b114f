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

namespace roomgate::m::access_rules
{
	extern const string_view server_not_permitted;
	extern const string_view direct_limited;

	static size_t invitees(const createroom &);
}

decltype(roomgate::m::access_rules::server_not_permitted)
roomgate::m::access_rules::server_not_permitted
{
	"target server is not permitted"
};

decltype(roomgate::m::access_rules::direct_limited)
roomgate::m::access_rules::direct_limited
{
	"direct rooms are limited to their original participants"
};

// Out-of-line placement
roomgate::m::access_rules::hooks::~hooks()
noexcept
{
}

//
// engine
//

roomgate::m::access_rules::engine::engine(const m::state &state,
                                          access_rules::opts opts)
:state
{
	state
}
,opts
{
	std::move(opts)
}
,client
{
	std::make_unique<identity::client>(this->opts.id_server, this->opts.lookup_timeout)
}
,lookup
{
	*client
}
{
	log::info
	{
		log, "Access rules engine with %u forbidden servers; identity server %s",
		this->opts.domains_forbidden_when_restricted.size(),
		this->opts.id_server,
	};
}

roomgate::m::access_rules::engine::engine(const m::state &state,
                                          access_rules::opts opts,
                                          const identity::lookup &lookup)
:state
{
	state
}
,opts
{
	std::move(opts)
}
,lookup
{
	lookup
}
{
}

roomgate::m::access_rules::rule
roomgate::m::access_rules::engine::on_room_create(const createroom &request)
const try
{
	const bool is_direct
	{
		request.is_direct()
	};

	const auto ret
	{
		resolve(is_direct, requested(request))
	};

	log::debug
	{
		log, "%s creating %s room with the %s access rule",
		string_view{request.creator},
		is_direct? "direct" : "non-direct",
		reflect(ret),
	};

	const size_t invited
	{
		ret == DIRECT? invitees(request) : 0
	};

	if(invited > 1)
		log::warning
		{
			log, "Direct room created by %s with %u initial invitees; only the first joins the pair",
			string_view{request.creator},
			invited,
		};

	return ret;
}
catch(const m::error &e)
{
	log::derror
	{
		log, "Room creation by %s rejected :%s",
		string_view{request.creator},
		e.errstr(),
	};

	throw;
}

/// Users and third-party identifiers invited by the request; members of
/// any other shape are not counted.
size_t
roomgate::m::access_rules::invitees(const createroom &request)
{
	size_t ret(0);
	for(const json::array list : {request.invite(), request.invite_3pid()})
		if(json::type(list, std::nothrow) == json::ARRAY)
			ret += list.size();

	return ret;
}

roomgate::m::access_rules::decision
roomgate::m::access_rules::engine::on_membership_event(const m::event &event)
const
{
	if(event.type == "m.room.third_party_invite" && is_state(event))
		return on_third_party_invite(event, current(string_view{event.room_id}));

	if(!is_member(event) || membership(event) != "invite")
		return decision::allowed();

	return on_member_invite(event, current(string_view{event.room_id}));
}

roomgate::m::access_rules::decision
roomgate::m::access_rules::engine::on_member_invite(const m::event &event,
                                                   const rule &rule)
const
{
	const std::string target_id
	{
		json::unescape(event.state_key)
	};

	const id::user target
	{
		target_id
	};

	switch(rule)
	{
		case UNRESTRICTED:
			break;

		case RESTRICTED:
		{
			if(domain_allowed(target.host(), rule, opts.domains_forbidden_when_restricted))
				break;

			log::info
			{
				log, "Invite of %s to restricted room %s by %s denied :%s",
				string_view{target},
				string_view{event.room_id},
				string_view{event.sender},
				server_not_permitted,
			};

			return decision::denied(std::string{server_not_permitted});
		}

		case DIRECT:
		{
			const direct set
			{
				state, string_view{event.room_id}
			};

			const std::string token
			{
				json::unescape(signed_token(event))
			};

			if(set.admits(target, token))
				break;

			log::info
			{
				log, "Invite of %s to direct room %s by %s denied :%s",
				string_view{target},
				string_view{event.room_id},
				string_view{event.sender},
				direct_limited,
			};

			return decision::denied(std::string{direct_limited});
		}
	}

	log::debug
	{
		log, "Invite of %s to %s room %s by %s allowed",
		string_view{target},
		reflect(rule),
		string_view{event.room_id},
		string_view{event.sender},
	};

	return decision::allowed();
}

/// The third-party invite state event itself. In a direct room it either
/// takes the free slot or is already part of the pair.
roomgate::m::access_rules::decision
roomgate::m::access_rules::engine::on_third_party_invite(const m::event &event,
                                                        const rule &rule)
const
{
	if(rule != DIRECT)
		return decision::allowed();

	const direct set
	{
		state, string_view{event.room_id}
	};

	const std::string token
	{
		json::unescape(event.state_key)
	};

	if(set.has_token(token) || !set.full())
		return decision::allowed();

	log::info
	{
		log, "Third-party invite to direct room %s by %s denied :%s",
		string_view{event.room_id},
		string_view{event.sender},
		direct_limited,
	};

	return decision::denied(std::string{direct_limited});
}

roomgate::m::access_rules::decision
roomgate::m::access_rules::engine::on_threepid_invite(const id::room &room_id,
                                                      const string_view &medium,
                                                      const string_view &address)
const
{
	if(!identity::valid_medium(medium))
		return decision::denied(fmt::snstringf("'%s' is not a supported third-party medium", medium));

	if(medium == "email" && !identity::valid_email(address))
		return decision::denied("the email address is not valid");

	const auto rule
	{
		current(room_id)
	};

	std::string server; try
	{
		server = lookup.resolve(medium, address);
	}
	catch(const identity::error &e)
	{
		log::error
		{
			identity::log, "Third-party invite of %s into %s denied; lookup failed :%s",
			address,
			string_view{room_id},
			e.what(),
		};

		return decision::denied("the third-party identifier could not be resolved");
	}
	catch(const std::exception &e)
	{
		log::error
		{
			identity::log, "Third-party invite of %s into %s denied; lookup error :%s",
			address,
			string_view{room_id},
			e.what(),
		};

		return decision::denied("the third-party identifier could not be resolved");
	}

	switch(rule)
	{
		case UNRESTRICTED:
			break;

		case RESTRICTED:
			if(domain_allowed(server, rule, opts.domains_forbidden_when_restricted))
				break;

			log::info
			{
				log, "Third-party invite of %s (%s) into restricted room %s denied :%s",
				address,
				server,
				string_view{room_id},
				server_not_permitted,
			};

			return decision::denied(std::string{server_not_permitted});

		case DIRECT:
			if(!direct{state, room_id}.full())
				break;

			log::info
			{
				log, "Third-party invite of %s into direct room %s denied :%s",
				address,
				string_view{room_id},
				direct_limited,
			};

			return decision::denied(std::string{direct_limited});
	}

	return decision::allowed();
}

/// The current rule of the room. Every room is assigned a rule when it is
/// created, so a room without a readable one is not in a state where a
/// decision can be made.
roomgate::m::access_rules::rule
roomgate::m::access_rules::engine::current(const id::room &room_id)
const
{
	if(!state.exists(room_id))
		throw precondition
		{
			"Room %s is not known", string_view{room_id}
		};

	std::optional<rule> ret;
	const bool found
	{
		state.get(std::nothrow, room_id, TYPE, "", [&ret]
		(const m::event &event)
		{
			const string_view value
			{
				event.content.get("rule")
			};

			if(json::type(value, std::nothrow) == json::STRING)
				ret = parse(std::nothrow, json::unescape(json::string(value)));
		})
	};

	if(!found)
		throw precondition
		{
			"Room %s has no %s state", string_view{room_id}, TYPE
		};

	if(!ret)
		throw precondition
		{
			"Room %s has an unrecognized %s rule", string_view{room_id}, TYPE
		};

	return *ret;
}
