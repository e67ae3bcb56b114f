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

roomgate::m::access_rules::direct::direct(std::string creator_)
:creator
{
	std::move(creator_)
}
{
	slots.emplace_back(slot{creator, false});
}

/// Fold the history of the room. The creator comes from the create event;
/// a room without one has not finished creation and cannot be decided.
roomgate::m::access_rules::direct::direct(const m::state &state,
                                          const id::room &room_id)
{
	const bool created
	{
		state.get(std::nothrow, room_id, "m.room.create", "", [this]
		(const m::event &event)
		{
			const json::string creator_
			{
				event.content.get("creator")
			};

			creator = creator_?
				json::unescape(creator_):
				json::unescape(event.sender);
		})
	};

	if(!created || creator.empty())
		throw precondition
		{
			"No creator of direct room %s", string_view{room_id}
		};

	slots.emplace_back(slot{creator, false});
	state.for_each(room_id, [this]
	(const m::event &event)
	{
		fold(event);
		return true;
	});

	if(ignored)
		log::warning
		{
			log, "Direct room %s has %u identities beyond its original pair which are ignored",
			string_view{room_id},
			ignored,
		};
}

void
roomgate::m::access_rules::direct::fold(const m::event &event)
{
	if(event.type == "m.room.third_party_invite" && is_state(event))
	{
		const std::string token
		{
			json::unescape(event.state_key)
		};

		if(token.empty() || has_token(token))
			return;

		if(full())
		{
			++ignored;
			return;
		}

		slots.emplace_back(slot{token, true});
		return;
	}

	if(!is_member(event) || !is_state(event))
		return;

	const string_view membership
	{
		m::membership(event)
	};

	if(membership != "invite" && membership != "join")
		return;

	const std::string user_id
	{
		json::unescape(event.state_key)
	};

	if(has(user_id))
		return;

	// An invite redeeming a pending third-party invite takes over its slot.
	const std::string token
	{
		json::unescape(signed_token(event))
	};

	if(!token.empty())
	{
		const auto it
		{
			std::find_if(begin(slots), end(slots), [&token]
			(const slot &slot)
			{
				return slot.token && slot.id == token;
			})
		};

		if(it != end(slots))
		{
			it->id = user_id;
			it->token = false;
			return;
		}
	}

	if(full())
	{
		++ignored;
		return;
	}

	slots.emplace_back(slot{user_id, false});
}

bool
roomgate::m::access_rules::direct::admits(const string_view &user_id,
                                          const string_view &token)
const
{
	if(user_id == creator)
		return true;

	if(has(user_id))
		return true;

	if(token && has_token(token))
		return true;

	return !full();
}

bool
roomgate::m::access_rules::direct::has_token(const string_view &token)
const
{
	return std::any_of(begin(slots), end(slots), [&token]
	(const slot &slot)
	{
		return slot.token && slot.id == token;
	});
}

bool
roomgate::m::access_rules::direct::has(const string_view &user_id)
const
{
	return std::any_of(begin(slots), end(slots), [&user_id]
	(const slot &slot)
	{
		return !slot.token && slot.id == user_id;
	});
}

bool
roomgate::m::access_rules::direct::full()
const
{
	return slots.size() >= MAX;
}

roomgate::string_view
roomgate::m::access_rules::signed_token(const m::event &event)
{
	const json::object third_party_invite
	{
		event.content.get("third_party_invite")
	};

	if(json::type(third_party_invite, std::nothrow) != json::OBJECT)
		return {};

	const json::object signed_
	{
		third_party_invite.get("signed")
	};

	if(json::type(signed_, std::nothrow) != json::OBJECT)
		return {};

	return json::string
	{
		signed_.get("token")
	};
}
