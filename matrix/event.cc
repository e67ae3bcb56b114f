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

roomgate::m::event::event(const json::members &members)
:event
{
	std::string{json::strung{members}}
}
{}

roomgate::m::event::event(std::string source_)
:source
{
	std::move(source_)
}
,object
{
	source
}
{
	if(json::type(object, std::nothrow) != json::OBJECT || !json::valid(object))
		throw BAD_JSON
		{
			"Event must be a JSON object"
		};

	for(const auto &[key, val] : object)
	{
		const auto string{[&key, &val]() -> json::string
		{
			if(json::type(val) != json::STRING)
				throw BAD_JSON
				{
					"Event property '%s' must be a string", key
				};

			return val;
		}};

		if(key == "event_id")
			event_id = string();
		else if(key == "room_id")
			room_id = string();
		else if(key == "sender")
			sender = string();
		else if(key == "type")
			type = string();
		else if(key == "state_key")
			state_key = string();
		else if(key == "content")
		{
			if(json::type(val) != json::OBJECT)
				throw BAD_JSON
				{
					"Event content must be a JSON object"
				};

			content = val;
		}
	}
}

roomgate::m::event::event(const event &other)
:source
{
	other.source
}
{
	rebase(other);
}

roomgate::m::event::event(event &&other)
noexcept
:source
{
	std::move(other.source)
}
{
	rebase(other);
	other = event{};
}

roomgate::m::event &
roomgate::m::event::operator=(const event &other)
{
	if(this == &other)
		return *this;

	source = other.source;
	rebase(other);
	return *this;
}

roomgate::m::event &
roomgate::m::event::operator=(event &&other)
noexcept
{
	if(this == &other)
		return *this;

	source = std::move(other.source);
	rebase(other);
	other.source.clear();
	other.rebase(event{});
	return *this;
}

/// Points the views of this event at the same offsets within this source as
/// the other event's views occupy within the other's. The other's views are
/// only used for their offsets; its source may already be moved from.
void
roomgate::m::event::rebase(const event &other)
noexcept
{
	const char *const base
	{
		other.object.data()
	};

	const auto map{[this, &base](const string_view &view)
	{
		return view.undefined()?
			string_view{}:
			string_view{source.data() + (view.data() - base), view.size()};
	}};

	static_cast<string_view &>(object) = map(other.object);
	static_cast<string_view &>(event_id) = map(other.event_id);
	static_cast<string_view &>(room_id) = map(other.room_id);
	static_cast<string_view &>(sender) = map(other.sender);
	static_cast<string_view &>(type) = map(other.type);
	static_cast<string_view &>(state_key) = map(other.state_key);
	static_cast<string_view &>(content) = map(other.content);
}

//
// tools
//

roomgate::string_view
roomgate::m::membership(const event &event)
{
	return json::string
	{
		event.content.get("membership")
	};
}

bool
roomgate::m::is_state(const event &event)
noexcept
{
	return event.state_key.defined();
}

bool
roomgate::m::is_member(const event &event)
noexcept
{
	return event.type == "m.room.member";
}
