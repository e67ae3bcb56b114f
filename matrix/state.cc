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

// Out-of-line placement
roomgate::m::state::~state()
noexcept
{
}

void
roomgate::m::state::get(const id::room &room_id,
                        const string_view &type,
                        const string_view &state_key,
                        const closure &closure)
const
{
	if(!get(std::nothrow, room_id, type, state_key, closure))
		throw m::NOT_FOUND
		{
			"No state (%s,%s) in %s", type, state_key, string_view{room_id}
		};
}

bool
roomgate::m::state::has(const id::room &room_id,
                        const string_view &type,
                        const string_view &state_key)
const
{
	return get(std::nothrow, room_id, type, state_key, [](const auto &) {});
}

void
roomgate::m::state::for_each(const id::room &room_id,
                             const string_view &type,
                             const closure &closure)
const
{
	for_each(room_id, closure_bool{[&type, &closure]
	(const m::event &event)
	{
		if(event.type == type)
			closure(event);

		return true;
	}});
}

//
// state::memory
//

roomgate::m::state::memory::memory(const json::object &serial)
{
	load(serial);
}

void
roomgate::m::state::memory::load(const json::object &serial)
{
	const json::object rooms_
	{
		serial.at("rooms")
	};

	for(const auto &[room_id, events] : rooms_)
	{
		const id::room checked
		{
			json::string(room_id)
		};

		for(const auto &event : json::array(events))
		{
			m::event copy
			{
				std::string{event}
			};

			if(!copy.room_id)
				throw m::BAD_JSON
				{
					"Event in %s is missing a room_id", string_view{checked}
				};

			if(copy.room_id != checked)
				throw m::BAD_JSON
				{
					"Event for %s listed under %s",
					string_view{copy.room_id},
					string_view{checked}
				};

			append(std::move(copy));
		}

		// A room listed without events still exists.
		const std::unique_lock lock{mutex};
		rooms.try_emplace(std::string{checked});
	}
}

void
roomgate::m::state::memory::append(m::event event)
{
	const id::room room_id
	{
		string_view{event.room_id}
	};

	const std::unique_lock lock{mutex};
	auto it(rooms.find(string_view{room_id}));
	if(it == end(rooms))
		it = rooms.emplace(std::string{room_id}, std::vector<m::event>{}).first;

	it->second.emplace_back(std::move(event));
}

bool
roomgate::m::state::memory::exists(const id::room &room_id)
const
{
	const std::shared_lock lock{mutex};
	return rooms.find(string_view{room_id}) != end(rooms);
}

bool
roomgate::m::state::memory::get(std::nothrow_t,
                                const id::room &room_id,
                                const string_view &type,
                                const string_view &state_key,
                                const closure &closure)
const
{
	const std::shared_lock lock{mutex};
	const auto it(rooms.find(string_view{room_id}));
	if(it == end(rooms))
		return false;

	const auto &events(it->second);
	const auto rit
	{
		std::find_if(events.rbegin(), events.rend(), [&type, &state_key]
		(const m::event &event)
		{
			return is_state(event)
			&& event.type == type
			&& event.state_key == state_key;
		})
	};

	if(rit == events.rend())
		return false;

	closure(*rit);
	return true;
}

bool
roomgate::m::state::memory::for_each(const id::room &room_id,
                                     const closure_bool &closure)
const
{
	const std::shared_lock lock{mutex};
	const auto it(rooms.find(string_view{room_id}));
	if(it == end(rooms))
		return true;

	for(const auto &event : it->second)
		if(!closure(event))
			return false;

	return true;
}
