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

namespace roomgate::m
{
	static const json::object &createroom_body(const json::object &);
}

roomgate::m::createroom::createroom(const json::object &body,
                                    const string_view &creator)
:json::object
{
	createroom_body(body)
}
,creator
{
	creator?
		creator:
		string_view{json::string(body.get("creator"))}
}
{
}

const roomgate::json::object &
roomgate::m::createroom_body(const json::object &body)
{
	if(json::type(body, std::nothrow) != json::OBJECT || !json::valid(body))
		throw m::NOT_JSON
		{
			"createRoom request body must be a JSON object"
		};

	return body;
}

bool
roomgate::m::createroom::is_direct()
const try
{
	return get("is_direct", false);
}
catch(const json::type_error &e)
{
	throw m::BAD_JSON
	{
		"is_direct must be a boolean"
	};
}

roomgate::json::array
roomgate::m::createroom::invite()
const
{
	return get("invite");
}

roomgate::json::array
roomgate::m::createroom::invite_3pid()
const
{
	return get("invite_3pid");
}

roomgate::json::array
roomgate::m::createroom::initial_state()
const
{
	return get("initial_state");
}

void
roomgate::m::createroom::for_each_initial_state(const initial_state_closure &closure)
const
{
	for(const json::object event : initial_state())
	{
		if(json::type(event, std::nothrow) != json::OBJECT)
			throw m::BAD_JSON
			{
				"initial_state entries must be objects"
			};

		const json::string type
		{
			event.get("type")
		};

		const json::string state_key
		{
			event.get("state_key", "\"\"")
		};

		closure(type, state_key, event.get("content"));
	}
}
