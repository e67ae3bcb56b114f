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
#define HAVE_ROOMGATE_M_CREATEROOM_H

namespace roomgate::m
{
	struct createroom;
}

/// View of a client's createRoom request body together with the user
/// creating the room. Members which are absent read as empty.
struct roomgate::m::createroom
:json::object
{
	using initial_state_closure = std::function<void (const string_view &type, const string_view &state_key, const json::object &content)>;

	/// The user creating the room. Taken from the "creator" member when the
	/// host supplies it inside the body, otherwise given to the constructor.
	m::id creator;

	/// This flag makes the server set the is_direct flag on the m.room.member
	/// events sent to the users in invite and invite_3pid. See Direct
	/// Messaging for more information.
	bool is_direct() const;

	/// A list of user IDs to invite to the room.
	json::array invite() const;

	/// A list of objects representing third party IDs to invite into the room;
	/// each with id_server, medium and address.
	json::array invite_3pid() const;

	/// A list of state events to set in the new room; each an object with
	/// type, state_key and content.
	json::array initial_state() const;

	// Iterate initial_state; state_key defaults to empty when absent.
	void for_each_initial_state(const initial_state_closure &) const;

	createroom(const json::object &body, const string_view &creator = {});
};
