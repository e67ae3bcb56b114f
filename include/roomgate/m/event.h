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
#define HAVE_ROOMGATE_M_EVENT_H

namespace roomgate::m
{
	struct event;

	string_view membership(const event &);
	bool is_state(const event &) noexcept;
	bool is_member(const event &) noexcept;
}

/// An event owned as its JSON source text. The property views point into the
/// source and are reestablished whenever the event is copied or moved.
///
/// Properties absent from the source are undefined views; a state event is
/// one where the state_key is defined, even if it is empty.
struct roomgate::m::event
{
	std::string source;
	json::object object;

	json::string event_id;
	json::string room_id;
	json::string sender;
	json::string type;
	json::string state_key;
	json::object content;

  private:
	void rebase(const event &other) noexcept;

  public:
	event(std::string source);
	event(const json::members &);
	event(const event &);
	event(event &&) noexcept;
	event &operator=(const event &);
	event &operator=(event &&) noexcept;
	event() = default;
};
