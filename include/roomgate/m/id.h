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
#define HAVE_ROOMGATE_M_ID_H

namespace roomgate::m
{
	struct id;

	ROOMGATE_M_EXCEPTION(error, INVALID_MXID, http::BAD_REQUEST)
	ROOMGATE_M_EXCEPTION(INVALID_MXID, BAD_SIGIL, http::BAD_REQUEST)
}

/// Matrix identifier view: sigil, localpart and server name separated by the
/// first colon. The server name is everything after that colon, so any port
/// is part of it. Construction with a sigil validates; construction without
/// one only views.
struct roomgate::m::id
:string_view
{
	struct user;
	struct room;

	enum sigil :char;

	static constexpr const size_t &MAX_SIZE
	{
		ROOMGATE_MXID_MAXLEN // should be 255
	};

  public:
	// Extract elements
	string_view local() const;        // The full localpart including sigil
	string_view host() const;         // The full server part including port
	string_view localname() const;    // The localpart not including sigil
	string_view hostname() const;     // The server part not including port
	uint16_t port() const;            // Just the port number or 0 if none

	id(const enum sigil &, const string_view &id);
	id(const string_view &id);
	id() = default;
};

namespace roomgate::m
{
	// Check if any sigil
	bool is_sigil(const char &c) noexcept;
	bool has_sigil(const string_view &) noexcept;

	// Interpret sigil type (or throw)
	id::sigil sigil(const char &c);
	id::sigil sigil(const string_view &id);
	string_view reflect(const id::sigil &);

	// Full ID checks
	bool valid(const id::sigil &, const string_view &) noexcept;
	void validate(const id::sigil &, const string_view &);    // valid() | throws
}

enum roomgate::m::id::sigil
:char
{
	USER        = '@',     ///< User ID (4.2.1)
	EVENT       = '$',     ///< Event ID (4.2.2)
	ROOM        = '!',     ///< Room ID (4.2.2)
	ROOM_ALIAS  = '#',     ///< Room alias (4.2.3)
};

struct roomgate::m::id::user
:roomgate::m::id
{
	template<class... args>
	user(args&&... a)
	:m::id{USER, std::forward<args>(a)...}
	{}

	user() = default;
};

struct roomgate::m::id::room
:roomgate::m::id
{
	template<class... args>
	room(args&&... a)
	:m::id{ROOM, std::forward<args>(a)...}
	{}

	room() = default;
};
