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
#define HAVE_ROOMGATE_M_STATE_H

namespace roomgate::m
{
	struct state;
}

/// Read port onto the host's room state.
///
/// The host implements this interface over whatever storage it has; nothing
/// here caches, so every query reflects the host's state at the time of the
/// call. Implementations must be safe for concurrent readers.
///
struct roomgate::m::state
{
	struct memory;

	using closure = std::function<void (const m::event &)>;
	using closure_bool = std::function<bool (const m::event &)>;

	// Whether the room is known at all.
	virtual bool exists(const id::room &) const = 0;

	// Resolved current state event for the (type, state_key) cell. Returns
	// false without calling the closure when there is no such state.
	virtual bool get(std::nothrow_t, const id::room &, const string_view &type, const string_view &state_key, const closure &) const = 0;

	// Every event of the room in the order it was accepted. The iteration
	// stops when the closure returns false; that return is propagated.
	virtual bool for_each(const id::room &, const closure_bool &) const = 0;

	// Convenience suite over the pure virtuals.
	void get(const id::room &, const string_view &type, const string_view &state_key, const closure &) const;
	bool has(const id::room &, const string_view &type, const string_view &state_key) const;
	void for_each(const id::room &, const string_view &type, const closure &) const;

	virtual ~state() noexcept;
};

/// In-memory room state. Events are appended in acceptance order and the
/// current state of a cell is the last state event appended for it.
///
/// The rooms can be loaded from a JSON object of the form
/// `{"rooms": {"!room:host": [event, ...], ...}}`.
struct roomgate::m::state::memory final
:m::state
{
	mutable std::shared_mutex mutex;
	std::map<std::string, std::vector<m::event>, std::less<>> rooms;

	using m::state::get;
	using m::state::for_each;

	bool exists(const id::room &) const override;
	bool get(std::nothrow_t, const id::room &, const string_view &type, const string_view &state_key, const closure &) const override;
	bool for_each(const id::room &, const closure_bool &) const override;

	// Append one event to its room; the room is created if unknown.
	void append(m::event);

	// Append every room and event in the serialized form above.
	void load(const json::object &);

	memory(const json::object &);
	memory() = default;
};
