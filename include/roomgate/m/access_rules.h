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
#define HAVE_ROOMGATE_M_ACCESS_RULES_H

/// Room access rules
///
/// Every room carries one `im.vector.room.access_rules` state event with an
/// empty state key whose content is `{"rule": ...}`. The rule is chosen when
/// the room is created and governs which invites the room admits:
///
/// - restricted: invites to servers in the configured denylist are refused.
/// - unrestricted: every invite is admitted.
/// - direct: the room is closed to its two original participants.
///
/// The direct rule is only legal on rooms created with is_direct, and the
/// other rules only on rooms created without it.
///
namespace roomgate::m::access_rules
{
	enum rule :uint8_t;
	struct precondition;
	struct opts;
	struct decision;
	struct direct;
	struct hooks;
	struct engine;

	using denylist = std::set<std::string, std::less<>>;

	extern log::log log;
	extern const string_view TYPE;
	extern conf::item<std::string> domains_forbidden_when_restricted;
	extern conf::item<std::string> id_server;

	string_view reflect(const rule &);
	rule parse(const string_view &);                                 // throws INVALID_PARAM
	std::optional<rule> parse(std::nothrow_t, const string_view &) noexcept;

	// Rule assignment at creation
	rule default_rule(const bool &is_direct) noexcept;
	bool valid(const rule &, const bool &is_direct) noexcept;
	rule resolve(const bool &is_direct, const std::optional<rule> &requested);
	std::optional<rule> requested(const createroom &);
	json::strung content(const rule &);

	// Server name policy
	bool domain_allowed(const string_view &server, const rule &, const denylist &);

	// content.third_party_invite.signed.token of a member event, if any.
	string_view signed_token(const m::event &);
}

enum roomgate::m::access_rules::rule
:uint8_t
{
	RESTRICTED    = 0,
	UNRESTRICTED  = 1,
	DIRECT        = 2,
};

/// Room state needed for a decision is missing or malformed. This is not a
/// policy outcome and is reported to the client as an internal error.
struct roomgate::m::access_rules::precondition
:m::UNKNOWN
{
	template<class... args>
	precondition(const string_view &fmt, args&&... a)
	:m::UNKNOWN
	{
		child, http::INTERNAL_SERVER_ERROR, "M_UNKNOWN", fmt, std::forward<args>(a)...
	}{}
};

/// Immutable configuration of an engine.
struct roomgate::m::access_rules::opts
{
	/// Server names which may not be invited into restricted rooms.
	access_rules::denylist domains_forbidden_when_restricted;

	/// Identity server for third-party invites; required.
	std::string id_server;

	/// Deadline for each identity lookup.
	milliseconds lookup_timeout {5000};

	/// Snapshot of the roomgate.m.access_rules.* conf items.
	static opts from_conf();

	/// From a module configuration block:
	/// `{"domains_forbidden_when_restricted": [...], "id_server": "..."}`
	opts(const json::object &config);
	opts() = default;
};

/// Outcome of an admission check. A denial carries the status and the
/// reason to send to the client.
struct roomgate::m::access_rules::decision
{
	bool allow {true};
	http::code code {http::OK};
	std::string reason;

	explicit operator bool() const
	{
		return allow;
	}

	// Throw the denial as m::FORBIDDEN; no-op when allowed.
	void enforce() const;

	static decision allowed();
	static decision denied(std::string reason);
};

/// The closed membership set of a direct room.
///
/// The set is folded over the room's events in order. The creator holds the
/// first slot; the first invited or joined user, or the first pending
/// third-party invite, holds the second. Later identities never enter the
/// set, and leaving never removes anyone from it. A member invite carrying
/// the signed token of the pending third-party invite binds that slot to
/// the invited user.
struct roomgate::m::access_rules::direct
{
	struct slot
	{
		std::string id;               // user id, or the token of a 3pid invite
		bool token {false};
	};

	static constexpr const size_t MAX {2};

	std::string creator;
	std::vector<slot> slots;
	size_t ignored {0};               // distinct identities beyond the pair

	bool full() const;
	bool has(const string_view &user_id) const;
	bool has_token(const string_view &token) const;

	// Whether an invite of user_id (with an optional 3pid token) keeps the
	// set closed.
	bool admits(const string_view &user_id, const string_view &token = {}) const;

	// Apply one event of the room's history.
	void fold(const m::event &);

	direct(const m::state &, const id::room &);
	direct(std::string creator);
};

/// Interface through which the host consults the access rules. The host
/// calls on_room_create before creating a room and writes the returned rule
/// as the room's access rules state; it calls on_membership_event before
/// committing membership-affecting events and on_threepid_invite before
/// sending a third-party invite. Implementations are stateless between
/// calls and safe to call concurrently.
struct roomgate::m::access_rules::hooks
{
	virtual rule on_room_create(const createroom &) const = 0;
	virtual decision on_membership_event(const m::event &) const = 0;
	virtual decision on_threepid_invite(const id::room &, const string_view &medium, const string_view &address) const = 0;

	virtual ~hooks() noexcept;
};

struct roomgate::m::access_rules::engine final
:hooks
{
	const m::state &state;
	const access_rules::opts opts;

  private:
	std::unique_ptr<identity::lookup> client;
	const identity::lookup &lookup;

	decision on_member_invite(const m::event &, const rule &) const;
	decision on_third_party_invite(const m::event &, const rule &) const;

  public:
	// The resolved rule of a room; throws precondition.
	rule current(const id::room &) const;

	rule on_room_create(const createroom &) const override;
	decision on_membership_event(const m::event &) const override;
	decision on_threepid_invite(const id::room &, const string_view &medium, const string_view &address) const override;

	engine(const m::state &, access_rules::opts, const identity::lookup &);
	engine(const m::state &, access_rules::opts);
	engine(engine &&) = delete;
	engine(const engine &) = delete;
};
