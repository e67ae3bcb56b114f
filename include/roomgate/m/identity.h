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
#define HAVE_ROOMGATE_M_IDENTITY_H

/// Identity service client
///
/// Third-party identifiers (an email address, a phone number) are resolved
/// to the homeserver they are bound to by asking an identity server. Every
/// failure to get a definite answer is an identity::error; callers making
/// access decisions treat it as a denial.
///
namespace roomgate::m::identity
{
	struct lookup;
	struct client;

	ROOMGATE_EXCEPTION(roomgate::error, error)
	ROOMGATE_EXCEPTION(error, unbound)

	extern log::log log;
	extern conf::item<milliseconds> timeout;

	// Supported media are "email" and "msisdn".
	bool valid_medium(const string_view &medium) noexcept;

	// A bare addr-spec `local@domain`; display names, brackets, whitespace
	// and lists are refused.
	bool valid_email(const string_view &address) noexcept;
}

/// Abstract resolver from a third-party identifier to a server name.
struct roomgate::m::identity::lookup
{
	// The server name the identifier is bound to; throws identity::error
	// (unbound when the service has no binding).
	virtual std::string resolve(const string_view &medium, const string_view &address) const = 0;

	virtual ~lookup() noexcept;
};

/// Lookup over HTTP at `/_matrix/identity/api/v1/info`. The id_server is a
/// host[:port] reached over https, or a URL whose scheme selects http.
struct roomgate::m::identity::client final
:lookup
{
	std::string id_server;
	milliseconds timeout;
	bool verify_peer {true};

	std::string url(const string_view &medium, const string_view &address) const;
	std::string resolve(const string_view &medium, const string_view &address) const override;

	client(std::string id_server, const milliseconds &timeout = identity::timeout);
};
