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
#define HAVE_ROOMGATE_NET_H

/// Network client
///
/// A blocking request to a remote HTTP server which is bounded by a hard
/// deadline. The transaction runs on a private asio io_context on the
/// calling thread; nothing is shared between concurrent requests.
///
namespace roomgate::net
{
	struct request;

	ROOMGATE_EXCEPTION(roomgate::error, error)
	ROOMGATE_EXCEPTION(error, disconnected)
	ROOMGATE_EXCEPTION(error, inauthentic)
	ROOMGATE_EXCEPTION(error, not_found)
	ROOMGATE_EXCEPTION(error, timeout)
	ROOMGATE_EXCEPTION(error, overflow)

	// "net"
	extern log::log log;
}

/// HTTP/1.0 GET of a URL. The scheme selects TLS ("https", the default when
/// absent) or plaintext ("http"). On return the response head has been
/// parsed and the content is the rest of what the server sent before closing
/// the connection. Any failure to complete within opts.timeout throws
/// net::timeout; transport failures throw other net::error.
struct roomgate::net::request
{
	struct opts;

	std::string received;
	http::response head;

	http::code code() const
	{
		return head.code;
	}

	string_view content() const
	{
		return head.content;
	}

	request(const string_view &url, const opts &);
	request(request &&) = delete;
	request(const request &) = delete;
};

struct roomgate::net::request::opts
{
	/// Deadline for the entire transaction from resolve to close.
	milliseconds timeout {5000};

	/// Maximum size of the whole response.
	size_t max_received {64_KiB};

	/// Verify the server's certificate and hostname for TLS.
	bool verify_peer {true};

	/// Value of the User-Agent header.
	string_view user_agent {"roomgate"};
};
