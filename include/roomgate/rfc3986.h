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
#define HAVE_ROOMGATE_RFC3986_H

namespace roomgate::rfc3986
{
	struct uri;

	ROOMGATE_EXCEPTION(roomgate::error, error)
	ROOMGATE_EXCEPTION(error, coding_error)
	ROOMGATE_EXCEPTION(coding_error, encoding_error)

	// Percent-encode arbitrary string; binary/non-printable characters OK
	std::string encode(const string_view &url);

	// x-www-form-urlencoded generator. We make use of the existing key-value
	// aggregator `json::members` for the inputs, but result is a www-form.
	// String values are encoded unquoted.
	std::string encode(const json::members &);

	// extractor suite
	uint16_t port(const string_view &remote); // get portnum from valid remote
	string_view host(const string_view &remote); // get host without portnum
}

namespace roomgate
{
	/// Convenience namespace roomgate::url allows developers to use
	/// `url::encode` rather than rfc3986:: explicitly.
	namespace url = rfc3986;
}

/// Split view of a URI. A string without "://" is taken to be only the
/// remote (host and optional port) with an empty scheme.
struct roomgate::rfc3986::uri
{
	string_view scheme;
	string_view remote;
	string_view path;
	string_view query;

	uri(const string_view &);
	uri() = default;
};
