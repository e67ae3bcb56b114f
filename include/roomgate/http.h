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
#define HAVE_ROOMGATE_HTTP_H

/// Hypertext Transfer Protocol
///
/// Status codes, the error type carrying a status and a body, and the
/// grammar for reading a response head off the wire. Only the client side
/// is present here; requests are composed by net::request.
///
namespace roomgate::http
{
	enum code :ushort;
	struct error;
	struct header;
	struct response;

	string_view status(const code &);
	code status(const string_view &);
}

enum roomgate::http::code
:ushort
{
	CONTINUE                                = 100,

	OK                                      = 200,
	CREATED                                 = 201,
	ACCEPTED                                = 202,
	NO_CONTENT                              = 204,

	MULTIPLE_CHOICES                        = 300,
	MOVED_PERMANENTLY                       = 301,
	FOUND                                   = 302,
	NOT_MODIFIED                            = 304,

	BAD_REQUEST                             = 400,
	UNAUTHORIZED                            = 401,
	FORBIDDEN                               = 403,
	NOT_FOUND                               = 404,
	METHOD_NOT_ALLOWED                      = 405,
	REQUEST_TIMEOUT                         = 408,
	CONFLICT                                = 409,
	PAYLOAD_TOO_LARGE                       = 413,
	TOO_MANY_REQUESTS                       = 429,

	INTERNAL_SERVER_ERROR                   = 500,
	NOT_IMPLEMENTED                         = 501,
	BAD_GATEWAY                             = 502,
	SERVICE_UNAVAILABLE                     = 503,
	GATEWAY_TIMEOUT                         = 504,
};

/// An error carrying an HTTP status and the content which would be sent as
/// the body of the response. The what() string is the status line.
struct roomgate::http::error
:roomgate::error
{
	std::string content;
	http::code code {http::code(0)};

	explicit operator bool() const     { return code != http::code(0);         }
	bool operator!() const             { return !bool(*this);                  }

	error(const http::code &, std::string content = {});
	~error() noexcept;
};

struct roomgate::http::header
:std::pair<string_view, string_view>
{
	bool operator==(const string_view &s) const  { return iequals(first, s);                       }
	bool operator!=(const string_view &s) const  { return !operator==(s);                          }

	using std::pair<string_view, string_view>::pair;
	header() = default;
};

/// Parsed response head. The views point into the buffer given to the
/// constructor; content is whatever follows the blank line.
struct roomgate::http::response
{
	string_view version;
	http::code code {http::code(0)};
	string_view reason;
	std::vector<header> headers;
	string_view content;

	string_view operator[](const string_view &key) const;
	bool has(const string_view &key) const;

	response(const string_view &received);
	response() = default;
};
