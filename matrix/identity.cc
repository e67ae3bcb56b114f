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

decltype(roomgate::m::identity::log)
roomgate::m::identity::log
{
	"m.identity"
};

decltype(roomgate::m::identity::timeout)
roomgate::m::identity::timeout
{
	{ "name",     "roomgate.m.identity.timeout" },
	{ "default",  5000L                         },
};

// Out-of-line placement
roomgate::m::identity::lookup::~lookup()
noexcept
{
}

//
// client
//

roomgate::m::identity::client::client(std::string id_server,
                                      const milliseconds &timeout)
:id_server
{
	std::move(id_server)
}
,timeout
{
	timeout
}
{
	if(this->id_server.empty())
		throw conf::error
		{
			"An identity server is required for third-party lookups"
		};
}

std::string
roomgate::m::identity::client::url(const string_view &medium,
                                   const string_view &address)
const
{
	const rfc3986::uri base
	{
		id_server
	};

	const string_view path
	{
		rstrip(base.path, '/')
	};

	return fmt::snstringf
	(
		"%s://%s%s/_matrix/identity/api/v1/info?%s",
		base.scheme? base.scheme : string_view{"https"},
		base.remote,
		path,
		url::encode(json::members
		{
			{ "medium",   medium   },
			{ "address",  address  },
		})
	);
}

std::string
roomgate::m::identity::client::resolve(const string_view &medium,
                                       const string_view &address)
const try
{
	net::request::opts opts;
	opts.timeout = timeout;
	opts.verify_peer = verify_peer;

	const net::request request
	{
		url(medium, address), opts
	};

	if(request.code() != http::OK)
		throw error
		{
			"%s answered %u %s",
			id_server,
			uint(request.code()),
			http::status(request.code())
		};

	const json::object response
	{
		request.content()
	};

	if(json::type(response, std::nothrow) != json::OBJECT || !json::valid(response))
		throw error
		{
			"%s answered with something other than a JSON object", id_server
		};

	const string_view hs
	{
		response.get("hs")
	};

	if(!hs || json::type(hs, std::nothrow) != json::STRING || json::string(hs).empty())
		throw unbound
		{
			"%s has no homeserver bound to %s %s", id_server, medium, address
		};

	log::debug
	{
		log, "%s %s is bound to %s by %s",
		medium,
		address,
		string_view{json::string(hs)},
		id_server
	};

	return json::unescape(json::string(hs));
}
catch(const identity::error &e)
{
	throw;
}
catch(const std::exception &e)
{
	throw error
	{
		"lookup of %s %s at %s failed :%s", medium, address, id_server, e.what()
	};
}

//
// util
//

bool
roomgate::m::identity::valid_medium(const string_view &medium)
noexcept
{
	return medium == "email" || medium == "msisdn";
}

bool
roomgate::m::identity::valid_email(const string_view &address)
noexcept
{
	const auto &[local, domain]
	{
		rsplit(address, '@')
	};

	if(local.empty() || domain.empty() || !domain.data())
		return false;

	return std::none_of(begin(address), end(address), []
	(const char &c)
	{
		switch(c)
		{
			case '<':
			case '>':
			case '(':
			case ')':
			case ',':
			case ';':
			case '"':
			case ':':
			case '[':
			case ']':
				return true;

			default:
				return std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c));
		}
	})
	&& local.find('@') == local.npos;
}
