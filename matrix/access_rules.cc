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

decltype(roomgate::m::access_rules::log)
roomgate::m::access_rules::log
{
	"m.access_rules"
};

decltype(roomgate::m::access_rules::TYPE)
roomgate::m::access_rules::TYPE
{
	"im.vector.room.access_rules"
};

decltype(roomgate::m::access_rules::domains_forbidden_when_restricted)
roomgate::m::access_rules::domains_forbidden_when_restricted
{
	{ "name",     "roomgate.m.access_rules.domains_forbidden_when_restricted" },
	{ "default",  ""                                                          },
};

decltype(roomgate::m::access_rules::id_server)
roomgate::m::access_rules::id_server
{
	{ "name",     "roomgate.m.access_rules.id_server" },
	{ "default",  ""                                  },
};

//
// rule
//

roomgate::string_view
roomgate::m::access_rules::reflect(const rule &rule)
{
	switch(rule)
	{
		case RESTRICTED:     return "restricted";
		case UNRESTRICTED:   return "unrestricted";
		case DIRECT:         return "direct";
	}

	return "??????";
}

roomgate::m::access_rules::rule
roomgate::m::access_rules::parse(const string_view &str)
{
	const auto ret
	{
		parse(std::nothrow, str)
	};

	if(!ret)
		throw m::INVALID_PARAM
		{
			"'%s' is not a valid access rule", str
		};

	return *ret;
}

std::optional<roomgate::m::access_rules::rule>
roomgate::m::access_rules::parse(std::nothrow_t,
                                 const string_view &str)
noexcept
{
	if(str == "restricted")
		return RESTRICTED;

	if(str == "unrestricted")
		return UNRESTRICTED;

	if(str == "direct")
		return DIRECT;

	return std::nullopt;
}

roomgate::m::access_rules::rule
roomgate::m::access_rules::default_rule(const bool &is_direct)
noexcept
{
	return is_direct? DIRECT : RESTRICTED;
}

bool
roomgate::m::access_rules::valid(const rule &rule,
                                 const bool &is_direct)
noexcept
{
	return is_direct == (rule == DIRECT);
}

roomgate::m::access_rules::rule
roomgate::m::access_rules::resolve(const bool &is_direct,
                                   const std::optional<rule> &requested)
{
	if(!requested)
		return default_rule(is_direct);

	if(!valid(*requested, is_direct))
		throw m::INVALID_PARAM
		{
			"The '%s' access rule cannot be used in a %s room",
			reflect(*requested),
			is_direct? "direct" : "non-direct",
		};

	return *requested;
}

/// The rule requested by an access rules event in the initial_state of the
/// request. Events of this type with a non-empty state_key do not carry a
/// rule and are skipped. The last qualifying event wins.
std::optional<roomgate::m::access_rules::rule>
roomgate::m::access_rules::requested(const createroom &request)
{
	std::optional<rule> ret;
	request.for_each_initial_state([&ret]
	(const string_view &type, const string_view &state_key, const json::object &content)
	{
		if(type != TYPE || !state_key.empty())
			return;

		if(json::type(content.get("rule"), std::nothrow) != json::STRING)
			throw m::INVALID_PARAM
			{
				"The access rules event requires a string 'rule'"
			};

		ret = parse(json::unescape(json::string(content.get("rule"))));
	});

	return ret;
}

roomgate::json::strung
roomgate::m::access_rules::content(const rule &rule)
{
	return json::members
	{
		{ "rule", reflect(rule) }
	};
}

//
// domain
//

bool
roomgate::m::access_rules::domain_allowed(const string_view &server,
                                          const rule &rule,
                                          const denylist &denylist)
{
	if(rule != RESTRICTED)
		return true;

	return denylist.find(server) == end(denylist);
}

//
// opts
//

roomgate::m::access_rules::opts
roomgate::m::access_rules::opts::from_conf()
{
	opts ret;
	tokens(string_view{access_rules::domains_forbidden_when_restricted}, ' ', [&ret]
	(const string_view &server)
	{
		ret.domains_forbidden_when_restricted.emplace(server);
	});

	ret.id_server = std::string{string_view{access_rules::id_server}};
	ret.lookup_timeout = identity::timeout;
	if(ret.id_server.empty())
		throw conf::error
		{
			"%s is required", access_rules::id_server.name
		};

	return ret;
}

roomgate::m::access_rules::opts::opts(const json::object &config)
:lookup_timeout
{
	identity::timeout
}
{
	if(json::type(config, std::nothrow) != json::OBJECT || !json::valid(config))
		throw conf::error
		{
			"access rules configuration must be a JSON object"
		};

	const string_view denied
	{
		config.get("domains_forbidden_when_restricted")
	};

	if(denied && json::type(denied, std::nothrow) != json::ARRAY)
		throw conf::bad_value
		{
			"domains_forbidden_when_restricted must be a list of server names"
		};

	for(const auto &server : json::array(denied))
	{
		if(json::type(server, std::nothrow) != json::STRING)
			throw conf::bad_value
			{
				"domains_forbidden_when_restricted must be a list of server names"
			};

		domains_forbidden_when_restricted.emplace(json::unescape(json::string(server)));
	}

	const string_view id_server_
	{
		config.get("id_server")
	};

	if(json::type(id_server_, std::nothrow) != json::STRING)
		throw conf::error
		{
			"id_server is required in the access rules configuration"
		};

	id_server = json::unescape(json::string(id_server_));
	if(id_server.empty())
		throw conf::error
		{
			"id_server is required in the access rules configuration"
		};

	lookup_timeout = milliseconds
	{
		config.get("id_server_timeout", long(lookup_timeout.count()))
	};
}

//
// decision
//

roomgate::m::access_rules::decision
roomgate::m::access_rules::decision::allowed()
{
	return {};
}

roomgate::m::access_rules::decision
roomgate::m::access_rules::decision::denied(std::string reason)
{
	return decision
	{
		false, http::FORBIDDEN, std::move(reason)
	};
}

void
roomgate::m::access_rules::decision::enforce()
const
{
	if(allow)
		return;

	throw m::FORBIDDEN
	{
		"%s", reason
	};
}
