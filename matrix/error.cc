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

//
// error::error
//

roomgate::m::error::error()
:error
{
	internal, http::INTERNAL_SERVER_ERROR, std::string{},
}
{}

roomgate::m::error::error(const http::code &c)
:error
{
	internal, c, std::string{},
}
{}

roomgate::m::error::error(const http::code &c,
                          const json::members &members)
:error
{
	internal, c, json::strung{members},
}
{}

roomgate::m::error::error(internal_t,
                          const http::code &c,
                          std::string object)
:http::error
{
	c, std::move(object)
}
{
	if(!content.empty())
	{
		const std::string append
		{
			fmt::snstringf(" %s :%s", errcode(), errstr())
		};

		const size_t len(std::strlen(roomgate::exception::buf));
		const size_t cpy(std::min(append.size(), sizeof(roomgate::exception::buf) - len - 1));
		std::memcpy(roomgate::exception::buf + len, append.data(), cpy);
		roomgate::exception::buf[len + cpy] = '\0';
	}
}

// Out-of-line placement
roomgate::m::error::~error()
noexcept
{
}

roomgate::string_view
roomgate::m::error::errstr()
const noexcept try
{
	const json::object &content
	{
		this->http::error::content
	};

	if(json::type(content, std::nothrow) == json::STRING)
		return string_view{content};

	const json::string &ret
	{
		content["error"]
	};

	return ret;
}
catch(const std::exception &e)
{
	return "(There was an error with the error object)";
}

roomgate::string_view
roomgate::m::error::errcode()
const noexcept try
{
	const json::object &content
	{
		this->http::error::content
	};

	if(json::type(content, std::nothrow) == json::STRING)
		return "M_UNKNOWN";

	const json::string &ret
	{
		content.get("errcode", "\"M_UNKNOWN\"")
	};

	return ret;
}
catch(const std::exception &e)
{
	return "M_UNKNOWN";
}
