// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <roomgate/roomgate.h>
#include <boost/spirit/include/qi.hpp>

namespace roomgate::http::parser
{
	namespace qi = boost::spirit::qi;

	using it = const char *;
	using range = boost::iterator_range<it>;

	template<class T = qi::unused_type>
	using rule = qi::rule<it, T()>;

	static const rule<> &CRLF();
	static const rule<> &ws();
	static const rule<range> &version();
	static const rule<ushort> &status_code();
	static const rule<range> &reason();
	static const rule<range> &field_name();
	static const rule<range> &field_value();
}

const roomgate::http::parser::rule<> &
roomgate::http::parser::CRLF()
{
	static const rule<> ret
	{
		qi::lit("\r\n") | qi::lit('\n')
		,"CRLF"
	};

	return ret;
}

const roomgate::http::parser::rule<> &
roomgate::http::parser::ws()
{
	static const rule<> ret
	{
		*(qi::lit(' ') | qi::lit('\t'))
		,"whitespace"
	};

	return ret;
}

const roomgate::http::parser::rule<roomgate::http::parser::range> &
roomgate::http::parser::version()
{
	static const rule<range> ret
	{
		qi::raw[qi::lit("HTTP/") >> +qi::digit >> qi::lit('.') >> +qi::digit]
		,"version"
	};

	return ret;
}

const roomgate::http::parser::rule<ushort> &
roomgate::http::parser::status_code()
{
	static const rule<ushort> ret
	{
		qi::uint_parser<ushort, 10, 3, 3>{}
		,"status code"
	};

	return ret;
}

const roomgate::http::parser::rule<roomgate::http::parser::range> &
roomgate::http::parser::reason()
{
	static const rule<range> ret
	{
		qi::raw[*(qi::char_ - qi::char_("\r\n"))]
		,"reason"
	};

	return ret;
}

const roomgate::http::parser::rule<roomgate::http::parser::range> &
roomgate::http::parser::field_name()
{
	static const rule<range> ret
	{
		qi::raw[+(qi::char_ - qi::char_(":\r\n \t"))]
		,"field name"
	};

	return ret;
}

const roomgate::http::parser::rule<roomgate::http::parser::range> &
roomgate::http::parser::field_value()
{
	static const rule<range> ret
	{
		qi::raw[*(qi::char_ - qi::char_("\r\n"))]
		,"field value"
	};

	return ret;
}

//
// response
//

roomgate::http::response::response(const string_view &received)
{
	using namespace parser;

	const char *start(received.data());
	const char *const stop(received.data() + received.size());

	range version_, reason_;
	ushort code_ {0};
	const bool head
	{
		qi::parse(start, stop, parser::version(), version_) &&
		qi::parse(start, stop, qi::lit(' ') >> parser::status_code(), code_) &&
		qi::parse(start, stop, -qi::lit(' ') >> parser::reason(), reason_) &&
		qi::parse(start, stop, CRLF())
	};

	if(!head)
		throw error
		{
			BAD_GATEWAY, "Malformed HTTP response status line"
		};

	this->version = string_view{version_.begin(), version_.end()};
	this->code = http::code(code_);
	this->reason = string_view{reason_.begin(), reason_.end()};

	while(!qi::parse(start, stop, CRLF()))
	{
		range name, value;
		const bool field
		{
			qi::parse(start, stop, field_name(), name) &&
			qi::parse(start, stop, ws() >> qi::lit(':') >> ws()) &&
			qi::parse(start, stop, field_value(), value) &&
			qi::parse(start, stop, CRLF())
		};

		if(!field)
			throw error
			{
				BAD_GATEWAY, "Malformed HTTP response header"
			};

		headers.emplace_back
		(
			string_view{name.begin(), name.end()},
			rstrip(string_view{value.begin(), value.end()})
		);
	}

	this->content = string_view{start, stop};
}

roomgate::string_view
roomgate::http::response::operator[](const string_view &key)
const
{
	const auto it
	{
		std::find(begin(headers), end(headers), key)
	};

	return it != end(headers)? it->second : string_view{};
}

bool
roomgate::http::response::has(const string_view &key)
const
{
	return std::find(begin(headers), end(headers), key) != end(headers);
}

//
// error
//

roomgate::http::error::error(const http::code &code,
                             std::string content)
:roomgate::error
{
	generate_skip
}
,content
{
	std::move(content)
}
,code{code}
{
	auto &buf(roomgate::exception::buf);
	::snprintf(buf, sizeof(buf), "%u %s", uint(code), std::string{status(code)}.c_str());
}

// Out-of-line placement.
roomgate::http::error::~error()
noexcept
{
}

//
// status
//

enum roomgate::http::code
roomgate::http::status(const string_view &str)
{
	ushort ret {0};
	const char *start(str.data()), *const stop(str.data() + str.size());
	const bool parsed
	{
		parser::qi::parse(start, stop, parser::status_code(), ret)
	};

	if(!parsed)
		throw roomgate::error
		{
			"Invalid HTTP status code"
		};

	return http::code(ret);
}

roomgate::string_view
roomgate::http::status(const enum code &code)
{
	switch(code)
	{
		case CONTINUE:                  return "Continue";
		case OK:                        return "OK";
		case CREATED:                   return "Created";
		case ACCEPTED:                  return "Accepted";
		case NO_CONTENT:                return "No Content";
		case MULTIPLE_CHOICES:          return "Multiple Choices";
		case MOVED_PERMANENTLY:         return "Moved Permanently";
		case FOUND:                     return "Found";
		case NOT_MODIFIED:              return "Not Modified";
		case BAD_REQUEST:               return "Bad Request";
		case UNAUTHORIZED:              return "Unauthorized";
		case FORBIDDEN:                 return "Forbidden";
		case NOT_FOUND:                 return "Not Found";
		case METHOD_NOT_ALLOWED:        return "Method Not Allowed";
		case REQUEST_TIMEOUT:           return "Request Timeout";
		case CONFLICT:                  return "Conflict";
		case PAYLOAD_TOO_LARGE:         return "Payload Too Large";
		case TOO_MANY_REQUESTS:         return "Too Many Requests";
		case INTERNAL_SERVER_ERROR:     return "Internal Server Error";
		case NOT_IMPLEMENTED:           return "Not Implemented";
		case BAD_GATEWAY:               return "Bad Gateway";
		case SERVICE_UNAVAILABLE:       return "Service Unavailable";
		case GATEWAY_TIMEOUT:           return "Gateway Timeout";
	}

	return "";
}
