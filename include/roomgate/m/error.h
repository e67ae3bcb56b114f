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
#define HAVE_ROOMGATE_M_ERROR_H

namespace roomgate::m
{
	struct error;
}

/// Matrix error. The content is the JSON error object sent to the client:
/// `{"errcode": "M_...", "error": "..."}` and the HTTP status is carried by
/// the http::error base.
class roomgate::m::error
:public http::error
{
	ROOMGATE_OVERLOAD(internal)
	error(internal_t, const http::code &, std::string object);

  protected:
	ROOMGATE_OVERLOAD(child)
	template<class... args> error(child_t, args&&... a)
	:error{std::forward<args>(a)...}
	{}

  public:
	string_view errcode() const noexcept;
	string_view errstr() const noexcept;

	template<class... args> error(const http::code &, const string_view &errcode, const string_view &fmt, args&&...);
	error(const http::code &, const json::members &);
	error(const http::code &);
	error();
	~error() noexcept;
};

#define ROOMGATE_M_EXCEPTION(_parent_, _name_, _httpcode_)              \
struct _name_                                                           \
: _parent_                                                              \
{                                                                       \
    _name_()                                                            \
    : _parent_                                                          \
    {                                                                   \
        child, _httpcode_, "M_"#_name_, "%s", http::status(_httpcode_)  \
    }{}                                                                 \
                                                                        \
    template<class... args> _name_(const string_view &fmt, args&&... a) \
    : _parent_                                                          \
    {                                                                   \
        child, _httpcode_, "M_"#_name_, fmt, std::forward<args>(a)...   \
    }{}                                                                 \
                                                                        \
    template<class... args> _name_(child_t, args&&... a)                \
    : _parent_                                                          \
    {                                                                   \
        child, std::forward<args>(a)...                                 \
    }{}                                                                 \
};

namespace roomgate::m
{
	ROOMGATE_M_EXCEPTION(error, UNKNOWN, http::INTERNAL_SERVER_ERROR)
	ROOMGATE_M_EXCEPTION(error, BAD_JSON, http::BAD_REQUEST)
	ROOMGATE_M_EXCEPTION(error, NOT_JSON, http::BAD_REQUEST)
	ROOMGATE_M_EXCEPTION(error, INVALID_PARAM, http::BAD_REQUEST)
	ROOMGATE_M_EXCEPTION(error, FORBIDDEN, http::FORBIDDEN)
	ROOMGATE_M_EXCEPTION(error, NOT_FOUND, http::NOT_FOUND)
}

template<class... args>
roomgate::m::error::error(const http::code &status,
                          const string_view &errcode,
                          const string_view &fmt,
                          args&&... a)
:error
{
	internal, status, json::strung
	{
		json::members
		{
			{ "errcode",  errcode                                          },
			{ "error",    fmt::snstringf(fmt, std::forward<args>(a)...)   },
		}
	}
}
{}
