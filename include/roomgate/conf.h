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
#define HAVE_ROOMGATE_CONF_H

/// Configuration items
///
/// Each item is a named value declared statically by the subsystem which
/// uses it, with a JSON "feature" carrying at least its name and default:
///
///    conf::item<std::string> id_server
///    {
///        { "name",     "roomgate.m.access_rules.id_server" },
///        { "default",  ""                                  },
///    };
///
/// All items are registered by name in one map so they can be listed and set
/// at runtime from configuration files or the command line. After the
/// default is established an environment variable may override it; the
/// variable name is the item name with any '.' replaced by '_'.
///
namespace roomgate::conf
{
	template<class T = void> struct item;  // doesn't exist
	template<> struct item<void>;          // base class of all conf items
	template<> struct item<std::string>;
	template<> struct item<bool>;
	template<> struct item<uint64_t>;
	template<> struct item<milliseconds>;

	template<class T> struct value;        // abstraction for carrying item value
	template<class T> struct lex_castable; // abstraction for lex_cast compatible
	template<class T> struct duration;     // abstraction for std::chrono durations

	ROOMGATE_EXCEPTION(roomgate::error, error)
	ROOMGATE_EXCEPTION(error, not_found)
	ROOMGATE_EXCEPTION(error, bad_value)

	using set_cb = std::function<void ()>;
	using items_map = std::map<string_view, item<> *, std::less<>>;

	items_map &items();

	bool exists(const string_view &key);
	std::string get(const string_view &key);
	bool set(const string_view &key, const string_view &value);
	bool set(std::nothrow_t, const string_view &key, const string_view &value);
	bool fault(std::nothrow_t, const string_view &key) noexcept;
	void fault(const string_view &key);
}

template<>
struct roomgate::conf::item<void>
{
	static const size_t NAME_MAX_LEN;

	json::strung feature_;
	json::object feature;
	string_view name;
	conf::set_cb set_cb;

  protected:
	virtual std::string on_get() const = 0;
	virtual bool on_set(const string_view &) = 0;
	void call_init();

  public:
	std::string get() const;
	bool set(const string_view &);
	void fault() noexcept;

	item(const json::members &, conf::set_cb);
	item(item &&) = delete;
	item(const item &) = delete;
	virtual ~item() noexcept;
};

template<class T>
struct roomgate::conf::value
{
	using value_type = T;

	T _value;

	operator const T &() const noexcept
	{
		return _value;
	}

	template<class... A>
	value(A&&... a)
	:_value(std::forward<A>(a)...)
	{}
};

template<class T>
struct roomgate::conf::lex_castable
:conf::item<>
,conf::value<T>
{
	std::string on_get() const override
	{
		return lex_cast(this->_value);
	}

	bool on_set(const string_view &s) override
	{
		this->_value = lex_cast<T>(s);
		return true;
	}

	lex_castable(const json::members &members,
	             conf::set_cb set_cb = {})
	:conf::item<>
	{
		members, std::move(set_cb)
	}
	,conf::value<T>
	(
		feature.get("default", T(0))
	)
	{
		call_init();
	}
};

/// Durations are featured and set as the integer count of their unit.
template<class T>
struct roomgate::conf::duration
:conf::item<>
,conf::value<T>
{
	std::string on_get() const override
	{
		return lex_cast(this->_value.count());
	}

	bool on_set(const string_view &s) override
	{
		this->_value = T(lex_cast<typename T::rep>(s));
		return true;
	}

	duration(const json::members &members,
	         conf::set_cb set_cb = {})
	:conf::item<>
	{
		members, std::move(set_cb)
	}
	,conf::value<T>
	(
		T(feature.get("default", typename T::rep(0)))
	)
	{
		call_init();
	}
};

template<>
struct roomgate::conf::item<std::string>
:conf::item<>
,conf::value<std::string>
{
	explicit operator const std::string &() const
	{
		return _value;
	}

	operator string_view() const
	{
		return _value;
	}

	std::string on_get() const override;
	bool on_set(const string_view &s) override;

	item(const json::members &members, conf::set_cb set_cb = {});
};

template<>
struct roomgate::conf::item<bool>
:conf::item<>
,conf::value<bool>
{
	bool operator!() const
	{
		return !static_cast<const bool &>(*this);
	}

	std::string on_get() const override;
	bool on_set(const string_view &s) override;

	item(const json::members &members, conf::set_cb set_cb = {});
};

template<>
struct roomgate::conf::item<uint64_t>
:lex_castable<uint64_t>
{
	using lex_castable::lex_castable;
};

template<>
struct roomgate::conf::item<roomgate::milliseconds>
:duration<roomgate::milliseconds>
{
	using duration::duration;
};
