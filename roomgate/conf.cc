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

namespace roomgate::conf
{
	static void call_env(item<void> &) noexcept;
	static std::string env_name(const string_view &);
}

decltype(roomgate::conf::item<void>::NAME_MAX_LEN)
roomgate::conf::item<void>::NAME_MAX_LEN
{
	127
};

/// Conf item registry. Items are constructed statically in any unit so the
/// map is constructed on first use.
roomgate::conf::items_map &
roomgate::conf::items()
{
	static items_map items;
	return items;
}

void
roomgate::conf::fault(const string_view &key)
{
	auto it(items().find(key));
	if(it == end(items()))
		throw not_found
		{
			"Conf item '%s' is not available", key
		};

	it->second->fault();
}

bool
roomgate::conf::fault(std::nothrow_t,
                      const string_view &key)
noexcept try
{
	auto it(items().find(key));
	if(it == end(items()))
		return false;

	it->second->fault();
	return true;
}
catch(const std::exception &e)
{
	return false;
}

bool
roomgate::conf::set(std::nothrow_t,
                    const string_view &key,
                    const string_view &value)
try
{
	return set(key, value);
}
catch(const std::exception &e)
{
	log::error
	{
		"%s", e.what()
	};

	return false;
}

bool
roomgate::conf::set(const string_view &key,
                    const string_view &value)
{
	const auto it(items().find(key));
	if(it == end(items()))
		throw not_found
		{
			"Conf item '%s' is not available", key
		};

	return it->second->set(value);
}

std::string
roomgate::conf::get(const string_view &key)
{
	const auto it(items().find(key));
	if(it == end(items()))
		throw not_found
		{
			"Conf item '%s' is not available", key
		};

	return it->second->get();
}

bool
roomgate::conf::exists(const string_view &key)
{
	return items().count(key);
}

//
// item
//

roomgate::conf::item<void>::item(const json::members &opts,
                                 conf::set_cb set_cb)
:feature_
{
	opts
}
,feature
{
	feature_
}
,name
{
	json::string(feature.at("name"))
}
,set_cb
{
	std::move(set_cb)
}
{
	if(name.size() > NAME_MAX_LEN)
		throw error
		{
			"Conf item '%s' name length:%u exceeds max:%u",
			name,
			name.size(),
			NAME_MAX_LEN
		};

	if(!items().emplace(name, this).second)
		throw error
		{
			"Conf item named '%s' already exists", name
		};
}

roomgate::conf::item<void>::~item()
noexcept
{
	if(name)
		items().erase(name);
}

void
roomgate::conf::item<void>::fault()
noexcept try
{
	const json::string default_
	{
		feature.get("default")
	};

	log::warning
	{
		"conf item[%s] defaulting with featured value :%s",
		name,
		string_view{default_}
	};

	const std::string literal
	{
		json::type(feature.get("default"), std::nothrow) == json::STRING?
			json::unescape(default_):
			std::string{default_}
	};

	on_set(literal);
}
catch(const std::exception &e)
{
	log::critical
	{
		"conf item[%s] failed to set default value :%s",
		name,
		e.what()
	};
}

bool
roomgate::conf::item<void>::set(const string_view &val)
{
	const bool ret
	{
		on_set(val)
	};

	if(set_cb)
		set_cb();

	return ret;
}

std::string
roomgate::conf::item<void>::get()
const
{
	return on_get();
}

void
roomgate::conf::item<void>::call_init()
{
	// Environmental variables get the final say; this allows any
	// misconfiguration to be overridden by env vars. The variable name is
	// the conf item name with any '.' replaced to '_', case is preserved.
	conf::call_env(*this);
}

void
roomgate::conf::call_env(item<void> &item)
noexcept try
{
	const char *const val
	{
		::getenv(env_name(item.name).c_str())
	};

	if(val && *val)
		item.set(val);
}
catch(const std::exception &e)
{
	log::error
	{
		"conf item[%s] environmental variable :%s",
		item.name,
		e.what()
	};
}

std::string
roomgate::conf::env_name(const string_view &name)
{
	std::string ret{name};
	std::replace(begin(ret), end(ret), '.', '_');
	return ret;
}

//
// Non-inline template specialization definitions
//

//
// std::string
//

roomgate::conf::item<std::string>::item(const json::members &members,
                                        conf::set_cb set_cb)
:conf::item<>
{
	members, std::move(set_cb)
}
,value
{
	json::unescape(json::string(feature.get("default")))
}
{
	call_init();
}

bool
roomgate::conf::item<std::string>::on_set(const string_view &s)
{
	_value = std::string{s};
	return true;
}

std::string
roomgate::conf::item<std::string>::on_get()
const
{
	return _value;
}

//
// bool
//

roomgate::conf::item<bool>::item(const json::members &members,
                                 conf::set_cb set_cb)
:conf::item<>
{
	members, std::move(set_cb)
}
,value
{
	feature.get("default", false)
}
{
	call_init();
}

bool
roomgate::conf::item<bool>::on_set(const string_view &s)
{
	if(s == "true" || s == "1")
		_value = true;
	else if(s == "false" || s == "0")
		_value = false;
	else
		throw bad_value
		{
			"Conf item '%s' not assigned a bool literal", name
		};

	return true;
}

std::string
roomgate::conf::item<bool>::on_get()
const
{
	return _value? "true" : "false";
}
