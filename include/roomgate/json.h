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
#define HAVE_ROOMGATE_JSON_H

/// JavaScript Object Notation: formal grammars & tools
///
/// The views in this system (json::object, json::array, json::string) do not
/// allocate; they are string_views over canonical JSON text which is parsed
/// lazily by the grammars in json.cc each time the view is queried. This
/// makes them cheap to construct and pass around, and suited for the
/// read-once workloads of request bodies and state event contents. For
/// composition, json::value carries one serialized value and json::strung
/// carries a complete serialized object built from json::members.
///
namespace roomgate::json
{
	ROOMGATE_EXCEPTION(roomgate::error, error)
	ROOMGATE_EXCEPTION(error, parse_error)
	ROOMGATE_EXCEPTION(error, type_error)
	ROOMGATE_EXCEPTION(error, not_found)

	enum type :uint8_t
	{
		STRING  = 0,
		OBJECT  = 1,
		ARRAY   = 2,
		NUMBER  = 3,
		LITERAL = 4,
	};

	struct string;
	struct object;
	struct array;
	struct value;
	struct member;
	struct strung;

	using members = std::initializer_list<member>;

	enum type type(const string_view &);
	enum type type(const string_view &, std::nothrow_t) noexcept;
	string_view reflect(const enum type &);

	bool valid(const string_view &) noexcept;
	void valid(const string_view &, const string_view &what);

	std::string escape(const string_view &);
	std::string unescape(const string_view &);
	string_view unquote(const string_view &) noexcept;

	constexpr string_view literal_true {"true"};
	constexpr string_view literal_false {"false"};
	constexpr string_view literal_null {"null"};
	constexpr string_view empty_object {"{}"};
	constexpr string_view empty_array {"[]"};
}

/// A view of the content of a JSON string; the surrounding quotes are
/// removed on construction but escapes are not processed. Use unescape()
/// to produce the literal text.
struct roomgate::json::string
:string_view
{
	string(const string_view &s)
	:string_view{unquote(s)}
	{}

	string() = default;
};

/// Lightweight interface to a JSON object string.
///
/// This makes queries into a string of JSON. This is a read-only device.
/// It is merely functionality built on top of a string_view which is just a
/// pair of `const char*` pointers. The members are iterated with a forward
/// iterator; each step parses exactly one member. Values are returned as
/// the raw JSON text of the value; json::string() or json::object() are then
/// applied by the caller as appropriate for the expected type.
///
/// The first member with a matching name is returned by the lookups. Names
/// are compared in their serialized form.
///
struct roomgate::json::object
:string_view
{
	struct const_iterator;
	using member = std::pair<string_view, string_view>;

	const_iterator begin() const;
	const_iterator end() const;
	const_iterator find(const string_view &key) const;

	size_t size() const;
	bool empty() const;
	bool has(const string_view &key) const;

	string_view get(const string_view &key, const string_view &def = {}) const;
	string_view at(const string_view &key) const;
	string_view operator[](const string_view &key) const;

	// Arithmetic and boolean members; def when undefined or null.
	template<class T,
	         std::enable_if_t<std::is_arithmetic<T>::value, int> = 0>
	T get(const string_view &key, const T &def) const;

	object(const string_view &sv)
	:string_view{sv}
	{}

	object() = default;
};

struct roomgate::json::object::const_iterator
{
	using iterator_category = std::forward_iterator_tag;
	using value_type = object::member;
	using difference_type = std::ptrdiff_t;
	using pointer = const value_type *;
	using reference = const value_type &;

	const char *start {nullptr};
	const char *stop {nullptr};
	object::member state;

	const value_type &operator*() const
	{
		return state;
	}

	const value_type *operator->() const
	{
		return &state;
	}

	const_iterator &operator++();

	friend bool operator==(const const_iterator &a, const const_iterator &b)
	{
		return a.start == b.start;
	}

	friend bool operator!=(const const_iterator &a, const const_iterator &b)
	{
		return a.start != b.start;
	}

	const_iterator(const char *const &start, const char *const &stop);
	const_iterator() = default;
};

/// Lightweight interface to a JSON array string.
///
/// Same as json::object but for arrays; elements are the raw JSON text of
/// each value in order.
///
struct roomgate::json::array
:string_view
{
	struct const_iterator;

	const_iterator begin() const;
	const_iterator end() const;

	size_t size() const;
	bool empty() const;
	string_view at(const size_t &i) const;
	string_view operator[](const size_t &i) const;

	array(const string_view &sv)
	:string_view{sv}
	{}

	array() = default;
};

struct roomgate::json::array::const_iterator
{
	using iterator_category = std::forward_iterator_tag;
	using value_type = string_view;
	using difference_type = std::ptrdiff_t;
	using pointer = const value_type *;
	using reference = const value_type &;

	const char *start {nullptr};
	const char *stop {nullptr};
	string_view state;

	const value_type &operator*() const
	{
		return state;
	}

	const value_type *operator->() const
	{
		return &state;
	}

	const_iterator &operator++();

	friend bool operator==(const const_iterator &a, const const_iterator &b)
	{
		return a.start == b.start;
	}

	friend bool operator!=(const const_iterator &a, const const_iterator &b)
	{
		return a.start != b.start;
	}

	const_iterator(const char *const &start, const char *const &stop);
	const_iterator() = default;
};

/// A single serialized JSON value for composition. The constructors select
/// the JSON type from the C++ type of the argument; strings are escaped
/// and quoted, json::object and json::array views are embedded verbatim.
struct roomgate::json::value
{
	std::string serial;

	explicit operator string_view() const
	{
		return serial;
	}

	value(const char *const &);
	value(const string_view &);
	value(const std::string &);
	value(const json::string &);
	value(const json::object &);
	value(const json::array &);
	value(const json::members &);
	value(const json::strung &);
	value(const std::vector<std::string> &);
	value(const bool &);
	value(const int &);
	value(const long &);
	value(const long long &);
	value(const unsigned &);
	value(const unsigned long &);
	value(const unsigned long long &);
	value(const double &);
	value();
};

struct roomgate::json::member
{
	std::string first;
	json::value second;

	member(const string_view &first, json::value second)
	:first{first}
	,second{std::move(second)}
	{}
};

/// Serialized JSON object composed from a list of members. The result is
/// a std::string and is convertible to json::object for reading back.
struct roomgate::json::strung
:std::string
{
	operator json::object() const
	{
		return json::object{string_view{*this}};
	}

	strung(const json::members &);
	strung(const std::vector<json::member> &);
	strung() = default;
};

template<class T,
         std::enable_if_t<std::is_arithmetic<T>::value, int>>
T
roomgate::json::object::get(const string_view &key,
                            const T &def)
const
{
	const string_view val
	{
		get(key)
	};

	if(val.undefined() || val == literal_null)
		return def;

	if constexpr(std::is_same<T, bool>())
	{
		if(val == literal_true)
			return true;

		if(val == literal_false)
			return false;

		throw type_error
		{
			"member '%s' is not a boolean", key
		};
	}
	else
	{
		if(type(val, std::nothrow) != NUMBER)
			throw type_error
			{
				"member '%s' is not a number", key
			};

		return lex_cast<T>(val);
	}
}
