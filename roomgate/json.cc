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
#include <boost/phoenix/operator.hpp>

namespace roomgate::json
{
	namespace qi = boost::spirit::qi;

	struct parser;

	static const parser &grammar();
	static const char *parse_member(const char *start, const char *const &stop, object::member &);
	static const char *parse_value(const char *start, const char *const &stop, string_view &);
	static const char *skip(const char *start, const char *const &stop);
	[[noreturn]] static void throw_parse_error(const string_view &what, const char *const &start, const char *const &stop);
	static void append_utf8(std::string &, const uint32_t &codepoint);

	constexpr const uint max_recursion_depth
	{
		64
	};
}

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuninitialized"
struct roomgate::json::parser
{
	using it = const char *;
	using unused_type = qi::unused_type;

	template<class T = unused_type,
	         class... A>
	using rule = qi::rule<it, T, A...>;

	// insignificant whitespaces
	const rule<> SP                    { qi::lit('\x20')                                  ,"space" };
	const rule<> HT                    { qi::lit('\x09')                         ,"horizontal tab" };
	const rule<> CR                    { qi::lit('\x0D')                        ,"carriage return" };
	const rule<> LF                    { qi::lit('\x0A')                              ,"line feed" };
	const rule<> WS                    { SP | HT | CR | LF                           ,"whitespace" };
	const rule<> ws                    { *(WS)                                ,"whitespace monoid" };

	// structural
	const rule<> object_begin          { qi::lit('{')                              ,"object begin" };
	const rule<> object_end            { qi::lit('}')                                ,"object end" };
	const rule<> array_begin           { qi::lit('[')                               ,"array begin" };
	const rule<> array_end             { qi::lit(']')                                 ,"array end" };
	const rule<> name_sep              { qi::lit(':')                                  ,"name sep" };
	const rule<> value_sep             { qi::lit(',')                                 ,"value sep" };
	const rule<> escape                { qi::lit('\\')                                   ,"escape" };
	const rule<> quote                 { qi::lit('"')                                     ,"quote" };

	// literal
	const rule<> lit_false             { qi::lit("false")                         ,"literal false" };
	const rule<> lit_true              { qi::lit("true")                           ,"literal true" };
	const rule<> lit_null              { qi::lit("null")                                   ,"null" };

	// numerical (INT | FLOAT)
	const rule<> number_int
	{
		qi::lit('0') | (qi::char_('1', '9') >> *qi::char_('0', '9'))
		,"integer"
	};

	const rule<> number_frac
	{
		qi::lit('.') >> +qi::char_('0', '9')
		,"fraction"
	};

	const rule<> number_exp
	{
		qi::char_("eE") >> -qi::char_("+-") >> +qi::char_('0', '9')
		,"exponent"
	};

	const rule<> number
	{
		-qi::lit('-') >> number_int >> -number_frac >> -number_exp
		,"number"
	};

	// string
	const rule<> unicode
	{
		qi::lit('u') >> qi::repeat(4)[qi::xdigit]
		,"escaped unicode"
	};

	const rule<> control
	{
		qi::char_('\x00', '\x1F')
		,"control character"
	};

	// characters that should appear after an escaping solidus
	const rule<> escaper
	{
		qi::char_("btnfr\"\\/") | unicode
		,"escaper"
	};

	const rule<> string
	{
		quote >> *((qi::char_ - quote - escape - control) | (escape >> escaper)) >> quote
		,"string"
	};

	// recursion depth
	qi::_r1_type depth;

	rule<unused_type(uint)> member;
	rule<unused_type(uint)> object;
	rule<unused_type(uint)> array;
	rule<unused_type(uint)> value;

	// top-level
	rule<> document;

	parser();
};
#pragma GCC diagnostic pop

roomgate::json::parser::parser()
{
	member = string >> ws >> name_sep >> ws >> value(depth);

	object = qi::eps(depth < max_recursion_depth)
	>> object_begin >> ws >> -(member(depth) % (ws >> value_sep >> ws)) >> ws >> object_end;

	array = qi::eps(depth < max_recursion_depth)
	>> array_begin >> ws >> -(value(depth) % (ws >> value_sep >> ws)) >> ws >> array_end;

	value = string
	| object(depth + 1)
	| array(depth + 1)
	| number
	| lit_true
	| lit_false
	| lit_null;

	document = ws >> value(0U) >> ws >> qi::eoi;
}

const roomgate::json::parser &
roomgate::json::grammar()
{
	static const parser instance;
	return instance;
}

//
// tools
//

bool
roomgate::json::valid(const string_view &s)
noexcept try
{
	const char *start(s.data()), *const stop(s.data() + s.size());
	return s.defined() && qi::parse(start, stop, grammar().document);
}
catch(const std::exception &e)
{
	return false;
}

void
roomgate::json::valid(const string_view &s,
                      const string_view &what)
{
	if(!valid(s))
		throw parse_error
		{
			"%s is not valid JSON", what
		};
}

enum roomgate::json::type
roomgate::json::type(const string_view &s)
{
	const char *const start
	{
		skip(s.data(), s.data() + s.size())
	};

	if(start == s.data() + s.size())
		throw type_error
		{
			"Failed to get type from empty string"
		};

	switch(*start)
	{
		case '{':  return OBJECT;
		case '[':  return ARRAY;
		case '"':  return STRING;
		case 't':
		case 'f':
		case 'n':  return LITERAL;
		case '-':
		case '0': case '1': case '2': case '3': case '4':
		case '5': case '6': case '7': case '8': case '9':
			return NUMBER;

		default:
			throw type_error
			{
				"Failed to get type from character '%c'", *start
			};
	}
}

enum roomgate::json::type
roomgate::json::type(const string_view &s,
                     std::nothrow_t)
noexcept try
{
	return type(s);
}
catch(const std::exception &e)
{
	return LITERAL;
}

roomgate::string_view
roomgate::json::reflect(const enum type &type)
{
	switch(type)
	{
		case STRING:   return "STRING";
		case OBJECT:   return "OBJECT";
		case ARRAY:    return "ARRAY";
		case NUMBER:   return "NUMBER";
		case LITERAL:  return "LITERAL";
	}

	return "??????";
}

roomgate::string_view
roomgate::json::unquote(const string_view &s)
noexcept
{
	string_view ret{s};
	if(ret.size() >= 2 && ret.front() == '"' && ret.back() == '"')
	{
		ret.pop_front();
		ret.pop_back();
	}

	return ret;
}

std::string
roomgate::json::escape(const string_view &s)
{
	static const char *const hex
	{
		"0123456789abcdef"
	};

	std::string ret;
	ret.reserve(s.size());
	for(const char &c : s) switch(c)
	{
		case '"':   ret += "\\\"";  break;
		case '\\':  ret += "\\\\";  break;
		case '\b':  ret += "\\b";   break;
		case '\f':  ret += "\\f";   break;
		case '\n':  ret += "\\n";   break;
		case '\r':  ret += "\\r";   break;
		case '\t':  ret += "\\t";   break;
		default:
			if(uint8_t(c) < 0x20)
			{
				ret += "\\u00";
				ret += hex[uint8_t(c) >> 4];
				ret += hex[uint8_t(c) & 0x0F];
			}
			else ret += c;
			continue;
	}

	return ret;
}

std::string
roomgate::json::unescape(const string_view &s)
{
	const auto read_hex{[&s](const size_t &pos) -> uint32_t
	{
		if(pos + 4 > s.size())
			throw parse_error
			{
				"truncated unicode escape in string"
			};

		uint32_t ret(0);
		for(size_t i(pos); i < pos + 4; ++i)
		{
			const char &c(s[i]);
			ret <<= 4;
			if(c >= '0' && c <= '9')
				ret |= uint32_t(c - '0');
			else if(c >= 'a' && c <= 'f')
				ret |= uint32_t(c - 'a' + 10);
			else if(c >= 'A' && c <= 'F')
				ret |= uint32_t(c - 'A' + 10);
			else
				throw parse_error
				{
					"invalid unicode escape in string"
				};
		}

		return ret;
	}};

	std::string ret;
	ret.reserve(s.size());
	for(size_t i(0); i < s.size(); ++i)
	{
		if(s[i] != '\\')
		{
			ret += s[i];
			continue;
		}

		if(++i >= s.size())
			throw parse_error
			{
				"dangling escape at end of string"
			};

		switch(s[i])
		{
			case '"':   ret += '"';   break;
			case '\\':  ret += '\\';  break;
			case '/':   ret += '/';   break;
			case 'b':   ret += '\b';  break;
			case 'f':   ret += '\f';  break;
			case 'n':   ret += '\n';  break;
			case 'r':   ret += '\r';  break;
			case 't':   ret += '\t';  break;
			case 'u':
			{
				uint32_t cp(read_hex(i + 1));
				i += 4;

				// high surrogate followed by an escaped low surrogate
				if(cp >= 0xD800 && cp <= 0xDBFF && i + 6 < s.size() && s[i + 1] == '\\' && s[i + 2] == 'u')
				{
					const uint32_t lo(read_hex(i + 3));
					if(lo >= 0xDC00 && lo <= 0xDFFF)
					{
						cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
						i += 6;
					}
				}

				append_utf8(ret, cp);
				break;
			}

			default:
				throw parse_error
				{
					"invalid escape sequence '\\%c' in string", s[i]
				};
		}
	}

	return ret;
}

void
roomgate::json::append_utf8(std::string &out,
                            const uint32_t &cp)
{
	if(cp < 0x80)
		out += char(cp);
	else if(cp < 0x800)
	{
		out += char(0xC0 | (cp >> 6));
		out += char(0x80 | (cp & 0x3F));
	}
	else if(cp < 0x10000)
	{
		out += char(0xE0 | (cp >> 12));
		out += char(0x80 | ((cp >> 6) & 0x3F));
		out += char(0x80 | (cp & 0x3F));
	}
	else
	{
		out += char(0xF0 | (cp >> 18));
		out += char(0x80 | ((cp >> 12) & 0x3F));
		out += char(0x80 | ((cp >> 6) & 0x3F));
		out += char(0x80 | (cp & 0x3F));
	}
}

//
// internal parse steps
//

const char *
roomgate::json::skip(const char *start,
                     const char *const &stop)
{
	qi::parse(start, stop, grammar().ws);
	return start;
}

const char *
roomgate::json::parse_value(const char *start,
                            const char *const &stop,
                            string_view &out)
{
	const char *const begin(start);
	if(!qi::parse(start, stop, grammar().value(0U)))
		throw_parse_error("value", begin, stop);

	out = string_view{begin, start};
	return start;
}

const char *
roomgate::json::parse_member(const char *start,
                             const char *const &stop,
                             object::member &out)
{
	const auto &g(grammar());
	const char *const name_begin(start);
	if(!qi::parse(start, stop, g.string))
		throw_parse_error("member name", name_begin, stop);

	out.first = unquote(string_view{name_begin, start});
	const char *const sep(start);
	if(!qi::parse(start, stop, g.ws >> g.name_sep >> g.ws))
		throw_parse_error("name separator", sep, stop);

	return parse_value(start, stop, out.second);
}

void
roomgate::json::throw_parse_error(const string_view &what,
                                  const char *const &start,
                                  const char *const &stop)
{
	const string_view near
	{
		start, std::min(stop, start + 16)
	};

	throw parse_error
	{
		"Expected %s near '%s'", what, near
	};
}

//
// object
//

roomgate::json::object::const_iterator
roomgate::json::object::begin()
const
{
	const char *const stop
	{
		data() + string_view::size()
	};

	if(undefined() || string_view::empty())
		return end();

	const auto &g(grammar());
	const char *start(data());
	if(!qi::parse(start, stop, g.ws >> g.object_begin >> g.ws))
		throw type_error
		{
			"JSON %s is not an object", reflect(type(*this, std::nothrow))
		};

	if(qi::parse(start, stop, g.object_end))
		return end();

	return const_iterator{start, stop};
}

roomgate::json::object::const_iterator
roomgate::json::object::end()
const
{
	const_iterator ret;
	ret.start = data() + string_view::size();
	ret.stop = ret.start;
	return ret;
}

roomgate::json::object::const_iterator
roomgate::json::object::find(const string_view &key)
const
{
	return std::find_if(begin(), end(), [&key]
	(const auto &member)
	{
		return member.first == key;
	});
}

size_t
roomgate::json::object::size()
const
{
	return std::distance(begin(), end());
}

bool
roomgate::json::object::empty()
const
{
	return begin() == end();
}

bool
roomgate::json::object::has(const string_view &key)
const
{
	return find(key) != end();
}

roomgate::string_view
roomgate::json::object::get(const string_view &key,
                            const string_view &def)
const
{
	const auto it(find(key));
	return it != end()? it->second : def;
}

roomgate::string_view
roomgate::json::object::at(const string_view &key)
const
{
	const auto it(find(key));
	if(it == end())
		throw not_found
		{
			"'%s'", key
		};

	return it->second;
}

roomgate::string_view
roomgate::json::object::operator[](const string_view &key)
const
{
	return get(key);
}

roomgate::json::object::const_iterator::const_iterator(const char *const &start,
                                                       const char *const &stop)
:start{start}
,stop{stop}
{
	parse_member(start, stop, state);
}

roomgate::json::object::const_iterator &
roomgate::json::object::const_iterator::operator++()
{
	const auto &g(grammar());
	const char *pos
	{
		state.second.data() + state.second.size()
	};

	if(qi::parse(pos, stop, g.ws >> g.value_sep >> g.ws))
	{
		start = pos;
		parse_member(start, stop, state);
		return *this;
	}

	if(!qi::parse(pos, stop, g.ws >> g.object_end))
		throw_parse_error("',' or '}'", pos, stop);

	start = stop;
	state = {};
	return *this;
}

//
// array
//

roomgate::json::array::const_iterator
roomgate::json::array::begin()
const
{
	const char *const stop
	{
		data() + string_view::size()
	};

	if(undefined() || string_view::empty())
		return end();

	const auto &g(grammar());
	const char *start(data());
	if(!qi::parse(start, stop, g.ws >> g.array_begin >> g.ws))
		throw type_error
		{
			"JSON %s is not an array", reflect(type(*this, std::nothrow))
		};

	if(qi::parse(start, stop, g.array_end))
		return end();

	return const_iterator{start, stop};
}

roomgate::json::array::const_iterator
roomgate::json::array::end()
const
{
	const_iterator ret;
	ret.start = data() + string_view::size();
	ret.stop = ret.start;
	return ret;
}

size_t
roomgate::json::array::size()
const
{
	return std::distance(begin(), end());
}

bool
roomgate::json::array::empty()
const
{
	return begin() == end();
}

roomgate::string_view
roomgate::json::array::at(const size_t &i)
const
{
	size_t j(0);
	for(auto it(begin()); it != end(); ++it, ++j)
		if(j == i)
			return *it;

	throw not_found
	{
		"[%u] is out of range", i
	};
}

roomgate::string_view
roomgate::json::array::operator[](const size_t &i)
const
{
	size_t j(0);
	for(auto it(begin()); it != end(); ++it, ++j)
		if(j == i)
			return *it;

	return {};
}

roomgate::json::array::const_iterator::const_iterator(const char *const &start,
                                                      const char *const &stop)
:start{start}
,stop{stop}
{
	parse_value(start, stop, state);
}

roomgate::json::array::const_iterator &
roomgate::json::array::const_iterator::operator++()
{
	const auto &g(grammar());
	const char *pos
	{
		state.data() + state.size()
	};

	if(qi::parse(pos, stop, g.ws >> g.value_sep >> g.ws))
	{
		start = pos;
		parse_value(start, stop, state);
		return *this;
	}

	if(!qi::parse(pos, stop, g.ws >> g.array_end))
		throw_parse_error("',' or ']'", pos, stop);

	start = stop;
	state = {};
	return *this;
}

//
// value
//

roomgate::json::value::value()
:serial{literal_null}
{}

roomgate::json::value::value(const char *const &s)
:value{string_view{s}}
{}

roomgate::json::value::value(const std::string &s)
:value{string_view{s}}
{}

roomgate::json::value::value(const string_view &s)
:serial{'"' + escape(s) + '"'}
{}

roomgate::json::value::value(const json::string &s)
:serial{'"' + std::string{s} + '"'}
{}

roomgate::json::value::value(const json::object &o)
:serial
{
	o.undefined() || o.string_view::empty()?
		std::string{empty_object}:
		std::string{o}
}
{}

roomgate::json::value::value(const json::array &a)
:serial
{
	a.undefined() || a.string_view::empty()?
		std::string{empty_array}:
		std::string{a}
}
{}

roomgate::json::value::value(const json::members &members)
:serial{json::strung{members}}
{}

roomgate::json::value::value(const json::strung &s)
:serial{s}
{}

roomgate::json::value::value(const std::vector<std::string> &list)
{
	serial += '[';
	for(auto it(list.begin()); it != list.end(); ++it)
	{
		if(it != list.begin())
			serial += ',';

		serial += '"';
		serial += escape(*it);
		serial += '"';
	}

	serial += ']';
}

roomgate::json::value::value(const bool &b)
:serial{b? literal_true : literal_false}
{}

roomgate::json::value::value(const int &i)
:serial{lex_cast(i)}
{}

roomgate::json::value::value(const long &i)
:serial{lex_cast(i)}
{}

roomgate::json::value::value(const long long &i)
:serial{lex_cast(i)}
{}

roomgate::json::value::value(const unsigned &i)
:serial{lex_cast(i)}
{}

roomgate::json::value::value(const unsigned long &i)
:serial{lex_cast(i)}
{}

roomgate::json::value::value(const unsigned long long &i)
:serial{lex_cast(i)}
{}

roomgate::json::value::value(const double &d)
:serial{lex_cast(d)}
{}

//
// strung
//

roomgate::json::strung::strung(const json::members &members)
:strung{std::vector<json::member>(members.begin(), members.end())}
{}

roomgate::json::strung::strung(const std::vector<json::member> &members)
{
	std::string &out(*this);
	out += '{';
	for(auto it(members.begin()); it != members.end(); ++it)
	{
		if(it != members.begin())
			out += ',';

		out += '"';
		out += escape(it->first);
		out += "\":";
		out += it->second.serial;
	}

	out += '}';
}
