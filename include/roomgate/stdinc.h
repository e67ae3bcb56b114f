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
#define HAVE_ROOMGATE_STDINC_H

//
// Standard includes shared by every unit of libroomgate. Boost is not
// included here except for the header-only formatting and lexical casting
// facilities; the units which need asio or spirit include those directly.
//

#include <cstdint>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

namespace roomgate
{
	using std::begin;
	using std::end;
	using std::get;
	using std::nothrow_t;
	using std::nothrow;

	using std::chrono::hours;
	using std::chrono::seconds;
	using std::chrono::milliseconds;
	using std::chrono::microseconds;
	using std::chrono::duration_cast;

	using ulong = unsigned long;
	using uint = unsigned int;
	using ushort = unsigned short;
}

#include "portable.h"
#include "string_view.h"
#include "util.h"
#include "fmt.h"
#include "exception.h"
#include "lex_cast.h"
#include "json.h"
#include "logger.h"
#include "conf.h"
#include "http.h"
#include "rfc3986.h"
#include "net.h"
