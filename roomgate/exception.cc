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

namespace roomgate
{
	static size_t strlcat(char *const &dst, const string_view &src, const size_t &max) noexcept;
}

//
// exception
//

const char *
roomgate::exception::what()
const noexcept
{
	return buf;
}

size_t
roomgate::exception::generate(const string_view &msg)
noexcept
{
	buf[0] = '\0';
	return strlcat(buf, msg, sizeof(buf));
}

size_t
roomgate::exception::generate(const char *const &name,
                              const string_view &msg)
noexcept
{
	const bool empty(!msg || msg[0] == ' ');
	buf[0] = '\0';
	size_t size(0);
	size = strlcat(buf, name, sizeof(buf));
	size = strlcat(buf, empty? "." : " :", sizeof(buf));
	if(!empty)
		size = strlcat(buf, msg, sizeof(buf));

	return size;
}

size_t
roomgate::strlcat(char *const &dst,
                  const string_view &src,
                  const size_t &max)
noexcept
{
	const size_t len(std::strlen(dst));
	if(len + 1 >= max)
		return len;

	const size_t cpy(std::min(src.size(), max - len - 1));
	std::memcpy(dst + len, src.data(), cpy);
	dst[len + cpy] = '\0';
	return len + cpy;
}
