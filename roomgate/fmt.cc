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

boost::format
roomgate::fmt::make_format(const string_view &fmt)
{
	boost::format ret
	{
		std::string{fmt}
	};

	// Argument count and directive mismatches are not errors here.
	ret.exceptions(boost::io::no_error_bits);
	return ret;
}
