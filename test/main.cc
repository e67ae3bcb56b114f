// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <roomgate/matrix.h>

int
main(int argc, char *const *argv)
{
	// Decisions are logged at INFO; keep the reporter output readable.
	const roomgate::log::console_quiet quiet
	{
		false
	};

	return Catch::Session().run(argc, argv);
}
