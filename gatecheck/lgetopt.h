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
#define HAVE_GATECHECK_LGETOPT_H

struct lgetopt
{
	const char *opt;        // name of the argument
	void *argloc;           // where we store the argument to it (-option argument)
	enum
	{
		BOOL, STRING, USAGE
	}
	argtype;
	const char *desc;       // description of the argument, usage for printing help
};

void parseargs(int *argc, char *const **argv, struct lgetopt *opts);
[[noreturn]] void usage(const char *name, struct lgetopt *opts);
