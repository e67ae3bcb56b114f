// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "lgetopt.h"
#define OPTCHAR '-'

using argtype = decltype(lgetopt::argtype);

/// Switched arguments come first; on return argv points at the first
/// positional argument and argc counts what remains.
void
parseargs(int *argc, char *const **argv, struct lgetopt *opts)
{
	const char *progname = (*argv)[0];

	for(;;)
	{
		bool found = false;

		(*argc)--;
		(*argv)++;

		if(*argc < 1)
			return;

		if((*argv)[0][0] != OPTCHAR)
			return;

		for(int i = 0; opts[i].opt; i++)
		{
			if(strcmp(opts[i].opt, &(*argv)[0][1]) != 0)
				continue;

			found = true;
			switch(opts[i].argtype)
			{
				case argtype::BOOL:
					*((bool *) opts[i].argloc) = true;
					break;

				case argtype::STRING:
					if(*argc < 2)
					{
						fprintf(stderr,
						        "error: option '%c%s' requires an argument\n",
						        OPTCHAR, opts[i].opt);
						usage(progname, opts);
					}

					*((const char **) opts[i].argloc) = (*argv)[1];
					(*argc)--;
					(*argv)++;
					break;

				case argtype::USAGE:
					usage(progname, opts);
			}

			break;
		}

		if(!found)
		{
			fprintf(stderr, "error: unknown argument '%c%s'\n", OPTCHAR, &(*argv)[0][1]);
			usage(progname, opts);
		}
	}
}

void
usage(const char *name, struct lgetopt *myopts)
{
	fprintf(stderr, "Usage: %s [options] [-threepid <room_id> <medium> <address>]\n", name);
	fprintf(stderr, "Where valid options are:\n");

	for(int i = 0; myopts[i].opt; i++)
		fprintf(stderr, "\t%c%-10s %-20s%s\n", OPTCHAR,
		        myopts[i].opt,
		        myopts[i].argtype == argtype::STRING? "<string>" : "",
		        myopts[i].desc);

	exit(2);
}
