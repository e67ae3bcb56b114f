// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <roomgate/matrix.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include "lgetopt.h"

namespace m = roomgate::m;
namespace access_rules = roomgate::m::access_rules;

bool printversion;
bool debugmode;
bool quietmode;
bool threepid;
const char *confpath;
const char *statepath;
const char *createpath;
const char *eventpath;
const char *creator;

lgetopt opts[]
{
	{ "help",       nullptr,        lgetopt::USAGE,   "Print this text" },
	{ "version",    &printversion,  lgetopt::BOOL,    "Print version and exit" },
	{ "debug",      &debugmode,     lgetopt::BOOL,    "Enable options for debugging" },
	{ "quiet",      &quietmode,     lgetopt::BOOL,    "Suppress log messages at the terminal" },
	{ "conf",       &confpath,      lgetopt::STRING,  "Module configuration JSON (otherwise the conf items)" },
	{ "state",      &statepath,     lgetopt::STRING,  "Room state JSON {\"rooms\": {room_id: [events]}}" },
	{ "create",     &createpath,    lgetopt::STRING,  "Evaluate a createRoom request body" },
	{ "creator",    &creator,       lgetopt::STRING,  "User creating the room for -create" },
	{ "event",      &eventpath,     lgetopt::STRING,  "Evaluate a membership event" },
	{ "threepid",   &threepid,      lgetopt::BOOL,    "Evaluate a third-party invite given as <room_id> <medium> <address>" },
	{ nullptr,      nullptr,        lgetopt::STRING,  nullptr },
};

const char *const usererrstr
{R"(
***
*** %s
***
)"};

static std::string read_file(const char *const &path);
static int print(const access_rules::decision &);
static int evaluate(int argc, char *const *argv);

int
main(int _argc, char *const *_argv)
noexcept try
{
	// '-' switched arguments come first; this function incs argv and decs argc
	auto argc(_argc);
	auto argv(_argv);
	parseargs(&argc, &argv, opts);

	if(printversion)
	{
		printf("VERSION :%s %s\n",
		       roomgate::info::name.data(),
		       roomgate::info::version.data());

		return EXIT_SUCCESS;
	}

	roomgate::log::init(debugmode);
	std::optional<roomgate::log::console_quiet> quiet;
	if(quietmode)
		quiet.emplace(false);

	return evaluate(argc, argv);
}
catch(const access_rules::precondition &e)
{
	fprintf(stderr, usererrstr, e.what());
	fprintf(stderr, "%s\n", e.content.c_str());
	return 2;
}
catch(const m::error &e)
{
	// Client errors are the request being rejected.
	fprintf(stdout, "reject %u %s\n", unsigned(e.code), e.content.c_str());
	return e.code < roomgate::http::INTERNAL_SERVER_ERROR? 1 : 2;
}
catch(const roomgate::user_error &e)
{
	fprintf(stderr, usererrstr, e.what());
	return 2;
}
catch(const std::exception &e)
{
	fprintf(stderr, usererrstr, e.what());
	return 2;
}

int
evaluate(int argc,
         char *const *argv)
{
	using roomgate::json::object;

	const std::string config
	{
		confpath? read_file(confpath) : std::string{}
	};

	const std::string state_json
	{
		statepath? read_file(statepath) : std::string{}
	};

	m::state::memory state;
	if(statepath)
		state.load(object{state_json});

	const access_rules::engine engine
	{
		state,
		confpath?
			access_rules::opts{object{config}}:
			access_rules::opts::from_conf(),
	};

	const access_rules::hooks &hooks
	{
		engine
	};

	if(createpath)
	{
		const std::string body
		{
			read_file(createpath)
		};

		const m::createroom request
		{
			object{body}, creator? roomgate::string_view{creator} : roomgate::string_view{}
		};

		const auto rule
		{
			hooks.on_room_create(request)
		};

		fprintf(stdout, "%s\n", access_rules::content(rule).c_str());
		return EXIT_SUCCESS;
	}

	if(eventpath)
	{
		const m::event event
		{
			read_file(eventpath)
		};

		return print(hooks.on_membership_event(event));
	}

	if(threepid)
	{
		if(argc < 3)
			throw roomgate::user_error
			{
				"-threepid requires <room_id> <medium> <address>"
			};

		return print(hooks.on_threepid_invite(argv[0], argv[1], argv[2]));
	}

	throw roomgate::user_error
	{
		"Nothing to evaluate; give one of -create, -event or -threepid"
	};
}

int
print(const access_rules::decision &decision)
{
	if(decision)
	{
		fprintf(stdout, "allow\n");
		return EXIT_SUCCESS;
	}

	fprintf(stdout, "deny %u :%s\n", unsigned(decision.code), decision.reason.c_str());
	return 1;
}

std::string
read_file(const char *const &path)
{
	std::ifstream file
	{
		path
	};

	if(!file)
		throw roomgate::user_error
		{
			"Failed to open '%s'", path
		};

	std::stringstream ss;
	ss << file.rdbuf();
	return ss.str();
}
