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

#ifndef ROOMGATE_VERSION
	#define ROOMGATE_VERSION "0.0.0"
#endif

decltype(roomgate::info::name)
roomgate::info::name
{
	"roomgate"
};

decltype(roomgate::info::version)
roomgate::info::version
{
	ROOMGATE_VERSION
};
