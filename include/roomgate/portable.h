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
#define HAVE_ROOMGATE_PORTABLE_H

// Maximum length of a matrix identifier including sigil and host.
#ifndef ROOMGATE_MXID_MAXLEN
	#define ROOMGATE_MXID_MAXLEN 255
#endif

// Compile-time ceiling for log messages; levels above this are elided.
#ifndef ROOMGATE_LOG_LEVEL
	#define ROOMGATE_LOG_LEVEL 7
#endif
