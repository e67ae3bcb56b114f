// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#ifndef HAVE_ROOMGATE_MATRIX_H
#define HAVE_ROOMGATE_MATRIX_H

#include <roomgate/roomgate.h>
#include <roomgate/m/m.h>

#endif // HAVE_ROOMGATE_MATRIX_H
