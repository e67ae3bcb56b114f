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
#define HAVE_ROOMGATE_LOGGER_H

namespace roomgate::log
{
	enum level :uint;
	struct log;
	struct vlog;
	struct logf;
	struct console_quiet;
	struct hook;

	struct critical;
	struct error;
	struct derror;
	struct warning;
	struct dwarning;
	struct notice;
	struct info;
	struct debug;

	string_view reflect(const level &);
	level reflect(const string_view &);

	// This suite adjusts the console output for an entire level.
	bool console_enabled(const level &);
	void console_disable(const level &);
	void console_enable(const level &);
	void console_disable();
	void console_enable();

	// This suite adjusts the console output for specific loggers by name.
	void console_mask(const std::vector<string_view> &names);
	void console_unmask(const std::vector<string_view> &names);

	void flush();
	void init(const bool &debugmode = false);

	extern log general;  // "roomgate"
}

enum roomgate::log::level
:uint
{
	CRITICAL  = 0,  ///< Catastrophic/unrecoverable; program is in a compromised state.
	ERROR     = 1,  ///< Things that shouldn't happen; user impacted and should know.
	WARNING   = 2,  ///< Non-impacting undesirable behavior user should know about.
	NOTICE    = 3,  ///< An infrequent important message with neutral or positive news.
	INFO      = 4,  ///< A more frequent message with good news.
	DERROR    = 5,  ///< An error but only worthy of developers in debug mode.
	DWARNING  = 6,  ///< A warning but only for developers in debug mode.
	DEBUG     = 7,  ///< Maximum verbosity for developers.
	_NUM_
};

/// A named logger. Instances are constructed statically by each subsystem
/// and registered in a list for lookup by name.
struct roomgate::log::log
{
	string_view name;                  // name of this logger
	bool cmasked {true};               // currently in the console mask (enabled)

  public:
	template<class... args> void operator()(const level &, const string_view &fmt, args&&...);

	log(const string_view &name);
	log(log &&) = delete;
	log(const log &) = delete;
	~log() noexcept;

	static bool exists(const log *const &ptr);
	static log *find(const string_view &name);
};

/// Listener for every composed log line. Constructing an instance registers
/// the closure for its lifetime; the console writer is always present.
/// Listeners are called without the log mutex held. A line logged from
/// within a listener reaches the console but not the listeners.
struct roomgate::log::hook
{
	using closure = std::function<void (const log &, const level &, const string_view &)>;

	closure function;

	hook(closure);
	hook(hook &&) = delete;
	hook(const hook &) = delete;
	~hook() noexcept;
};

struct roomgate::log::vlog
{
	vlog(const log &log, const level &, const string_view &msg) noexcept;
};

struct roomgate::log::logf
{
	template<class... args>
	logf(const log &log, const level &level, const string_view &fmt, args&&... a)
	{
		vlog(log, level, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

/// Suppresses console output for the lifetime of the instance.
struct roomgate::log::console_quiet
{
	console_quiet(const bool &showmsg = true);
	~console_quiet();
};

#if ROOMGATE_LOG_LEVEL >= 7
struct roomgate::log::debug
{
	template<class... args>
	debug(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::DEBUG, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	debug(const string_view &fmt, args&&... a)
	{
		vlog(general, level::DEBUG, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};
#else
struct roomgate::log::debug
{
	template<class... args>
	debug(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	debug(const string_view &fmt, args&&... a)
	{
	}
};
#endif

struct roomgate::log::dwarning
{
	template<class... args>
	dwarning(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::DWARNING, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	dwarning(const string_view &fmt, args&&... a)
	{
		vlog(general, level::DWARNING, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

struct roomgate::log::derror
{
	template<class... args>
	derror(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::DERROR, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	derror(const string_view &fmt, args&&... a)
	{
		vlog(general, level::DERROR, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

struct roomgate::log::info
{
	template<class... args>
	info(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::INFO, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	info(const string_view &fmt, args&&... a)
	{
		vlog(general, level::INFO, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

struct roomgate::log::notice
{
	template<class... args>
	notice(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::NOTICE, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	notice(const string_view &fmt, args&&... a)
	{
		vlog(general, level::NOTICE, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

struct roomgate::log::warning
{
	template<class... args>
	warning(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::WARNING, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	warning(const string_view &fmt, args&&... a)
	{
		vlog(general, level::WARNING, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

struct roomgate::log::error
{
	template<class... args>
	error(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::ERROR, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	error(const string_view &fmt, args&&... a)
	{
		vlog(general, level::ERROR, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

struct roomgate::log::critical
{
	template<class... args>
	critical(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::CRITICAL, fmt::snstringf(fmt, std::forward<args>(a)...));
	}

	template<class... args>
	critical(const string_view &fmt, args&&... a)
	{
		vlog(general, level::CRITICAL, fmt::snstringf(fmt, std::forward<args>(a)...));
	}
};

template<class... args>
void
roomgate::log::log::operator()(const level &l,
                               const string_view &fmt,
                               args&&... a)
{
	vlog(*this, l, fmt::snstringf(fmt, std::forward<args>(a)...));
}
