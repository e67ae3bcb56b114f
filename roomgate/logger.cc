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
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace roomgate::log
{
	static bool can_skip(const log &, const level &);
	static void console_write(const log &, const level &, const string_view &);
	static std::string microdate();

	static std::mutex &mutex();
	static std::vector<log *> &loggers();
	static std::vector<hook *> &hooks();
	static std::vector<string_view> names(const string_view &list);
	static void console_level(const string_view &);

	extern conf::item<std::string> console_max_level;
	extern conf::item<std::string> mask_console;
	extern conf::item<std::string> unmask_console;

	extern const size_t LOG_NAME_TRUNC;
	extern const std::array<string_view, level::_NUM_> console_ansi;
	extern std::array<std::atomic<bool>, level::_NUM_> console_enabled_;
	extern std::atomic<ulong> console_quiet_count;
}

decltype(roomgate::log::LOG_NAME_TRUNC)
roomgate::log::LOG_NAME_TRUNC
{
	14
};

decltype(roomgate::log::console_ansi)
roomgate::log::console_ansi
{{
	"\033[1;5;37;45m",   // CRITICAL
	"\033[1;37;41m",     // ERROR
	"\033[0;30;43m",     // WARNING
	"\033[1;37;46m",     // NOTICE
	"\033[1;37;42m",     // INFO
	"\033[0;31;47m",     // DERROR
	"\033[0;30;47m",     // DWARNING
	"\033[1;30;47m",     // DEBUG
}};

decltype(roomgate::log::console_enabled_)
roomgate::log::console_enabled_
{
	true, true, true, true, true, true, true, true
};

decltype(roomgate::log::console_quiet_count)
roomgate::log::console_quiet_count
{
	0
};

/// The general logger is for all core and miscellaneous log messages. This
/// is the default logger target for log:: calls which do not pass a specific
/// logger.
decltype(roomgate::log::general)
roomgate::log::general
{
	"roomgate"
};

//
// init
//

void
roomgate::log::init(const bool &debugmode)
{
	// Items set from the environment during static initialization may have
	// preceded loggers in other units; apply them again to all of them.
	console_level(string_view{console_max_level});

	if(!empty(string_view{mask_console}))
		console_mask(names(string_view{mask_console}));

	if(!empty(string_view{unmask_console}))
		console_unmask(names(string_view{unmask_console}));

	// DEBUG is very noisy so it always starts off by default unless -debug
	if(!debugmode)
	{
		console_disable(level::DEBUG);
		console_disable(level::DERROR);
		console_disable(level::DWARNING);
	}
}

void
roomgate::log::flush()
{
	const std::lock_guard lock
	{
		mutex()
	};

	std::cerr << std::flush;
}

//
// console
//

void
roomgate::log::console_enable()
{
	for(uint lev(0); lev < level::_NUM_; ++lev)
		console_enable(level(lev));
}

void
roomgate::log::console_disable()
{
	for(uint lev(0); lev < level::_NUM_; ++lev)
		console_disable(level(lev));
}

void
roomgate::log::console_enable(const level &lev)
{
	console_enabled_.at(lev).store(true);
}

void
roomgate::log::console_disable(const level &lev)
{
	console_enabled_.at(lev).store(false);
}

bool
roomgate::log::console_enabled(const level &lev)
{
	return console_enabled_.at(lev).load();
}

void
roomgate::log::console_level(const string_view &name)
{
	const level max
	{
		reflect(name)
	};

	for(uint lev(0); lev < level::_NUM_; ++lev)
		console_enabled_.at(lev).store(lev <= max);
}

void
roomgate::log::console_mask(const std::vector<string_view> &list)
{
	const std::lock_guard lock
	{
		mutex()
	};

	for(auto *const &log : loggers())
		log->cmasked = std::find(begin(list), end(list), log->name) != end(list);
}

void
roomgate::log::console_unmask(const std::vector<string_view> &list)
{
	const std::lock_guard lock
	{
		mutex()
	};

	for(auto *const &log : loggers())
		log->cmasked = std::find(begin(list), end(list), log->name) == end(list);
}

std::vector<roomgate::string_view>
roomgate::log::names(const string_view &list)
{
	std::vector<string_view> ret;
	tokens(list, ' ', [&ret](const string_view &name)
	{
		ret.emplace_back(name);
	});

	return ret;
}

decltype(roomgate::log::console_max_level)
roomgate::log::console_max_level
{
	{
		{ "name",     "roomgate.log.console.level" },
		{ "default",  "DEBUG"                      },
	}, []
	{
		try
		{
			console_level(string_view{console_max_level});
		}
		catch(const roomgate::error &e)
		{
			throw conf::bad_value
			{
				"%s", e.what()
			};
		}
	}
};

decltype(roomgate::log::mask_console)
roomgate::log::mask_console
{
	{
		{ "name",     "roomgate.log.mask.console" },
		{ "default",  ""                          },
	}, []
	{
		if(!empty(string_view{mask_console}))
			console_mask(names(string_view{mask_console}));
	}
};

decltype(roomgate::log::unmask_console)
roomgate::log::unmask_console
{
	{
		{ "name",     "roomgate.log.unmask.console" },
		{ "default",  ""                            },
	}, []
	{
		if(!empty(string_view{unmask_console}))
			console_unmask(names(string_view{unmask_console}));
	}
};

//
// console_quiet
//

roomgate::log::console_quiet::console_quiet(const bool &showmsg)
{
	if(showmsg)
		notice
		{
			"Log messages are now quieted at the console"
		};

	++console_quiet_count;
}

roomgate::log::console_quiet::~console_quiet()
{
	--console_quiet_count;
}

//
// log
//

roomgate::log::log::log(const string_view &name)
:name{name}
{
	const std::lock_guard lock
	{
		mutex()
	};

	loggers().emplace_back(this);
}

roomgate::log::log::~log()
noexcept
{
	const std::lock_guard lock
	{
		mutex()
	};

	auto &list(loggers());
	list.erase(std::remove(begin(list), end(list), this), end(list));
}

roomgate::log::log *
roomgate::log::log::find(const string_view &name)
{
	const std::lock_guard lock
	{
		mutex()
	};

	const auto &list(loggers());
	const auto it
	{
		std::find_if(begin(list), end(list), [&name]
		(const auto *const &log)
		{
			return log->name == name;
		})
	};

	return it != end(list)? *it : nullptr;
}

bool
roomgate::log::log::exists(const log *const &ptr)
{
	const std::lock_guard lock
	{
		mutex()
	};

	const auto &list(loggers());
	return std::find(begin(list), end(list), ptr) != end(list);
}

//
// hook
//

roomgate::log::hook::hook(closure function)
:function{std::move(function)}
{
	const std::lock_guard lock
	{
		mutex()
	};

	hooks().emplace_back(this);
}

roomgate::log::hook::~hook()
noexcept
{
	const std::lock_guard lock
	{
		mutex()
	};

	auto &list(hooks());
	list.erase(std::remove(begin(list), end(list), this), end(list));
}

//
// vlog
//

roomgate::log::vlog::vlog(const log &log,
                          const level &lev,
                          const string_view &msg)
noexcept try
{
	// Set while this thread is calling hooks, so their own lines skip them.
	thread_local bool hooking {false};

	if(!hooking)
	{
		std::vector<hook::closure> functions;
		{
			const std::lock_guard lock
			{
				mutex()
			};

			functions.reserve(hooks().size());
			for(const auto &hook : hooks())
				functions.emplace_back(hook->function);
		}

		hooking = true;
		const unwind reset{[]
		{
			hooking = false;
		}};

		for(const auto &function : functions)
			function(log, lev, msg);
	}

	const std::lock_guard lock
	{
		mutex()
	};

	if(can_skip(log, lev))
		return;

	console_write(log, lev, msg);
}
catch(const std::exception &e)
{
	std::cerr << "Failed to write log message: " << e.what() << std::endl;
}

void
roomgate::log::console_write(const log &log,
                             const level &lev,
                             const string_view &msg)
{
	// Fixed width of the log level column.
	static const size_t lev_width
	{
		8
	};

	const string_view &ansi
	{
		console_ansi.at(lev)
	};

	std::cerr
	<< microdate()
	<< ' '
	<< ansi
	<< std::setw(lev_width)
	<< std::right
	<< reflect(lev)
	<< "\033[0m "
	<< std::setw(LOG_NAME_TRUNC)
	<< std::left
	<< trunc(log.name, LOG_NAME_TRUNC)
	<< " :"
	<< msg
	<< '\n';

	if(lev <= level::WARNING)
		std::cerr << std::flush;
}

bool
roomgate::log::can_skip(const log &log,
                        const level &lev)
{
	if(!log.cmasked)
		return true;

	if(console_quiet_count.load() > 0)
		return true;

	return !console_enabled(lev);
}

std::string
roomgate::log::microdate()
{
	const auto now
	{
		std::chrono::system_clock::now()
	};

	const auto usec
	{
		duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000
	};

	const std::time_t t
	{
		std::chrono::system_clock::to_time_t(now)
	};

	struct tm tm;
	::localtime_r(&t, &tm);

	char buf[64];
	const size_t len
	{
		std::strftime(buf, sizeof(buf), "%Y-%m-%d %T", &tm)
	};

	std::ostringstream s;
	s << string_view{buf, len} << '.' << std::setw(6) << std::setfill('0') << usec;
	return s.str();
}

std::mutex &
roomgate::log::mutex()
{
	static std::mutex mutex;
	return mutex;
}

std::vector<roomgate::log::log *> &
roomgate::log::loggers()
{
	static std::vector<log *> list;
	return list;
}

std::vector<roomgate::log::hook *> &
roomgate::log::hooks()
{
	static std::vector<hook *> list;
	return list;
}

//
// reflection
//

roomgate::log::level
roomgate::log::reflect(const string_view &f)
{
	if(f == "CRITICAL")  return level::CRITICAL;
	if(f == "ERROR")     return level::ERROR;
	if(f == "WARNING")   return level::WARNING;
	if(f == "NOTICE")    return level::NOTICE;
	if(f == "INFO")      return level::INFO;
	if(f == "DERROR")    return level::DERROR;
	if(f == "DWARNING")  return level::DWARNING;
	if(f == "DEBUG")     return level::DEBUG;

	throw roomgate::error
	{
		"'%s' is not a recognized log level", f
	};
}

roomgate::string_view
roomgate::log::reflect(const level &f)
{
	switch(f)
	{
		case level::CRITICAL:   return "CRITICAL";
		case level::ERROR:      return "ERROR";
		case level::WARNING:    return "WARNING";
		case level::NOTICE:     return "NOTICE";
		case level::INFO:       return "INFO";
		case level::DERROR:     return "ERROR";
		case level::DWARNING:   return "WARNING";
		case level::DEBUG:      return "DEBUG";
		case level::_NUM_:      break; // Allows -Wswitch to remind developer to add reflection here
	};

	return "??????";
}
