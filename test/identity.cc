// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <catch2/catch.hpp>
#include <roomgate/matrix.h>
#include <boost/asio.hpp>
#include <thread>
#include "fixture.h"

using namespace roomgate;

namespace
{
	namespace asio = boost::asio;
	using tcp = asio::ip::tcp;

	/// Serves one canned response to the first connection on a loopback port.
	struct server
	{
		asio::io_context ios;
		tcp::acceptor acceptor
		{
			ios, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}
		};

		std::string response;
		std::string request;
		std::thread thread;

		std::string url() const
		{
			return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
		}

		void serve()
		{
			tcp::socket socket{ios};
			acceptor.accept(socket);

			asio::streambuf buf;
			asio::read_until(socket, buf, "\r\n\r\n");
			request.assign(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));

			asio::write(socket, asio::buffer(response));
			boost::system::error_code ec;
			socket.shutdown(tcp::socket::shutdown_both, ec);
		}

		server(std::string content, const string_view &status = "200 OK")
		:response
		{
			fmt::snstringf
			(
				"HTTP/1.1 %s\r\nContent-Type: application/json\r\nContent-Length: %u\r\n\r\n%s",
				status,
				content.size(),
				content
			)
		}
		,thread
		{
			[this] { serve(); }
		}
		{}

		// The request is only complete once the connection is served.
		void wait()
		{
			if(thread.joinable())
				thread.join();
		}

		~server() noexcept
		{
			wait();
		}
	};

	/// Accepts connections into the backlog and never answers.
	struct silent
	{
		asio::io_context ios;
		tcp::acceptor acceptor
		{
			ios, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}
		};

		std::string url() const
		{
			return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
		}
	};
}

SCENARIO("media and email addresses are checked before any lookup", "[identity]")
{
	REQUIRE(m::identity::valid_medium("email"));
	REQUIRE(m::identity::valid_medium("msisdn"));
	REQUIRE(!m::identity::valid_medium("Email"));
	REQUIRE(!m::identity::valid_medium(""));

	REQUIRE(m::identity::valid_email("test@example.com"));
	REQUIRE(m::identity::valid_email("first.last+tag@sub.example.org"));
	REQUIRE(!m::identity::valid_email("Test <test@example.com>"));
	REQUIRE(!m::identity::valid_email("test@example.com, other@example.com"));
	REQUIRE(!m::identity::valid_email("test @example.com"));
	REQUIRE(!m::identity::valid_email("test@"));
	REQUIRE(!m::identity::valid_email("@example.com"));
	REQUIRE(!m::identity::valid_email("example.com"));
	REQUIRE(!m::identity::valid_email("a@b@example.com"));
}

SCENARIO("the lookup url is formed on the identity server", "[identity]")
{
	const m::identity::client plain
	{
		"http://127.0.0.1:8090"
	};

	REQUIRE(plain.url("email", "a+b@example.com") == "http://127.0.0.1:8090/_matrix/identity/api/v1/info?medium=email&address=a%2Bb%40example.com");

	const m::identity::client bare
	{
		"vector.im"
	};

	REQUIRE(bare.url("msisdn", "4477").find("https://vector.im/_matrix/identity/api/v1/info?") == 0);
	REQUIRE_THROWS_AS(m::identity::client{""}, conf::error);
}

SCENARIO("a bound address resolves to its homeserver", "[identity]")
{
	server server
	{
		R"({"hs": "forbidden_domain", "mxid": "@test:forbidden_domain"})"
	};

	const m::identity::client client
	{
		server.url(), milliseconds{2000}
	};

	REQUIRE(client.resolve("email", "test@forbidden_domain") == "forbidden_domain");
}

SCENARIO("an unbound address is an identity error", "[identity]")
{
	server server
	{
		R"({})"
	};

	const m::identity::client client
	{
		server.url(), milliseconds{2000}
	};

	REQUIRE_THROWS_AS(client.resolve("email", "test@example.com"), m::identity::unbound);
}

SCENARIO("an error status from the identity server is an identity error", "[identity]")
{
	server server
	{
		R"({"errcode": "M_UNKNOWN"})", "500 Internal Server Error"
	};

	const m::identity::client client
	{
		server.url(), milliseconds{2000}
	};

	REQUIRE_THROWS_AS(client.resolve("email", "test@example.com"), m::identity::error);
}

SCENARIO("an unreachable identity server is an identity error", "[identity]")
{
	const m::identity::client client
	{
		"http://127.0.0.1:1", milliseconds{2000}
	};

	REQUIRE_THROWS_AS(client.resolve("email", "test@example.com"), m::identity::error);
}

SCENARIO("an identity server which never answers times out", "[identity]")
{
	silent silent;
	const m::identity::client client
	{
		silent.url(), milliseconds{200}
	};

	const auto started(std::chrono::steady_clock::now());
	REQUIRE_THROWS_AS(client.resolve("email", "test@example.com"), m::identity::error);
	REQUIRE(std::chrono::steady_clock::now() - started < seconds{5});
}

SCENARIO("third-party invites fail closed on identity failure", "[identity][access_rules]")
{
	m::state::memory state;
	fixture::room(state, "!unrestricted:test", "@kermit:test", "unrestricted");
	fixture::room(state, "!restricted:test", "@kermit:test", "restricted");

	GIVEN("an unreachable identity server")
	{
		auto config(fixture::config());
		config.id_server = "http://127.0.0.1:1";
		const m::access_rules::engine engine
		{
			state, std::move(config)
		};

		const auto decision
		{
			engine.on_threepid_invite("!unrestricted:test", "email", "test@example.com")
		};

		REQUIRE(!decision);
		REQUIRE(decision.code == http::FORBIDDEN);
	}

	GIVEN("an identity server binding the address to a denied server")
	{
		server server
		{
			R"({"hs": "forbidden_domain"})"
		};

		auto config(fixture::config());
		config.id_server = server.url();
		const m::access_rules::engine engine
		{
			state, std::move(config)
		};

		REQUIRE(!engine.on_threepid_invite("!restricted:test", "email", "test@forbidden_domain"));
		server.wait();
		REQUIRE(server.request.find("GET /_matrix/identity/api/v1/info?medium=email&address=test%40forbidden_domain HTTP/1.0") == 0);
	}
}
