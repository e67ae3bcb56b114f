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
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace roomgate::net
{
	namespace asio = boost::asio;
	namespace ssl = boost::asio::ssl;

	using tcp = asio::ip::tcp;
	using error_code = boost::system::error_code;
	using handshake_handler = std::function<void (const error_code &)>;

	static void handshake(tcp::socket &, const handshake_handler &);
	static void handshake(ssl::stream<tcp::socket> &, const handshake_handler &);
	static bool is_eof(const error_code &);
	static std::string compose(const rfc3986::uri &, const request::opts &);

	template<class stream>
	static void exchange(asio::io_context &, stream &, const rfc3986::uri &, const std::string &out, std::string &in, const request::opts &);
}

decltype(roomgate::net::log)
roomgate::net::log
{
	"net"
};

roomgate::net::request::request(const string_view &url,
                                const opts &opts)
{
	const rfc3986::uri uri
	{
		url
	};

	const bool tls
	{
		!uri.scheme || iequals(uri.scheme, "https")
	};

	if(!tls && !iequals(uri.scheme, "http"))
		throw error
		{
			"Unsupported scheme '%s' for request to %s", uri.scheme, uri.remote
		};

	if(!rfc3986::host(uri.remote))
		throw not_found
		{
			"No host given in '%s'", url
		};

	const std::string out
	{
		compose(uri, opts)
	};

	asio::io_context ios;
	if(tls)
	{
		ssl::context ctx
		{
			ssl::context::tls_client
		};

		ctx.set_default_verify_paths();
		ssl::stream<tcp::socket> stream
		{
			ios, ctx
		};

		const std::string host
		{
			rfc3986::host(uri.remote)
		};

		if(!::SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
			throw inauthentic
			{
				"Failed to set SNI hostname '%s'", host
			};

		if(opts.verify_peer)
		{
			stream.set_verify_mode(ssl::verify_peer);
			stream.set_verify_callback(ssl::host_name_verification(host));
		}
		else stream.set_verify_mode(ssl::verify_none);

		exchange(ios, stream, uri, out, received, opts);
	}
	else
	{
		tcp::socket stream
		{
			ios
		};

		exchange(ios, stream, uri, out, received, opts);
	}

	head = http::response
	{
		received
	};

	log::debug
	{
		log, "%s %s%s -> %u %s content:%u",
		uri.scheme? uri.scheme : string_view{"https"},
		uri.remote,
		uri.path,
		uint(head.code),
		head.reason,
		head.content.size(),
	};
}

template<class stream>
void
roomgate::net::exchange(asio::io_context &ios,
                        stream &s,
                        const rfc3986::uri &uri,
                        const std::string &out,
                        std::string &in,
                        const request::opts &opts)
{
	const std::string host
	{
		rfc3986::host(uri.remote)
	};

	const uint16_t port
	{
		rfc3986::port(uri.remote)
	};

	const std::string service
	{
		port? lex_cast(port) : std::string{uri.scheme && iequals(uri.scheme, "http")? "80" : "443"}
	};

	bool done {false};
	error_code ec;
	const auto finish{[&done, &ec](const error_code &e)
	{
		ec = e;
		done = true;
	}};

	tcp::resolver resolver
	{
		ios
	};

	resolver.async_resolve(host, service, [&]
	(const error_code &e, const tcp::resolver::results_type &results)
	{
		if(e)
			return finish(e);

		asio::async_connect(s.lowest_layer(), results, [&]
		(const error_code &e, const tcp::endpoint &)
		{
			if(e)
				return finish(e);

			handshake(s, [&](const error_code &e)
			{
				if(e)
					return finish(e);

				asio::async_write(s, asio::buffer(out), [&]
				(const error_code &e, size_t)
				{
					if(e)
						return finish(e);

					asio::async_read(s, asio::dynamic_buffer(in, opts.max_received), [&]
					(const error_code &e, size_t)
					{
						finish(e);
					});
				});
			});
		});
	});

	ios.run_for(opts.timeout);
	if(!done)
		throw timeout
		{
			"Request to %s timed out after %d ms", uri.remote, opts.timeout.count()
		};

	if(in.size() >= opts.max_received)
		throw overflow
		{
			"Response from %s exceeds %u bytes", uri.remote, opts.max_received
		};

	if(ec && !is_eof(ec))
		throw disconnected
		{
			"Request to %s failed :%s", uri.remote, ec.message()
		};
}

void
roomgate::net::handshake(tcp::socket &socket,
                         const handshake_handler &handler)
{
	asio::post(socket.get_executor(), [handler]
	{
		handler(error_code{});
	});
}

void
roomgate::net::handshake(ssl::stream<tcp::socket> &stream,
                         const handshake_handler &handler)
{
	stream.async_handshake(ssl::stream_base::client, handler);
}

bool
roomgate::net::is_eof(const error_code &ec)
{
	// Servers commonly close without the TLS close_notify.
	return ec == asio::error::eof
	|| ec == ssl::error::stream_truncated;
}

std::string
roomgate::net::compose(const rfc3986::uri &uri,
                       const request::opts &opts)
{
	std::string ret;
	ret += "GET ";
	ret += uri.path? std::string{uri.path} : std::string{"/"};
	if(uri.query)
	{
		ret += '?';
		ret += uri.query;
	}

	ret += " HTTP/1.0\r\n";
	ret += "Host: ";
	ret += uri.remote;
	ret += "\r\n";
	ret += "User-Agent: ";
	ret += opts.user_agent;
	ret += "\r\n";
	ret += "Accept: application/json\r\n";
	ret += "Connection: close\r\n";
	ret += "\r\n";
	return ret;
}
