/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/5/21.
//

#pragma once

#include "MessageEncoder.hh"
#include "Transport.hh"
#include "URL.hh"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>

#include <openssl/err.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace volley {

using tcp = boost::asio::ip::tcp;       // from <boost/asio/ip/tcp.hpp>
namespace ssl = boost::asio::ssl;       // from <boost/asio/ssl.hpp>
namespace http = boost::beast::http;    // from <boost/beast/http.hpp>

using PlainStream = boost::beast::tcp_stream;
using TLSStream   = boost::beast::ssl_stream<boost::beast::tcp_stream>;

// Outcome of a transfer that failed at "what".
TransferOutcome failure(std::error_code ec, const char *what);

struct TransferLimits
{
	std::chrono::seconds connect_timeout{30};
	std::chrono::seconds total_timeout{60};
	std::size_t          body_limit{64 * 1024 * 1024};

	// host name verification for TLS streams. 0 = off.
	int                  verify_host{2};
};

/// \brief  One HTTP request/response exchange on a fresh connection.
///
/// Resolve, connect, TLS handshake (for TLSStream only), write and read.
/// The connect timeout bounds the TCP connect. The total timeout bounds the
/// whole exchange, name resolution included. The completion is called
/// exactly once.
template <typename Stream>
class HTTPTransfer : public std::enable_shared_from_this<HTTPTransfer<Stream>>
{
public:
	static constexpr bool is_tls = std::is_same_v<Stream, TLSStream>;

	template <typename... StreamArgs>
	HTTPTransfer(boost::asio::io_context& ioc, Transport::Completion&& comp, StreamArgs&&... args) :
		m_resolver{ioc},
		m_stream{ioc, std::forward<StreamArgs>(args)...},
		m_deadline{ioc},
		m_comp{std::move(comp)}
	{
	}

	// Start the asynchronous operation
	void run(const URL& url, OutgoingRequest&& req, const TransferLimits& limits)
	{
		m_req    = std::move(req);
		m_limits = limits;
		m_parser.emplace();
		m_parser->body_limit(limits.body_limit);

		// HEAD responses carry a Content-Length but no body
		if (m_req.method() == http::verb::head)
			m_parser->skip(true);

		if constexpr (is_tls)
		{
			// Set SNI Hostname (many hosts need this to handshake successfully)
			if (!SSL_set_tlsext_host_name(m_stream.native_handle(), url.host().c_str()))
			{
				boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
				return post_failure(ec, "SSL_set_tlsext_host_name");
			}
			if (limits.verify_host != 0)
				m_stream.set_verify_callback(ssl::host_name_verification{url.host()});
		}

		m_deadline.expires_after(limits.total_timeout);
		m_deadline.async_wait([self=this->shared_from_this()](auto ec){self->on_deadline(ec);});

		// Look up the domain name
		m_resolver.async_resolve(
			url.host(),
			url.port(),
			[self=this->shared_from_this()](auto ec, auto&& results){self->on_resolve(ec, std::move(results));}
		);
	}

private:
	void on_deadline(boost::system::error_code ec)
	{
		// cancelled because the transfer finished in time
		if (ec || m_done)
			return;

		m_timed_out = true;
		m_resolver.cancel();
		boost::beast::get_lowest_layer(m_stream).close();
	}

	void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results)
	{
		if (ec)
			return finish(ec, "resolve");

		// resolver::cancel() cannot stop a lookup that is already running
		if (m_timed_out || m_deadline.expiry() <= std::chrono::steady_clock::now())
		{
			m_timed_out = true;
			return finish({}, "resolve");
		}

		auto& layer = boost::beast::get_lowest_layer(m_stream);
		layer.expires_after(std::min(m_limits.connect_timeout, m_limits.total_timeout));

		// Make the connection on the IP address we get from a lookup
		layer.async_connect(
			results,
			[self=this->shared_from_this()](auto ec, auto&&){self->on_connect(ec);}
		);
	}

	void on_connect(boost::system::error_code ec)
	{
		if (ec)
			return finish(ec, "connect");

		// from now on only the total deadline applies
		boost::beast::get_lowest_layer(m_stream).expires_never();

		if constexpr (is_tls)
		{
			// Perform the SSL handshake
			m_stream.async_handshake(
				ssl::stream_base::client,
				[self=this->shared_from_this()](auto ec){self->on_handshake(ec);}
			);
		}
		else
			on_handshake({});
	}

	void on_handshake(boost::system::error_code ec)
	{
		if (ec)
			return finish(ec, "handshake");

		// Send the HTTP request to the remote host
		http::async_write(
			m_stream, m_req,
			[self=this->shared_from_this()](auto ec, auto bytes){self->on_write(ec, bytes);}
		);
	}

	void on_write(boost::system::error_code ec, std::size_t bytes_transferred)
	{
		boost::ignore_unused(bytes_transferred);

		if (ec)
			return finish(ec, "write");

		// Receive the HTTP response
		http::async_read(
			m_stream, m_buffer, *m_parser,
			[self=this->shared_from_this()](auto ec, auto bytes){self->on_read(ec, bytes);}
		);
	}

	void on_read(boost::system::error_code ec, std::size_t bytes_transferred)
	{
		boost::ignore_unused(bytes_transferred);

		if (ec)
			return finish(ec, "read");

		finish({}, "read");
	}

	void finish(boost::system::error_code ec, const char *what)
	{
		if (m_done)
			return;
		m_done = true;
		m_deadline.cancel();

		TransferOutcome outcome;
		if (m_timed_out)
			outcome = failure(make_error_code(boost::beast::error::timeout), "timeout");
		else if (ec)
			outcome = failure(ec, what);
		else
		{
			auto res = m_parser->release();
			outcome.http_code = static_cast<int>(res.result_int());
			outcome.body      = std::move(res.body());
		}

		m_comp(std::move(outcome));
		shutdown();
	}

	void post_failure(boost::system::error_code ec, const char *what)
	{
		boost::asio::post(
			m_resolver.get_executor(),
			[self=this->shared_from_this(), ec, what]{self->finish(ec, what);}
		);
	}

	void shutdown()
	{
		auto& layer = boost::beast::get_lowest_layer(m_stream);
		if (!layer.socket().is_open())
			return;

		if constexpr (is_tls)
		{
			// Gracefully close the stream, but do not let a silent peer keep
			// the io_context busy.
			layer.expires_after(std::chrono::seconds{1});
			m_stream.async_shutdown(
				[self=this->shared_from_this()](auto)
				{
					boost::beast::get_lowest_layer(self->m_stream).close();
				}
			);
		}
		else
		{
			boost::system::error_code ec;
			layer.socket().shutdown(tcp::socket::shutdown_both, ec);
			layer.close();
		}
	}

private:
	tcp::resolver                   m_resolver;
	Stream                          m_stream;
	boost::asio::steady_timer       m_deadline;
	boost::beast::flat_buffer       m_buffer; // (Must persist between reads)
	OutgoingRequest                 m_req;
	std::optional<http::response_parser<http::string_body>> m_parser;
	TransferLimits                  m_limits;

	Transport::Completion           m_comp;
	bool                            m_done{false};
	bool                            m_timed_out{false};
};

} // end of namespace volley
