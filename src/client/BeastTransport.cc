/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/6/21.
//

#include "BeastTransport.hh"
#include "HTTPTransfer.hh"
#include "MessageEncoder.hh"
#include "URL.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>

namespace volley {
namespace {

// Report a failure that happened before any I/O is started. The completion
// still runs inside io_context::run() like every other outcome.
void post_failure(boost::asio::io_context& ioc, Transport::Completion&& comp, TransferOutcome&& outcome)
{
	boost::asio::post(ioc, [comp=std::move(comp), outcome=std::move(outcome)]() mutable
	{
		comp(std::move(outcome));
	});
}

} // end of local namespace

boost::asio::ssl::context* BeastTransport::tls_context(const TLSOptions& opts, std::error_code& ec)
{
	std::lock_guard lock{m_tls_mutex};
	for (auto&& [cached_opts, ctx] : m_tls)
	{
		if (cached_opts == opts)
			return ctx.get();
	}

	auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
	ctx->set_options(
		ssl::context::default_workarounds |
		ssl::context::no_sslv2 |
		ssl::context::no_sslv3
	);

	boost::system::error_code err;
	ctx->set_verify_mode(opts.verify_peer ? ssl::verify_peer : ssl::verify_none, err);
	if (!err && opts.cert)
		ctx->use_certificate_chain_file(opts.cert->string(), err);
	if (!err && opts.key)
		ctx->use_private_key_file(opts.key->string(), ssl::context::pem, err);
	if (!err)
	{
		if (opts.ca)
			ctx->load_verify_file(opts.ca->string(), err);
		else
			ctx->set_default_verify_paths(err);
	}

	if (err)
	{
		Log(LOG_WARNING, "cannot set up TLS context: %1%", err.message());
		ec = err;
		return nullptr;
	}

	return m_tls.emplace_back(opts, std::move(ctx)).second.get();
}

void BeastTransport::async_send(
	boost::asio::io_context& ioc,
	const RequestDescriptor& req,
	const ExecutorConfig& cfg,
	Completion&& comp
)
{
	std::error_code ec;
	auto url = URL::parse(req.url(), ec);
	if (ec)
		return post_failure(ioc, std::move(comp), failure(ec, "url"));

	OutgoingRequest msg;
	try
	{
		msg = MessageEncoder{cfg}.encode(req, url);
	}
	catch (std::exception& e)
	{
		Log(LOG_WARNING, "cannot encode request \"%1%\": %2%", req.id(), e.what());
		auto outcome = failure(Error::encoding_failed, "encode");
		outcome.message += std::string{" ("} + e.what() + ")";
		return post_failure(ioc, std::move(comp), std::move(outcome));
	}

	TransferLimits limits{
		cfg.connect_timeout(req),
		cfg.total_timeout(req),
		cfg.body_limit(),
		cfg.tls().verify_peer ? cfg.tls().verify_host : 0
	};

	if (url.secure())
	{
		auto tls = tls_context(cfg.tls(), ec);
		if (!tls)
		{
			auto outcome = failure(Error::tls_setup_failed, "tls");
			if (ec)
				outcome.message += " (" + ec.message() + ")";
			return post_failure(ioc, std::move(comp), std::move(outcome));
		}

		std::make_shared<HTTPTransfer<TLSStream>>(ioc, std::move(comp), *tls)->run(url, std::move(msg), limits);
	}
	else
	{
		std::make_shared<HTTPTransfer<PlainStream>>(ioc, std::move(comp))->run(url, std::move(msg), limits);
	}
}

} // end of namespace volley
