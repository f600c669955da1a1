/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/6/21.
//

#pragma once

#include "Transport.hh"
#include "ExecutorConfig.hh"

#include <boost/asio/ssl/context.hpp>

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace volley {

/// \brief  Transport on Boost.Beast: one connection per transfer, HTTP/1.1,
///         TLS by OpenSSL.
///
/// One TLS context is built for each distinct TLSOptions and kept for the
/// lifetime of the transport, so a transport may be shared by executors
/// running on different threads.
class BeastTransport : public Transport
{
public:
	BeastTransport() = default;

	void async_send(
		boost::asio::io_context& ioc,
		const RequestDescriptor& req,
		const ExecutorConfig& cfg,
		Completion&& comp
	) override;

private:
	boost::asio::ssl::context* tls_context(const TLSOptions& opts, std::error_code& ec);

private:
	std::mutex m_tls_mutex;
	std::vector<std::pair<TLSOptions, std::unique_ptr<boost::asio::ssl::context>>> m_tls;
};

} // end of namespace volley
