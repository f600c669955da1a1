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

#include <boost/asio/io_context.hpp>

#include <functional>
#include <string>
#include <system_error>

namespace volley {

class ExecutorConfig;
class RequestDescriptor;

// Raw result of a single attempt, before any retry decision.
struct TransferOutcome
{
	int             http_code{0};
	std::string     body;

	// transport failure, e.g. resolve, connect or timeout. Empty if a complete
	// response was received.
	std::error_code error;

	// "<stage>: <message>" when error is set
	std::string     message;
};

/// \brief  The HTTP primitive the executor is built on.
///
/// async_send() starts one transfer on the given io_context and must call
/// the completion exactly once, from inside io_context::run(), even if the
/// request cannot be started at all. It must not throw for per-request errors.
class Transport
{
public:
	using Completion = std::function<void(TransferOutcome&&)>;

	virtual ~Transport() = default;

	virtual void async_send(
		boost::asio::io_context& ioc,
		const RequestDescriptor& req,
		const ExecutorConfig& cfg,
		Completion&& comp
	) = 0;
};

} // end of namespace volley
