/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/7/21.
//

#pragma once

#include "ExecutionResult.hh"
#include "RequestDescriptor.hh"
#include "Transport.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace volley {

class ExecutorConfig;

/// \brief  A queued request while it is being executed, retries included.
class Call : public std::enable_shared_from_this<Call>
{
public:
	using Terminal = std::function<void(const std::shared_ptr<Call>&, ExecutionResult&&)>;

	Call(
		boost::asio::io_context& ioc,
		Transport& transport,
		const ExecutorConfig& cfg,
		RequestDescriptor&& desc,
		Terminal on_terminal
	);

	// Start the first attempt. on_terminal is called once all attempts are done.
	void run();

	const RequestDescriptor& descriptor() const {return m_desc;}
	std::size_t attempts() const {return m_attempts;}

private:
	void attempt();
	void on_outcome(TransferOutcome&& outcome);
	void terminate(TransferOutcome&& outcome);

private:
	boost::asio::io_context&    m_ioc;
	Transport&                  m_transport;
	const ExecutorConfig&       m_cfg;
	RequestDescriptor           m_desc;
	Terminal                    m_on_terminal;

	boost::asio::steady_timer   m_retry_timer;
	std::chrono::steady_clock::time_point m_first_attempt{};
	std::size_t                 m_attempts{0};
};

} // end of namespace volley
