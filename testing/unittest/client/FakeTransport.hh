/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/12/21.
//

#pragma once

#include "client/Transport.hh"
#include "client/MessageEncoder.hh"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace volley {

/// \brief  Transport answering from a script instead of the network.
///
/// Requests are encoded like the real transport does, and completed by an
/// asio timer after a short latency. Thread-safe, so one instance may serve
/// executors running on different threads.
class FakeTransport : public Transport
{
public:
	struct Script
	{
		// status code of each attempt, the last one repeats
		std::vector<int>            codes{200};
		bool                        network_error{false};
		std::chrono::milliseconds   latency{5};
	};

	void script(const std::string& url, Script script);

	void async_send(
		boost::asio::io_context& ioc,
		const RequestDescriptor& req,
		const ExecutorConfig& cfg,
		Completion&& comp
	) override;

	std::size_t hits(const std::string& url) const;
	std::size_t total_hits() const;
	std::size_t peak() const;
	std::size_t in_flight() const;

	// The last message sent for a request ID
	std::optional<OutgoingRequest> sent(const std::string& id) const;

private:
	mutable std::mutex m_mutex;

	std::map<std::string, Script>           m_scripts;
	std::map<std::string, std::size_t>      m_hits;
	std::map<std::string, OutgoingRequest>  m_sent;
	std::size_t m_in_flight{0};
	std::size_t m_peak{0};
};

} // end of namespace volley
