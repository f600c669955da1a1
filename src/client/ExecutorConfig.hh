/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/4/21.
//

#pragma once

#include "RequestDescriptor.hh"
#include "RetryPolicy.hh"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace volley {

struct TLSOptions
{
	std::optional<fs::path> cert;
	std::optional<fs::path> key;
	std::optional<fs::path> ca;
	bool verify_peer{true};

	// 0 = no host name check, 1 or 2 = check host name
	int  verify_host{2};

	bool operator==(const TLSOptions&) const = default;
};

/// \brief  Settings shared by all requests of an executor.
///
/// Out-of-range values passed to the setters are clamped, never rejected.
class ExecutorConfig
{
public:
	ExecutorConfig();

	void set_timeouts(int connect_sec, int total_sec);

	// 0 means unbounded. Negative values are clamped to 1.
	void set_max_concurrency(int max);

	void set_tls(TLSOptions tls);
	void set_user_agent(std::string agent) {m_user_agent = std::move(agent);}
	void set_default_header(const std::string& field, std::string value);
	void set_body_limit(std::size_t bytes) {m_body_limit = bytes;}

	RetryPolicy& retry() {return m_retry;}
	const RetryPolicy& retry() const {return m_retry;}

	std::chrono::seconds connect_timeout() const {return m_connect_timeout;}
	std::chrono::seconds total_timeout() const {return m_total_timeout;}

	// Timeouts after applying the "connect_timeout" and "timeout" request options.
	std::chrono::seconds connect_timeout(const RequestDescriptor& req) const;
	std::chrono::seconds total_timeout(const RequestDescriptor& req) const;

	std::size_t max_concurrency() const {return m_max_concurrency;}
	const TLSOptions& tls() const {return m_tls;}
	const std::string& user_agent() const {return m_user_agent;}
	const Headers& default_headers() const {return m_default_headers;}
	std::size_t body_limit() const {return m_body_limit;}

private:
	std::chrono::seconds    m_connect_timeout{30};
	std::chrono::seconds    m_total_timeout{60};
	std::size_t             m_max_concurrency{10};
	TLSOptions              m_tls;
	RetryPolicy             m_retry;
	std::string             m_user_agent;
	Headers                 m_default_headers;
	std::size_t             m_body_limit{64 * 1024 * 1024};
};

} // end of namespace volley
