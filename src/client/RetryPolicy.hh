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

#include <chrono>
#include <cstddef>
#include <set>
#include <vector>

namespace volley {

/// \brief  Decides whether a finished attempt should be repeated.
///
/// The delay between attempts is flat. \a max_retries counts the repeated
/// attempts only, so a request is sent at most max_retries + 1 times.
class RetryPolicy
{
public:
	RetryPolicy() = default;
	RetryPolicy(int max_retries, int delay_ms, const std::vector<int>& http_codes = {});

	// "attempt" is the zero-based index of the attempt that just finished.
	bool should_retry(std::size_t attempt, int http_code, bool network_error) const;

	// Negative values are clamped to 0. An empty list keeps the current codes.
	void set(int max_retries, int delay_ms, const std::vector<int>& http_codes = {});
	void retry_on_network_error(bool retry) {m_network_error = retry;}

	std::size_t max_retries() const {return m_max_retries;}
	std::chrono::milliseconds delay() const {return m_delay;}
	const std::set<int>& http_codes() const {return m_http_codes;}
	bool retry_on_network_error() const {return m_network_error;}

	static const std::set<int>& default_http_codes();

private:
	std::size_t                 m_max_retries{0};
	std::chrono::milliseconds   m_delay{200};
	std::set<int>               m_http_codes{default_http_codes()};
	bool                        m_network_error{true};
};

} // end of namespace volley
