/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/4/21.
//

#include "RetryPolicy.hh"
#include "ExecutionResult.hh"

#include <algorithm>

namespace volley {

RetryPolicy::RetryPolicy(int max_retries, int delay_ms, const std::vector<int>& http_codes)
{
	set(max_retries, delay_ms, http_codes);
}

const std::set<int>& RetryPolicy::default_http_codes()
{
	static const std::set<int> codes{429, 500, 502, 503, 504};
	return codes;
}

void RetryPolicy::set(int max_retries, int delay_ms, const std::vector<int>& http_codes)
{
	m_max_retries = static_cast<std::size_t>(std::max(0, max_retries));
	m_delay       = std::chrono::milliseconds{std::max(0, delay_ms)};
	if (!http_codes.empty())
		m_http_codes = std::set<int>{http_codes.begin(), http_codes.end()};
}

bool RetryPolicy::should_retry(std::size_t attempt, int http_code, bool network_error) const
{
	if (attempt >= m_max_retries)
		return false;

	if (network_error)
		return m_network_error;

	// a response in the success range is terminal even if the code is listed
	return !ExecutionResult::success_code(http_code) && m_http_codes.count(http_code) > 0;
}

} // end of namespace volley
