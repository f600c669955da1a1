/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/4/21.
//

#include "ExecutorConfig.hh"

#include "config.hh"

#include <algorithm>
#include <charconv>

namespace volley {
namespace {

std::chrono::seconds option_seconds(const RequestDescriptor& req, const std::string& key, std::chrono::seconds fallback)
{
	auto opt = req.option(key);
	if (!opt)
		return fallback;

	int value{};
	auto [end, ec] = std::from_chars(opt->data(), opt->data() + opt->size(), value);
	if (ec != std::errc{} || end != opt->data() + opt->size())
		return fallback;

	return std::chrono::seconds{std::max(1, value)};
}

} // end of local namespace

ExecutorConfig::ExecutorConfig() :
	m_user_agent{constants::default_user_agent}
{
}

void ExecutorConfig::set_timeouts(int connect_sec, int total_sec)
{
	m_connect_timeout = std::chrono::seconds{std::max(1, connect_sec)};
	m_total_timeout   = std::chrono::seconds{std::max(1, total_sec)};
}

void ExecutorConfig::set_max_concurrency(int max)
{
	m_max_concurrency = max == 0 ? 0 : static_cast<std::size_t>(std::max(1, max));
}

void ExecutorConfig::set_tls(TLSOptions tls)
{
	tls.verify_host = std::clamp(tls.verify_host, 0, 2);
	m_tls = std::move(tls);
}

void ExecutorConfig::set_default_header(const std::string& field, std::string value)
{
	m_default_headers.insert_or_assign(field, std::move(value));
}

std::chrono::seconds ExecutorConfig::connect_timeout(const RequestDescriptor& req) const
{
	return option_seconds(req, "connect_timeout", m_connect_timeout);
}

std::chrono::seconds ExecutorConfig::total_timeout(const RequestDescriptor& req) const
{
	return option_seconds(req, "timeout", m_total_timeout);
}

} // end of namespace volley
