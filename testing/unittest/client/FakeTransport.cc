/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/12/21.
//

#include "FakeTransport.hh"

#include "client/URL.hh"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <memory>

namespace volley {

void FakeTransport::script(const std::string& url, Script script)
{
	std::lock_guard lock{m_mutex};
	m_scripts.insert_or_assign(url, std::move(script));
}

void FakeTransport::async_send(
	boost::asio::io_context& ioc,
	const RequestDescriptor& req,
	const ExecutorConfig& cfg,
	Completion&& comp
)
{
	std::error_code ec;
	auto url = URL::parse(req.url(), ec);
	if (ec)
	{
		TransferOutcome outcome;
		outcome.error   = ec;
		outcome.message = "url: " + ec.message();
		boost::asio::post(ioc, [comp=std::move(comp), outcome=std::move(outcome)]() mutable
		{
			comp(std::move(outcome));
		});
		return;
	}

	auto msg = MessageEncoder{cfg}.encode(req, url);

	std::lock_guard lock{m_mutex};
	auto hit = ++m_hits[req.url()];
	m_sent.insert_or_assign(req.id(), std::move(msg));

	Script script;
	if (auto it = m_scripts.find(req.url()); it != m_scripts.end())
		script = it->second;

	TransferOutcome outcome;
	if (script.network_error)
	{
		outcome.error   = std::make_error_code(std::errc::connection_refused);
		outcome.message = "connect: " + outcome.error.message();
	}
	else
	{
		outcome.http_code = script.codes.empty() ? 200 : script.codes[std::min(hit, script.codes.size()) - 1];
		outcome.body      = req.method() + " " + req.url();
	}

	m_peak = std::max(m_peak, ++m_in_flight);

	auto timer = std::make_shared<boost::asio::steady_timer>(ioc, script.latency);
	timer->async_wait([this, timer, comp=std::move(comp), outcome=std::move(outcome)](auto) mutable
	{
		{
			std::lock_guard lock{m_mutex};
			--m_in_flight;
		}
		comp(std::move(outcome));
	});
}

std::size_t FakeTransport::hits(const std::string& url) const
{
	std::lock_guard lock{m_mutex};
	auto it = m_hits.find(url);
	return it != m_hits.end() ? it->second : 0;
}

std::size_t FakeTransport::total_hits() const
{
	std::lock_guard lock{m_mutex};
	std::size_t total = 0;
	for (auto&& [url, count] : m_hits)
		total += count;
	return total;
}

std::size_t FakeTransport::peak() const
{
	std::lock_guard lock{m_mutex};
	return m_peak;
}

std::size_t FakeTransport::in_flight() const
{
	std::lock_guard lock{m_mutex};
	return m_in_flight;
}

std::optional<OutgoingRequest> FakeTransport::sent(const std::string& id) const
{
	std::lock_guard lock{m_mutex};
	auto it = m_sent.find(id);
	return it != m_sent.end() ? std::optional<OutgoingRequest>{it->second} : std::nullopt;
}

} // end of namespace volley
