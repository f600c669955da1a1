/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/7/21.
//

#include "Call.hh"
#include "ExecutorConfig.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>

namespace volley {

Call::Call(
	boost::asio::io_context& ioc,
	Transport& transport,
	const ExecutorConfig& cfg,
	RequestDescriptor&& desc,
	Terminal on_terminal
) :
	m_ioc{ioc},
	m_transport{transport},
	m_cfg{cfg},
	m_desc{std::move(desc)},
	m_on_terminal{std::move(on_terminal)},
	m_retry_timer{ioc}
{
}

void Call::run()
{
	m_first_attempt = std::chrono::steady_clock::now();
	attempt();
}

void Call::attempt()
{
	++m_attempts;
	try
	{
		m_transport.async_send(m_ioc, m_desc, m_cfg, [self=shared_from_this()](TransferOutcome&& outcome)
		{
			self->on_outcome(std::move(outcome));
		});
	}
	catch (std::exception& e)
	{
		// a transport is not supposed to throw, but one failed request must
		// never abort the others
		TransferOutcome outcome;
		outcome.error   = Error::transport_failure;
		outcome.message = std::string{"transport: "} + e.what();
		boost::asio::post(m_ioc, [self=shared_from_this(), outcome=std::move(outcome)]() mutable
		{
			self->on_outcome(std::move(outcome));
		});
	}
}

void Call::on_outcome(TransferOutcome&& outcome)
{
	// errors in our own category mean the request could not be sent at all,
	// and sending it again will not help
	if (outcome.error && outcome.error.category() == volley_error_category())
		return terminate(std::move(outcome));

	auto& retry = m_cfg.retry();
	if (!retry.should_retry(m_attempts - 1, outcome.http_code, static_cast<bool>(outcome.error)))
		return terminate(std::move(outcome));

	Log(
		LOG_NOTICE, "retrying request \"%1%\" (attempt %2% of %3%) in %4%ms: %5%",
		m_desc.id(), m_attempts + 1, retry.max_retries() + 1, retry.delay().count(),
		outcome.error ? outcome.message : "HTTP " + std::to_string(outcome.http_code)
	);

	m_retry_timer.expires_after(retry.delay());
	m_retry_timer.async_wait([self=shared_from_this(), outcome=std::move(outcome)](auto ec) mutable
	{
		if (ec)
			self->terminate(std::move(outcome));
		else
			self->attempt();
	});
}

void Call::terminate(TransferOutcome&& outcome)
{
	ExecutionResult result;
	result.http_code = outcome.http_code;
	result.body      = std::move(outcome.body);
	result.error     = outcome.error ? std::move(outcome.message) : std::string{};
	result.success   = !outcome.error && ExecutionResult::success_code(outcome.http_code);
	result.duration  = std::chrono::duration<double>{std::chrono::steady_clock::now() - m_first_attempt}.count();
	result.attempts  = m_attempts;

	m_on_terminal(shared_from_this(), std::move(result));
}

} // end of namespace volley
