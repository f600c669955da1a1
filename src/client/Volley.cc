/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/8/21.
//

#include "Volley.hh"

#include "BeastTransport.hh"
#include "Call.hh"
#include "RequestScheduler.hh"
#include "ResultAggregator.hh"

#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>
#include <boost/throw_exception.hpp>

#include <utility>

namespace volley {
namespace {

class DrainingGuard
{
public:
	explicit DrainingGuard(Volley::State& state) : m_state{state}
	{
		m_state = Volley::State::draining;
	}
	~DrainingGuard()
	{
		m_state = Volley::State::idle;
	}

	DrainingGuard(const DrainingGuard&) = delete;
	DrainingGuard& operator=(const DrainingGuard&) = delete;

private:
	Volley::State& m_state;
};

} // end of local namespace

Volley::Volley() : Volley{ExecutorConfig{}, std::make_shared<BeastTransport>()}
{
}

Volley::Volley(ExecutorConfig cfg, std::shared_ptr<Transport> transport) :
	m_ioc{std::make_unique<boost::asio::io_context>()},
	m_cfg{std::move(cfg)},
	m_transport{std::move(transport)}
{
}

Volley::~Volley() = default;

ExecutorConfig& Volley::mutable_config()
{
	if (m_state == State::draining)
		BOOST_THROW_EXCEPTION(Busy());
	return m_cfg;
}

Volley& Volley::set_max_concurrency(int max)
{
	mutable_config().set_max_concurrency(max);
	return *this;
}

Volley& Volley::set_timeouts(int connect_sec, int total_sec)
{
	mutable_config().set_timeouts(connect_sec, total_sec);
	return *this;
}

Volley& Volley::set_ssl(
	std::optional<fs::path> cert,
	std::optional<fs::path> key,
	std::optional<fs::path> ca,
	bool verify_peer,
	int verify_host
)
{
	mutable_config().set_tls(TLSOptions{std::move(cert), std::move(key), std::move(ca), verify_peer, verify_host});
	return *this;
}

Volley& Volley::set_retries(int max_retries, int delay_ms, const std::vector<int>& http_codes)
{
	mutable_config().retry().set(max_retries, delay_ms, http_codes);
	return *this;
}

Volley& Volley::retry_on_network_error(bool retry)
{
	mutable_config().retry().retry_on_network_error(retry);
	return *this;
}

Volley& Volley::set_user_agent(std::string agent)
{
	mutable_config().set_user_agent(std::move(agent));
	return *this;
}

Volley& Volley::set_default_header(const std::string& field, std::string value)
{
	mutable_config().set_default_header(field, std::move(value));
	return *this;
}

Volley& Volley::set_background_executor(boost::asio::any_io_executor executor)
{
	if (m_state == State::draining)
		BOOST_THROW_EXCEPTION(Busy());
	m_background.emplace(std::move(executor));
	return *this;
}

Volley& Volley::add(RequestDescriptor&& req)
{
	auto [it, inserted] = m_queue_index.try_emplace(req.id(), m_queue.size());
	if (inserted)
		m_queue.push_back(std::move(req));
	else
		m_queue[it->second] = std::move(req);
	return *this;
}

std::vector<RequestDescriptor> Volley::take_queue()
{
	m_queue_index.clear();
	return std::exchange(m_queue, {});
}

Volley& Volley::add_get(std::string id, std::string url, const Fields& query, Headers headers)
{
	return add({std::move(id), append_query(std::move(url), query), "GET", NoBody{}, std::move(headers)});
}

Volley& Volley::add_post(std::string id, std::string url, nlohmann::json data, Headers headers)
{
	return add({std::move(id), std::move(url), "POST", JsonBody{std::move(data)}, std::move(headers)});
}

Volley& Volley::add_put(std::string id, std::string url, nlohmann::json data, Headers headers)
{
	return add({std::move(id), std::move(url), "PUT", JsonBody{std::move(data)}, std::move(headers)});
}

Volley& Volley::add_post_form(std::string id, std::string url, Fields fields, Headers headers)
{
	return add({std::move(id), std::move(url), "POST", FormBody{std::move(fields)}, std::move(headers)});
}

Volley& Volley::add_post_multipart(std::string id, std::string url, Fields fields, Files files, Headers headers)
{
	return add({
		std::move(id), std::move(url), "POST",
		MultipartBody{std::move(fields), std::move(files)},
		std::move(headers)
	});
}

Volley& Volley::add_post_raw(std::string id, std::string url, std::string raw, std::string content_type, Headers headers)
{
	return add({
		std::move(id), std::move(url), "POST",
		RawBody{std::move(raw), std::move(content_type)},
		std::move(headers)
	});
}

Volley& Volley::add_request(
	std::string id,
	std::string url,
	std::string_view method,
	nlohmann::json data,
	Headers headers,
	Options options
)
{
	RequestBody body{NoBody{}};
	if (!data.is_null() && !data.empty())
		body = JsonBody{std::move(data)};

	return add({std::move(id), std::move(url), method, std::move(body), std::move(headers), std::move(options)});
}

Volley& Volley::on_response(std::string id, Callback callback)
{
	m_callbacks.set(id, std::move(callback));
	return *this;
}

Volley& Volley::clear_queue()
{
	m_queue.clear();
	m_queue_index.clear();
	m_callbacks.clear();
	return *this;
}

ResultMap Volley::execute_all()
{
	if (m_state == State::draining)
		BOOST_THROW_EXCEPTION(Busy());

	// take a snapshot so that callbacks may queue requests for the next run
	auto queue     = take_queue();
	auto callbacks = std::exchange(m_callbacks, {});
	if (queue.empty())
		return {};

	return run(std::move(queue), std::move(callbacks));
}

ResultMap Volley::run(std::vector<RequestDescriptor>&& queue, CallbackDispatcher&& callbacks)
{
	DrainingGuard guard{m_state};

	ResultAggregator results;
	RequestScheduler scheduler{m_cfg.max_concurrency()};

	std::vector<std::string> ids;
	ids.reserve(queue.size());

	auto on_terminal = [&results, &callbacks, &scheduler](const std::shared_ptr<Call>& call, ExecutionResult&& result)
	{
		auto& id = call->descriptor().id();
		if (!result.success)
			Log(
				LOG_INFO, "request \"%1%\" failed after %2% attempt(s): HTTP %3% %4%",
				id, result.attempts, result.http_code, result.error
			);

		callbacks.dispatch(id, results.record(id, std::move(result)));
		scheduler.finish(call);
	};

	for (auto&& req : queue)
	{
		ids.push_back(req.id());
		scheduler.add(std::make_shared<Call>(*m_ioc, *m_transport, m_cfg, std::move(req), on_terminal));
	}

	Log(LOG_DEBUG, "executing %1% requests, max concurrency %2%", ids.size(), m_cfg.max_concurrency());

	try
	{
		scheduler.try_start();
		m_ioc->restart();
		m_ioc->run();
	}
	catch (...)
	{
		// Pending handlers refer to the locals of this function. Drop them
		// with the io_context before they go out of scope.
		scheduler.clear();
		m_ioc = std::make_unique<boost::asio::io_context>();
		throw;
	}

	Log(LOG_DEBUG, "%1% requests finished in %2% batch(es)", ids.size(), scheduler.batches());

	results.complete(ids);
	return results.take();
}

bool Volley::fire_and_forget()
{
	if (m_state == State::draining)
		BOOST_THROW_EXCEPTION(Busy());

	if (m_queue.empty())
		return false;

	if (m_background)
	{
		auto job = std::make_shared<Volley>(m_cfg, m_transport);
		job->m_queue     = take_queue();
		job->m_callbacks = std::exchange(m_callbacks, {});

		boost::asio::post(*m_background, [job]
		{
			try
			{
				job->execute_all();
			}
			catch (std::exception& e)
			{
				Log(LOG_WARNING, "background execution failed: %1%", e.what());
			}
		});
		return true;
	}

	// No one to hand the requests to. Run them here, but do not wait long.
	auto connect = m_cfg.connect_timeout();
	auto total   = m_cfg.total_timeout();
	m_cfg.set_timeouts(1, 1);
	try
	{
		execute_all();
	}
	catch (...)
	{
		m_cfg.set_timeouts(static_cast<int>(connect.count()), static_cast<int>(total.count()));
		throw;
	}
	m_cfg.set_timeouts(static_cast<int>(connect.count()), static_cast<int>(total.count()));
	return true;
}

} // end of namespace volley
