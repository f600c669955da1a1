/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/8/21.
//

#pragma once

#include "CallbackDispatcher.hh"
#include "ExecutionResult.hh"
#include "ExecutorConfig.hh"
#include "RequestDescriptor.hh"
#include "Transport.hh"

#include "util/Exception.hh"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace volley {

/// \brief  Queues HTTP requests and executes them concurrently.
///
/// Requests are added to a queue with the add_*() functions and executed by
/// execute_all(), which blocks until every request has reached a terminal
/// result. At most max_concurrency requests are in flight at any time: the
/// queue is run in batches and a batch starts only after the previous one has
/// finished, retries included.
///
/// All requests run on a single io_context owned by the executor, on the
/// thread calling execute_all(). Response callbacks are called on the same
/// thread. A Volley object must not be used by multiple threads at once.
class Volley
{
public:
	struct Error : virtual Exception {};

	// Thrown by configuration setters and execute functions while the
	// executor is draining its queue, e.g. from inside a response callback.
	struct Busy : virtual Error {};

	using Callback = CallbackDispatcher::Callback;

	enum class State {idle, draining};

public:
	Volley();
	Volley(ExecutorConfig cfg, std::shared_ptr<Transport> transport);
	~Volley();

	Volley(const Volley&) = delete;
	Volley& operator=(const Volley&) = delete;

	Volley& set_max_concurrency(int max);
	Volley& set_timeouts(int connect_sec, int total_sec);
	Volley& set_ssl(
		std::optional<fs::path> cert,
		std::optional<fs::path> key,
		std::optional<fs::path> ca = std::nullopt,
		bool verify_peer = true,
		int verify_host = 2
	);
	Volley& set_retries(int max_retries, int delay_ms = 200, const std::vector<int>& http_codes = {});
	Volley& retry_on_network_error(bool retry);
	Volley& set_user_agent(std::string agent);
	Volley& set_default_header(const std::string& field, std::string value);

	// fire_and_forget() posts its batch to this executor instead of running it.
	Volley& set_background_executor(boost::asio::any_io_executor executor);

	Volley& add_get(std::string id, std::string url, const Fields& query = {}, Headers headers = {});
	Volley& add_post(std::string id, std::string url, nlohmann::json data = nlohmann::json::object(), Headers headers = {});
	Volley& add_put(std::string id, std::string url, nlohmann::json data = nlohmann::json::object(), Headers headers = {});
	Volley& add_post_form(std::string id, std::string url, Fields fields, Headers headers = {});
	Volley& add_post_multipart(std::string id, std::string url, Fields fields, Files files, Headers headers = {});
	Volley& add_post_raw(std::string id, std::string url, std::string raw, std::string content_type, Headers headers = {});
	Volley& add_request(
		std::string id,
		std::string url,
		std::string_view method = "GET",
		nlohmann::json data = {},
		Headers headers = {},
		Options options = {}
	);

	// Replaces the request with the same ID, if any. The replacement keeps
	// the position of the request it replaces.
	Volley& add(RequestDescriptor&& req);

	Volley& on_response(std::string id, Callback callback);
	Volley& clear_queue();
	std::size_t queue_size() const {return m_queue.size();}

	ResultMap execute_all();
	ResultMap wait_for_all() {return execute_all();}
	bool fire_and_forget();

	const ExecutorConfig& config() const {return m_cfg;}
	State state() const {return m_state;}

private:
	ExecutorConfig& mutable_config();
	std::vector<RequestDescriptor> take_queue();
	ResultMap run(std::vector<RequestDescriptor>&& queue, CallbackDispatcher&& callbacks);

private:
	std::unique_ptr<boost::asio::io_context>    m_ioc;
	ExecutorConfig                              m_cfg;
	std::shared_ptr<Transport>                  m_transport;

	std::vector<RequestDescriptor>              m_queue;
	std::unordered_map<std::string, std::size_t> m_queue_index;
	CallbackDispatcher                          m_callbacks;

	std::optional<boost::asio::any_io_executor> m_background;
	State                                       m_state{State::idle};
};

} // end of namespace volley
