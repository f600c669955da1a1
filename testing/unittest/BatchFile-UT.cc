/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/14/21.
//

#include <catch2/catch.hpp>

#include "client/FakeTransport.hh"

#include "BatchFile.hh"
#include "client/Volley.hh"

#include <boost/exception/get_error_info.hpp>

#include <filesystem>
#include <limits>
#include <optional>

using namespace volley;

namespace {

const std::filesystem::path current_src = std::filesystem::path{__FILE__}.parent_path();

}

TEST_CASE( "load batch file", "[normal]" )
{
	auto batch = BatchFile::load(current_src / "batch.json");
	REQUIRE(batch.size() == 6);

	auto transport = std::make_shared<FakeTransport>();
	Volley volley{ExecutorConfig{}, transport};
	batch.enqueue(volley);
	REQUIRE(volley.queue_size() == 6);

	auto results = volley.execute_all();
	REQUIRE(results.size() == 6);
	for (auto&& [id, result] : results)
	{
		INFO(id);
		REQUIRE(result.success);
	}

	REQUIRE(transport->sent("search")->target() == "/search?q=volley");

	auto create = transport->sent("create");
	REQUIRE(create->method_string() == "POST");
	REQUIRE(create->body() == R"({"name":"x"})");
	REQUIRE((*create)["X-Trace"] == "1");

	REQUIRE(transport->sent("login")->body() == "password=b&user=a");

	// relative to the directory of batch.json
	REQUIRE(transport->sent("upload")->body().find("multipart content") != std::string::npos);

	REQUIRE((*transport->sent("raw"))["Content-Type"] == "application/xml");
	REQUIRE(transport->sent("remove")->method_string() == "DELETE");
}

TEST_CASE( "malformed batch entries", "[error]" )
{
	auto error_index = [](const nlohmann::json& json) -> std::optional<std::size_t>
	{
		try
		{
			BatchFile subject{json};
		}
		catch (BatchFile::Error& e)
		{
			auto index = boost::get_error_info<BatchFile::Index>(e);
			return index ? *index : std::numeric_limits<std::size_t>::max();
		}
		return std::nullopt;
	};

	using nlohmann::json;
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/"}])")) == std::nullopt);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/"}, {"url": "http://b/"}])")) == 1);
	REQUIRE(error_index(json::parse(R"([{"id": 1, "url": "http://a/"}])")) == 0);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/", "headers": {"X": 1}}])")) == 0);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/", "raw": {"body": "x"}}])")) == 0);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/", "multipart": []}])")) == 0);
	REQUIRE(error_index(json::parse(R"([0])")) == 0);

	// method and options only go with add_request()
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/", "method": "PUT", "options": {"timeout": "1"}}])")) == std::nullopt);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/"}, {"id": "b", "url": "http://b/", "query": {"q": "1"}, "options": {"timeout": "1"}}])")) == 1);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/", "query": {"q": "1"}, "method": "POST"}])")) == 0);
	REQUIRE(error_index(json::parse(R"([{"id": "a", "url": "http://a/", "form": {"x": "1"}, "options": {"timeout": "1"}}])")) == 0);

	// not an array: no index
	REQUIRE(error_index(json::parse(R"({"id": "a"})")) == std::numeric_limits<std::size_t>::max());
}

TEST_CASE( "missing batch file", "[error]" )
{
	REQUIRE_THROWS_AS(BatchFile::load(current_src / "no_such_batch.json"), BatchFile::Error);
}
