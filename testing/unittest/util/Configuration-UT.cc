/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/11/21.
//

#include <catch2/catch.hpp>

#include "util/Configuration.hh"

#include <nlohmann/json.hpp>

#include <filesystem>

using namespace volley;

namespace {

// Put all test data (i.e. the configuration files in this test) in the same directory as
// the source code, and use __FILE__ macro to find the test data.
// Expect __FILE__ to give the absolute path so the unit test can be run in any directory.
const std::filesystem::path current_src = std::filesystem::path{__FILE__}.parent_path();
}

TEST_CASE( "--help command line parsing", "[normal]" )
{
	const char *argv[] = {"volley", "--help"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
	REQUIRE(cfg.help());
}

TEST_CASE( "missing default configuration file is not an error", "[normal]" )
{
	// assume the working directory does not contain volley.json
	const char *argv[] = {"volley", "--batch", "requests.json", "--concurrency", "3"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
	REQUIRE(!cfg.help());
	REQUIRE(cfg.batch() == std::filesystem::path{"requests.json"});
	REQUIRE(cfg.executor().max_concurrency() == 3);
	REQUIRE(cfg.executor().connect_timeout() == std::chrono::seconds{30});
	REQUIRE(!cfg.fire_and_forget());
}

TEST_CASE( "missing configuration file", "[error]" )
{
	auto missing = (current_src / "no_such_config.json").string();

	SECTION("from command line")
	{
		const char *argv[] = {"volley", "--cfg", missing.c_str()};
		REQUIRE_THROWS_AS(Configuration(sizeof(argv)/sizeof(argv[1]), argv, nullptr), Configuration::FileError);
	}
	SECTION("from environment")
	{
		REQUIRE_THROWS_AS(Configuration(0, nullptr, missing.c_str()), Configuration::FileError);
	}
}

TEST_CASE( "Load normal.json", "[normal]" )
{
	auto normal_json = (current_src / "normal.json").string();

	const char *argv[] = {"volley", "--cfg", normal_json.c_str(), "--fire-and-forget"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};

	auto& exec = cfg.executor();
	REQUIRE(cfg.fire_and_forget());
	REQUIRE(exec.connect_timeout() == std::chrono::seconds{5});
	REQUIRE(exec.total_timeout() == std::chrono::seconds{20});
	REQUIRE(exec.max_concurrency() == 4);
	REQUIRE(exec.user_agent() == "test-agent/1.0");
	REQUIRE(exec.default_headers().at("Accept") == "application/json");
	REQUIRE(exec.tls().cert == current_src / "cert.pem");
	REQUIRE(exec.tls().key  == current_src / "key.pem");
	REQUIRE(exec.tls().ca   == std::filesystem::path{"/etc/ssl/certs/ca.pem"});
	REQUIRE(!exec.tls().verify_peer);
	REQUIRE(exec.tls().verify_host == 0);
	REQUIRE(exec.retry().max_retries() == 2);
	REQUIRE(exec.retry().delay() == std::chrono::milliseconds{50});
	REQUIRE(exec.retry().http_codes() == std::set<int>{500, 503});
	REQUIRE(!exec.retry().retry_on_network_error());
	REQUIRE(exec.body_limit() == 1024 * 1024);
}

TEST_CASE( "command line concurrency overrides configuration file", "[normal]" )
{
	auto normal_json = (current_src / "normal.json").string();

	const char *argv[] = {"volley", "--cfg", normal_json.c_str(), "--concurrency", "0"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
	REQUIRE(cfg.executor().max_concurrency() == 0);
}

TEST_CASE( "Bad configuration files", "[error]" )
{
	for (auto file : {"bad_type.json", "not_json.json", "not_object.json"})
	{
		INFO(file);
		auto error_json = (current_src / file).string();

		const char *argv[] = {"volley", "--cfg", error_json.c_str()};
		REQUIRE_THROWS_AS(Configuration(sizeof(argv)/sizeof(argv[1]), argv, nullptr), Configuration::Error);
	}
}

TEST_CASE( "apply configuration JSON", "[normal]" )
{
	ExecutorConfig cfg;
	Configuration::apply(nlohmann::json::parse(R"({"timeout": 0, "max_concurrency": -2, "ssl": {"verify_host": 9}})"), cfg, "/tmp");

	// same clamping as the setters
	REQUIRE(cfg.total_timeout() == std::chrono::seconds{1});
	REQUIRE(cfg.connect_timeout() == std::chrono::seconds{30});
	REQUIRE(cfg.max_concurrency() == 1);
	REQUIRE(cfg.tls().verify_host == 2);
	REQUIRE(cfg.tls().verify_peer);
}
