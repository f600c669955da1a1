/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/10/21.
//

#include <catch2/catch.hpp>

#include "client/URL.hh"
#include "util/Error.hh"

using namespace volley;

TEST_CASE( "parse valid URLs", "[normal]" )
{
	std::error_code ec;

	SECTION("http with path and query")
	{
		auto url = URL::parse("http://example.com/api/v1?x=1&y=2", ec);
		REQUIRE(!ec);
		REQUIRE(url.scheme() == "http");
		REQUIRE(url.host() == "example.com");
		REQUIRE(url.port() == "80");
		REQUIRE(url.target() == "/api/v1?x=1&y=2");
		REQUIRE(!url.secure());
		REQUIRE(url.host_field() == "example.com");
	}
	SECTION("https with port")
	{
		auto url = URL::parse("HTTPS://api.example.com:8443", ec);
		REQUIRE(!ec);
		REQUIRE(url.secure());
		REQUIRE(url.port() == "8443");
		REQUIRE(url.target() == "/");
		REQUIRE(url.host_field() == "api.example.com:8443");
	}
	SECTION("explicit default port")
	{
		auto url = URL::parse("https://example.com:443/", ec);
		REQUIRE(!ec);
		REQUIRE(url.default_port());
		REQUIRE(url.host_field() == "example.com");
	}
	SECTION("query without path")
	{
		auto url = URL::parse("http://example.com?q=1", ec);
		REQUIRE(!ec);
		REQUIRE(url.target() == "/?q=1");
	}
	SECTION("fragment is dropped")
	{
		auto url = URL::parse("http://example.com/page#section", ec);
		REQUIRE(!ec);
		REQUIRE(url.target() == "/page");
	}
	SECTION("IPv6 literal")
	{
		auto url = URL::parse("http://[::1]:8080/x", ec);
		REQUIRE(!ec);
		REQUIRE(url.host() == "::1");
		REQUIRE(url.port() == "8080");
		REQUIRE(url.host_field() == "[::1]:8080");
	}
}

TEST_CASE( "reject bad URLs", "[error]" )
{
	std::error_code ec;

	URL::parse("ftp://example.com/file", ec);
	REQUIRE(ec == Error::unsupported_scheme);

	for (auto bad : {
		"", "not a url", "://example.com", "http://", "http:///path",
		"http://exa mple.com/", "http://user@example.com/", "http://example.com:0/",
		"http://example.com:65536/", "http://example.com:port/", "http://[::1/",
		"http://example.com/a b"
	})
	{
		INFO(bad);
		URL::parse(bad, ec);
		REQUIRE(ec == Error::invalid_url);
	}
}
