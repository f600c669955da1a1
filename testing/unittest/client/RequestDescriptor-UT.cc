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

#include "client/RequestDescriptor.hh"

using namespace volley;

TEST_CASE( "method is normalized", "[normal]" )
{
	REQUIRE(RequestDescriptor::normalize_method("") == "GET");
	REQUIRE(RequestDescriptor::normalize_method("patch") == "PATCH");
	REQUIRE(RequestDescriptor::normalize_method("Delete") == "DELETE");

	RequestDescriptor subject{"id", "http://example.com", "options"};
	REQUIRE(subject.method() == "OPTIONS");
	REQUIRE(std::holds_alternative<NoBody>(subject.body()));
}

TEST_CASE( "request options", "[normal]" )
{
	RequestDescriptor subject{
		"upload", "http://example.com/up", "POST",
		RawBody{"abc", "text/plain"},
		{{"X-Trace", "1"}},
		{{"timeout", "5"}}
	};
	REQUIRE(subject.id() == "upload");
	REQUIRE(subject.url() == "http://example.com/up");
	REQUIRE(subject.headers().at("X-Trace") == "1");
	REQUIRE(subject.option("timeout") == "5");
	REQUIRE(!subject.option("connect_timeout").has_value());
	REQUIRE(std::get<RawBody>(subject.body()).data == "abc");
}
