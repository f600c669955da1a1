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

#include "client/CallbackDispatcher.hh"

#include <stdexcept>

using namespace volley;

TEST_CASE( "callbacks are invoked once", "[normal]" )
{
	CallbackDispatcher subject;

	int count = 0;
	std::string seen;
	subject.set("a", [&count, &seen](auto& result, auto& id)
	{
		++count;
		seen = id;
		REQUIRE(result.http_code == 201);
	});
	REQUIRE(subject.contains("a"));

	ExecutionResult result;
	result.http_code = 201;
	REQUIRE(subject.dispatch("a", result));
	REQUIRE(count == 1);
	REQUIRE(seen == "a");

	// already consumed
	REQUIRE(!subject.dispatch("a", result));
	REQUIRE(count == 1);
	REQUIRE(subject.size() == 0);

	REQUIRE(!subject.dispatch("unknown", result));
}

TEST_CASE( "callback replaced", "[normal]" )
{
	CallbackDispatcher subject;
	int first = 0, second = 0;
	subject.set("a", [&first](auto&, auto&){++first;});
	subject.set("a", [&second](auto&, auto&){++second;});
	REQUIRE(subject.size() == 1);

	subject.dispatch("a", ExecutionResult{});
	REQUIRE(first == 0);
	REQUIRE(second == 1);
}

TEST_CASE( "throwing callback is isolated", "[error]" )
{
	CallbackDispatcher subject;
	int other = 0;
	subject.set("bad", [](auto&, auto&){throw std::runtime_error{"oops"};});
	subject.set("good", [&other](auto&, auto&){++other;});

	REQUIRE_NOTHROW(subject.dispatch("bad", ExecutionResult{}));
	REQUIRE(subject.dispatch("good", ExecutionResult{}));
	REQUIRE(other == 1);

	subject.set("unknown", [](auto&, auto&){throw 42;});
	REQUIRE_NOTHROW(subject.dispatch("unknown", ExecutionResult{}));
	REQUIRE_FALSE(subject.contains("unknown"));

	subject.set("empty", {});
	REQUIRE(subject.dispatch("empty", ExecutionResult{}));
}
