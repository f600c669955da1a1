/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/3/21.
//

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <tuple>

namespace volley {

// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view in);

// "name1=value1&name2=value2", both sides URL-encoded.
std::string build_query(const std::map<std::string, std::string>& fields);

// Append a query string to a URL, using '&' if the URL already has one.
std::string append_query(std::string url, const std::map<std::string, std::string>& fields);

// Split "in" at the first character found in "value". The prefix is returned
// with the matching character ('\0' if none), and removed from "in".
std::tuple<std::string_view, char> split_front(std::string_view& in, std::string_view value);

} // end of namespace
