/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/4/21.
//

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace volley {

struct ExecutionResult
{
	bool        success{false};

	// 0 if no response was ever received
	int         http_code{0};

	std::string body;
	std::string error;

	// wall clock in seconds, from the first attempt to the terminal one
	double      duration{0.0};

	std::size_t attempts{0};

	static bool success_code(int http_code) {return http_code >= 200 && http_code < 400;}
};

using ResultMap = std::unordered_map<std::string, ExecutionResult>;

} // end of namespace volley
