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

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace volley {

namespace fs = std::filesystem;

using Headers = std::map<std::string, std::string>;
using Fields  = std::map<std::string, std::string>;
using Options = std::map<std::string, std::string>;
using Files   = std::map<std::string, fs::path>;

struct NoBody {};

// application/x-www-form-urlencoded
struct FormBody
{
	Fields fields;
};

struct JsonBody
{
	nlohmann::json value;
};

struct MultipartBody
{
	Fields fields;
	Files  files;
};

struct RawBody
{
	std::string data;
	std::string content_type;
};

using RequestBody = std::variant<NoBody, FormBody, JsonBody, MultipartBody, RawBody>;

/// \brief  One queued HTTP request. Immutable after construction.
class RequestDescriptor
{
public:
	RequestDescriptor(
		std::string id,
		std::string url,
		std::string_view method,
		RequestBody body = NoBody{},
		Headers headers = {},
		Options options = {}
	);

	const std::string& id() const {return m_id;}
	const std::string& url() const {return m_url;}
	const std::string& method() const {return m_method;}
	const RequestBody& body() const {return m_body;}
	const Headers& headers() const {return m_headers;}
	const Options& options() const {return m_options;}

	std::optional<std::string> option(const std::string& key) const;

	// Upper-case the method. An empty method means GET.
	static std::string normalize_method(std::string_view method);

private:
	std::string m_id;
	std::string m_url;
	std::string m_method;
	RequestBody m_body;
	Headers     m_headers;
	Options     m_options;
};

} // end of namespace volley
