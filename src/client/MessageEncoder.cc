/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/5/21.
//

#include "MessageEncoder.hh"

#include "ExecutorConfig.hh"
#include "URL.hh"

#include "util/Escape.hh"
#include "util/Log.hh"
#include "util/Random.hh"

#include <boost/beast/core/file.hpp>
#include <boost/beast/http/verb.hpp>

#include <optional>

namespace volley {
namespace http = boost::beast::http;

namespace {

// visitor built from lambdas, one for each body type
template <typename... Visitors> struct BodyVisitor : Visitors...
{
	using Visitors::operator()...;
};
template <typename... Visitors> BodyVisitor(Visitors...) -> BodyVisitor<Visitors...>;

std::optional<std::string> read_file(const fs::path& path)
{
	std::error_code fs_err;
	if (!fs::is_regular_file(path, fs_err))
		return std::nullopt;

	boost::beast::error_code ec;
	boost::beast::file file;
	file.open(path.string().c_str(), boost::beast::file_mode::read, ec);
	if (ec)
		return std::nullopt;

	auto size = file.size(ec);
	if (ec)
		return std::nullopt;

	std::string content(static_cast<std::size_t>(size), '\0');
	std::size_t offset = 0;
	while (offset < content.size())
	{
		auto count = file.read(content.data() + offset, content.size() - offset, ec);
		if (ec || count == 0)
			return std::nullopt;
		offset += count;
	}
	return content;
}

// Quotes are not allowed inside the quoted-string of Content-Disposition.
std::string disposition_quote(std::string_view in)
{
	std::string result;
	for (char c : in)
	{
		if (c == '"')
			result += "%22";
		else if (c == '\r' || c == '\n')
			result += ' ';
		else
			result.push_back(c);
	}
	return result;
}

} // end of local namespace

std::string MessageEncoder::encode_multipart(const MultipartBody& body, std::string_view boundary)
{
	std::string result;
	auto open_part = [&result, boundary](std::string_view name)
	{
		result += "--";
		result += boundary;
		result += "\r\nContent-Disposition: form-data; name=\"";
		result += disposition_quote(name);
		result += '"';
	};

	for (auto&& [name, value] : body.fields)
	{
		open_part(name);
		result += "\r\n\r\n";
		result += value;
		result += "\r\n";
	}

	for (auto&& [name, path] : body.files)
	{
		auto content = read_file(path);
		if (!content)
		{
			Log(LOG_WARNING, "skipping multipart file \"%1%\" for field \"%2%\": not a readable file", path.string(), name);
			continue;
		}

		open_part(name);
		result += "; filename=\"";
		result += disposition_quote(path.filename().string());
		result += "\"\r\nContent-Type: application/octet-stream\r\n\r\n";
		result += *content;
		result += "\r\n";
	}

	result += "--";
	result += boundary;
	result += "--\r\n";
	return result;
}

MessageEncoder::EncodedBody MessageEncoder::encode_body(const RequestBody& body)
{
	return std::visit(BodyVisitor{
		[](const NoBody&)
		{
			return EncodedBody{};
		},
		[](const FormBody& form)
		{
			return EncodedBody{build_query(form.fields), "application/x-www-form-urlencoded", true};
		},
		[](const JsonBody& json)
		{
			return EncodedBody{
				json.value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
				"application/json",
				false
			};
		},
		[](const MultipartBody& multipart)
		{
			auto boundary = "----volley" + random_hex(16);
			return EncodedBody{encode_multipart(multipart, boundary), "multipart/form-data; boundary=" + boundary, true};
		},
		[](const RawBody& raw)
		{
			return EncodedBody{raw.data, raw.content_type, true};
		}
	}, body);
}

OutgoingRequest MessageEncoder::encode(const RequestDescriptor& req, const URL& url) const
{
	OutgoingRequest msg;
	msg.version(11);

	if (auto verb = http::string_to_verb(req.method()); verb != http::verb::unknown)
		msg.method(verb);
	else
		msg.method_string(req.method());

	msg.target(url.target());
	msg.set(http::field::host, url.host_field());

	auto body = encode_body(req.body());
	if (!body.content_type.empty())
		msg.set(http::field::content_type, body.content_type);

	if (!m_cfg.user_agent().empty())
		msg.set(http::field::user_agent, m_cfg.user_agent());

	// beast compares field names case-insensitively, so later values replace earlier ones
	for (auto&& [field, value] : m_cfg.default_headers())
		msg.set(field, value);
	for (auto&& [field, value] : req.headers())
		msg.set(field, value);

	if (body.forced && !body.content_type.empty())
		msg.set(http::field::content_type, body.content_type);

	msg.body() = std::move(body.data);
	msg.prepare_payload();
	return msg;
}

} // end of namespace volley
