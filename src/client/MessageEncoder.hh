/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/5/21.
//

#pragma once

#include "RequestDescriptor.hh"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <string>
#include <string_view>

namespace volley {

class ExecutorConfig;
class URL;

using OutgoingRequest = boost::beast::http::request<boost::beast::http::string_body>;

/// \brief  Serializes a RequestDescriptor into an HTTP/1.1 request message.
///
/// Header precedence, from lowest to highest: the content type implied by the
/// body, the configured user agent, the default headers, the request headers,
/// and finally the content type forced by form, multipart and raw bodies.
class MessageEncoder
{
public:
	explicit MessageEncoder(const ExecutorConfig& cfg) : m_cfg{cfg} {}

	// Throws on failure, e.g. std::system_error if no random boundary can be made.
	OutgoingRequest encode(const RequestDescriptor& req, const URL& url) const;

	struct EncodedBody
	{
		std::string data;
		std::string content_type;

		// content type overrides the caller's Content-Type header
		bool        forced{false};
	};
	static EncodedBody encode_body(const RequestBody& body);
	static std::string encode_multipart(const MultipartBody& body, std::string_view boundary);

private:
	const ExecutorConfig& m_cfg;
};

} // end of namespace volley
