/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/9/21.
//

#include "BatchFile.hh"

#include "client/Volley.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>
#include <initializer_list>

namespace volley {
namespace {

template <typename Map>
Map string_map(const nlohmann::json& entry, const char *key)
{
	Map result;
	if (auto it = entry.find(key); it != entry.end())
	{
		for (auto&& [name, value] : it->items())
			result.emplace(name, value.template get<std::string>());
	}
	return result;
}

void require_object_of_strings(const nlohmann::json& entry, const char *key)
{
	auto it = entry.find(key);
	if (it == entry.end())
		return;

	if (!it->is_object())
		BOOST_THROW_EXCEPTION(BatchFile::Error() << BatchFile::Message{std::string{"\""} + key + "\" must be an object"});

	for (auto&& value : *it)
		if (!value.is_string())
			BOOST_THROW_EXCEPTION(BatchFile::Error() << BatchFile::Message{std::string{"values of \""} + key + "\" must be strings"});
}

} // end of local namespace

BatchFile::BatchFile(nlohmann::json entries, std::filesystem::path base) :
	m_entries(std::move(entries)),
	m_base{std::move(base)}
{
	if (!m_entries.is_array())
		BOOST_THROW_EXCEPTION(Error() << Message{"batch must be a JSON array"});

	for (std::size_t i = 0; i < m_entries.size(); ++i)
	{
		try
		{
			check(m_entries[i]);
		}
		catch (Error& e)
		{
			e << Index{i};
			throw;
		}
	}
}

BatchFile BatchFile::load(const std::filesystem::path& path)
{
	try
	{
		std::ifstream file{path};
		if (!file)
			BOOST_THROW_EXCEPTION(Error() << ErrorCode({errno, std::system_category()}));

		return BatchFile{nlohmann::json::parse(file), path.parent_path()};
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{path});
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
}

void BatchFile::check(const nlohmann::json& entry)
{
	if (!entry.is_object())
		BOOST_THROW_EXCEPTION(Error() << Message{"entry must be an object"});

	for (auto key : {"id", "url"})
		if (!entry.contains(key) || !entry[key].is_string())
			BOOST_THROW_EXCEPTION(Error() << Message{std::string{"missing string \""} + key + "\""});

	if (entry.contains("method") && !entry["method"].is_string())
		BOOST_THROW_EXCEPTION(Error() << Message{"\"method\" must be a string"});

	require_object_of_strings(entry, "headers");
	require_object_of_strings(entry, "options");
	require_object_of_strings(entry, "query");
	require_object_of_strings(entry, "form");

	// only add_request() takes a method and per-request options
	for (auto body : {"query", "form", "multipart", "raw"})
	{
		if (!entry.contains(body))
			continue;
		if (entry.contains("options"))
			BOOST_THROW_EXCEPTION(Error() << Message{std::string{"\"options\" cannot be used with \""} + body + "\""});
		if (entry.contains("method"))
			BOOST_THROW_EXCEPTION(Error() << Message{std::string{"\"method\" cannot be used with \""} + body + "\""});
	}

	if (entry.contains("multipart"))
	{
		auto& multipart = entry["multipart"];
		if (!multipart.is_object())
			BOOST_THROW_EXCEPTION(Error() << Message{"\"multipart\" must be an object"});
		require_object_of_strings(multipart, "fields");
		require_object_of_strings(multipart, "files");
	}

	if (entry.contains("raw"))
	{
		auto& raw = entry["raw"];
		if (!raw.is_object() || !raw.contains("body") || !raw["body"].is_string() ||
			!raw.value("content_type", nlohmann::json{}).is_string())
			BOOST_THROW_EXCEPTION(Error() << Message{"\"raw\" needs string \"body\" and \"content_type\""});
	}
}

void BatchFile::enqueue(Volley& volley) const
{
	for (auto&& entry : m_entries)
	{
		auto id      = entry["id"].get<std::string>();
		auto url     = entry["url"].get<std::string>();
		auto headers = string_map<Headers>(entry, "headers");

		if (entry.contains("query"))
			volley.add_get(std::move(id), std::move(url), string_map<Fields>(entry, "query"), std::move(headers));

		else if (entry.contains("form"))
			volley.add_post_form(std::move(id), std::move(url), string_map<Fields>(entry, "form"), std::move(headers));

		else if (entry.contains("multipart"))
		{
			auto& multipart = entry["multipart"];

			Files files;
			for (auto&& [field, path] : string_map<Fields>(multipart, "files"))
			{
				std::filesystem::path file{path};
				files.emplace(field, file.is_absolute() || m_base.empty() ? file : m_base / file);
			}

			volley.add_post_multipart(
				std::move(id), std::move(url),
				string_map<Fields>(multipart, "fields"), std::move(files), std::move(headers)
			);
		}

		else if (entry.contains("raw"))
			volley.add_post_raw(
				std::move(id), std::move(url),
				entry["raw"]["body"].get<std::string>(), entry["raw"]["content_type"].get<std::string>(),
				std::move(headers)
			);

		else
			volley.add_request(
				std::move(id), std::move(url),
				entry.value("method", std::string{"GET"}),
				entry.value("json", nlohmann::json{}),
				std::move(headers),
				string_map<Options>(entry, "options")
			);
	}
}

} // end of namespace
