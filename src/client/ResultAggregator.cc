/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/8/21.
//

#include "ResultAggregator.hh"

#include "util/Error.hh"
#include "util/Log.hh"

namespace volley {

const ExecutionResult& ResultAggregator::record(const std::string& id, ExecutionResult&& result)
{
	auto [it, inserted] = m_results.insert_or_assign(id, std::move(result));
	if (!inserted)
		Log(LOG_DEBUG, "result of request \"%1%\" recorded twice", id);
	return it->second;
}

void ResultAggregator::complete(const std::vector<std::string>& ids)
{
	for (auto&& id : ids)
	{
		if (contains(id))
			continue;

		ExecutionResult result;
		result.error = "execute: " + make_error_code(Error::not_executed).message();
		m_results.emplace(id, std::move(result));
		Log(LOG_WARNING, "request \"%1%\" was not executed", id);
	}
}

} // end of namespace volley
