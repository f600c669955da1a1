/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/8/21.
//

#pragma once

#include "ExecutionResult.hh"

#include <string>
#include <vector>

namespace volley {

/// \brief  Collects the terminal result of every request of one execution.
class ResultAggregator
{
public:
	ResultAggregator() = default;

	// A second result for the same ID replaces the first one.
	const ExecutionResult& record(const std::string& id, ExecutionResult&& result);

	// Make sure every ID has a result. Requests that never finished get a
	// "not executed" failure.
	void complete(const std::vector<std::string>& ids);

	bool contains(const std::string& id) const {return m_results.find(id) != m_results.end();}
	std::size_t size() const {return m_results.size();}

	ResultMap take() {return std::move(m_results);}

private:
	ResultMap m_results;
};

} // end of namespace volley
