/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/7/21.
//

#include "RequestScheduler.hh"
#include "Call.hh"

#include "util/Log.hh"

#include <algorithm>
#include <vector>

namespace volley {

void RequestScheduler::add(std::shared_ptr<Call>&& call)
{
	m_pending.push_back(std::move(call));
}

void RequestScheduler::try_start()
{
	// the current batch is still running
	if (!m_outstanding.empty() || m_pending.empty())
		return;

	auto count = m_limit == 0 ? m_pending.size() : std::min(m_limit, m_pending.size());

	std::vector<std::shared_ptr<Call>> batch;
	batch.reserve(count);
	while (batch.size() < count)
	{
		batch.push_back(std::move(m_pending.front()));
		m_pending.pop_front();
		m_outstanding.insert(batch.back());
	}

	++m_batches;
	Log(LOG_DEBUG, "starting batch %1% with %2% requests (%3% pending)", m_batches, count, m_pending.size());

	for (auto&& call : batch)
		call->run();
}

void RequestScheduler::finish(const std::shared_ptr<Call>& call)
{
	m_outstanding.erase(call);
	try_start();
}

void RequestScheduler::clear()
{
	m_outstanding.clear();
	m_pending.clear();
}

} // end of namespace volley
