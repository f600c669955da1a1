/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/7/21.
//

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <unordered_set>

namespace volley {

class Call;

/// \brief  Runs pending calls in batches of at most "limit" calls.
///
/// A new batch is started only when every call of the previous batch has
/// finished, so no more than "limit" calls are outstanding at any time.
/// A limit of 0 puts all pending calls in one batch.
class RequestScheduler
{
public:
	explicit RequestScheduler(std::size_t limit = 10) : m_limit{limit} {}

	// Queue a call. It is started by try_start(), not here.
	void add(std::shared_ptr<Call>&& call);
	void finish(const std::shared_ptr<Call>& call);
	void try_start();

	// Drop all calls without running them.
	void clear();

	std::size_t outstanding() const {return m_outstanding.size();}
	std::size_t pending() const {return m_pending.size();}
	std::size_t batches() const {return m_batches;}

private:
	std::size_t m_limit;
	std::size_t m_batches{0};

	std::unordered_set<std::shared_ptr<Call>> m_outstanding;
	std::deque<std::shared_ptr<Call>> m_pending;
};

} // end of namespace volley
