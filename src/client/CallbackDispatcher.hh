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

#include <functional>
#include <string>
#include <unordered_map>

namespace volley {

/// \brief  Per-request response callbacks, each invoked at most once.
///
/// An exception thrown by a callback is logged and does not affect other
/// requests or other callbacks.
class CallbackDispatcher
{
public:
	using Callback = std::function<void(const ExecutionResult& result, const std::string& id)>;

	// Replaces the callback previously set for the same ID.
	void set(const std::string& id, Callback&& callback);

	// Returns true if a callback was registered for the ID.
	bool dispatch(const std::string& id, const ExecutionResult& result);

	void clear() {m_callbacks.clear();}
	std::size_t size() const {return m_callbacks.size();}
	bool contains(const std::string& id) const {return m_callbacks.find(id) != m_callbacks.end();}

private:
	std::unordered_map<std::string, Callback> m_callbacks;
};

} // end of namespace volley
