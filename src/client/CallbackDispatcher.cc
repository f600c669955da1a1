/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/8/21.
//

#include "CallbackDispatcher.hh"

#include "util/Log.hh"

namespace volley {

void CallbackDispatcher::set(const std::string& id, Callback&& callback)
{
	m_callbacks.insert_or_assign(id, std::move(callback));
}

bool CallbackDispatcher::dispatch(const std::string& id, const ExecutionResult& result)
{
	auto it = m_callbacks.find(id);
	if (it == m_callbacks.end())
		return false;

	auto callback = std::move(it->second);
	m_callbacks.erase(it);

	if (callback)
	{
		try
		{
			callback(result, id);
		}
		catch (std::exception& e)
		{
			Log(LOG_WARNING, "response callback of request \"%1%\" threw: %2%", id, e.what());
		}
		catch (...)
		{
			Log(LOG_WARNING, "response callback of request \"%1%\" threw an unknown exception", id);
		}
	}
	return true;
}

} // end of namespace volley
