/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/2/21.
//

#pragma once

#include <boost/format.hpp>

#include <syslog.h>

#include <string>

namespace volley {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

// Set the identity of the log lines and optionally mirror them to stderr.
// Calling it is optional: syslog() opens the log lazily.
void open_log(const char *ident, bool to_stderr);

template <typename... Args>
void Log(int priority, const std::string& fmt, Args&&... args)
{
	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
