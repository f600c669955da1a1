/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/2/21.
//

#include "Log.hh"

#ifdef SYSTEMD_FOUND
#include <systemd/sd-journal.h>
#endif

#include <iostream>

namespace volley {
namespace {

bool mirror_to_stderr = false;

}

void open_log(const char *ident, bool to_stderr)
{
	mirror_to_stderr = to_stderr;
	::openlog(ident, LOG_PID | (to_stderr ? LOG_PERROR : 0), LOG_USER);
}

namespace detail {

void DetailLog(int priority, std::string &&line)
{
	// the journal does not honour LOG_PERROR
#ifdef SYSTEMD_FOUND
	::sd_journal_print(priority, "%s", line.c_str());
	if (mirror_to_stderr)
		std::clog << line << std::endl;
#else
	::syslog(priority, "%s", line.c_str());
#endif
}

}} // end of namespace
