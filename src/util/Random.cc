/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/3/21.
//

#include "Random.hh"

#include <cerrno>
#include <system_error>
#include <vector>

// C++17 is doing cmake's job
#if __has_include(<sys/random.h>)
#include <sys/random.h>
#else
#include <unistd.h>
#include <sys/syscall.h>
#include <linux/random.h>
#endif

namespace {

#if ! __has_include(<sys/random.h>)
ssize_t getrandom(void *buf, size_t size, unsigned int flags)
{
	return syscall(SYS_getrandom, buf, size, flags);
}
#endif

}

namespace volley {

void insecure_random(void *buf, std::size_t size)
{
	// GRND_NONBLOCK: a multipart boundary does not need to wait for the entropy pool
	auto result = ::getrandom(buf, size, GRND_NONBLOCK);
	if (result < 0 || static_cast<std::size_t>(result) != size)
		throw std::system_error(errno, std::generic_category());
}

std::string random_hex(std::size_t bytes)
{
	static const char hex[] = "0123456789abcdef";

	std::vector<unsigned char> buf(bytes);
	insecure_random(buf.data(), buf.size());

	std::string result;
	result.reserve(bytes * 2);
	for (auto byte : buf)
	{
		result.push_back(hex[byte >> 4]);
		result.push_back(hex[byte & 0x0f]);
	}
	return result;
}

} // end of namespace volley
