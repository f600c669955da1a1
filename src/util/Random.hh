/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/3/21.
//

#pragma once

#include <cstddef>
#include <string>

namespace volley {

void insecure_random(void* buf, std::size_t size);

// Lower-case hex string of "bytes" random bytes.
std::string random_hex(std::size_t bytes);

} // end of namespace volley
