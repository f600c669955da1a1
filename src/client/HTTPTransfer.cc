/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/5/21.
//

#include "HTTPTransfer.hh"

namespace volley {

TransferOutcome failure(std::error_code ec, const char *what)
{
	TransferOutcome outcome;
	outcome.error   = ec;
	outcome.message = std::string{what} + ": " + ec.message();
	return outcome;
}

} // end of namespace volley
