/**
 * SPDX-FileCopyrightText: 2024-2026 Sebastien Jodogne, EPL UCLouvain, Belgium
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

/**
 * Orthanc LTI Tool
 * Copyright (C) 2024-2026 Sebastien Jodogne, EPL UCLouvain, Belgium
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU Affero General Public License
 * as published by the Free Software Foundation, either version 3 of
 * the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 **/


#pragma once

#include "../LtiEnumerations.h"

#include <boost/noncopyable.hpp>


class INonceStore : public boost::noncopyable
{
public:
  virtual ~INonceStore()
  {
  }

  virtual void StoreNonce(const std::string& nonce,
                          const std::string& targetLinkUri) = 0;

  /**
   * Atomically reads and deletes the nonce. Whatever the outcome, a
   * nonce that existed can never be successfully tested again.
   **/
  virtual NonceStatus TestAndClearNonce(const std::string& nonce,
                                        const std::string& targetLinkUri) = 0;
};
