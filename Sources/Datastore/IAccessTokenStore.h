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
#include "AccessToken.h"

#include <boost/noncopyable.hpp>


class IAccessTokenStore : public boost::noncopyable
{
public:
  virtual ~IAccessTokenStore()
  {
  }

  // Overwrites any token with the same endpoint, client ID and scopes
  virtual void StoreAccessToken(const AccessToken& token) = 0;

  virtual AccessTokenStatus LookupAccessToken(AccessToken& target,
                                              const std::string& tokenUri,
                                              const std::string& clientId,
                                              const std::set<std::string>& scopes,
                                              int64_t now) = 0;
};
