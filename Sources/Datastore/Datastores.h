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

#include "IAccessTokenStore.h"
#include "ILaunchDataStore.h"
#include "INonceStore.h"
#include "IRegistrationStore.h"


// The storage roles, as wired by the composition root
class Datastores
{
private:
  IRegistrationStore&  registrations_;
  INonceStore&         nonces_;
  ILaunchDataStore&    launchData_;
  IAccessTokenStore&   accessTokens_;

public:
  Datastores(IRegistrationStore& registrations,
             INonceStore& nonces,
             ILaunchDataStore& launchData,
             IAccessTokenStore& accessTokens) :
    registrations_(registrations),
    nonces_(nonces),
    launchData_(launchData),
    accessTokens_(accessTokens)
  {
  }

  IRegistrationStore& GetRegistrations() const
  {
    return registrations_;
  }

  INonceStore& GetNonces() const
  {
    return nonces_;
  }

  ILaunchDataStore& GetLaunchData() const
  {
    return launchData_;
  }

  IAccessTokenStore& GetAccessTokens() const
  {
    return accessTokens_;
  }
};
