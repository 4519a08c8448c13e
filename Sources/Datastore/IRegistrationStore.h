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

#include "Registration.h"

#include <boost/noncopyable.hpp>


class IRegistrationStore : public boost::noncopyable
{
public:
  virtual ~IRegistrationStore()
  {
  }

  // Replaces the registration with the same issuer and client ID, if any
  virtual void StoreRegistration(const Registration& registration) = 0;

  virtual bool LookupRegistration(Registration& target,
                                  const std::string& issuer,
                                  const std::string& clientId) = 0;

  // Succeeds only if the issuer has exactly one registration
  virtual bool LookupUniqueRegistration(Registration& target,
                                        const std::string& issuer) = 0;

  virtual void StoreDeployment(const std::string& issuer,
                               const std::string& deploymentId) = 0;

  virtual bool HasDeployment(const std::string& issuer,
                             const std::string& deploymentId) = 0;
};
