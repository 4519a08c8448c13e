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

#include "../Datastore/Datastores.h"
#include "../Security/PlatformKeysRegistry.h"
#include "ILaunchHandler.h"
#include "LaunchException.h"
#include "LaunchRequest.h"


/**
 * Validation of a LTI 1.3 resource link launch. The checks are run
 * in a fixed order and the first failing check aborts the launch by
 * throwing a "LaunchException". Later checks rely on the earlier
 * ones: For instance, the claims are only decoded once the signature
 * of the identity token has been verified.
 *
 * The class holds no state specific to one launch, so a single
 * instance can be shared by the concurrent HTTP threads.
 **/
class LaunchValidator : public boost::noncopyable
{
private:
  Datastores             stores_;
  PlatformKeysRegistry&  platformKeys_;
  unsigned int           launchDataLifetime_;

public:
  LaunchValidator(const Datastores& stores,
                  PlatformKeysRegistry& platformKeys);

  // Duration in seconds after which a launch cannot be resumed anymore
  void SetLaunchDataLifetime(unsigned int seconds);

  unsigned int GetLaunchDataLifetime() const
  {
    return launchDataLifetime_;
  }

  // Runs all the checks, stores the launch data, and returns the new launch ID
  std::string Validate(LaunchClaims& claims,
                       const LaunchRequest& request);

  // Same as "Validate()", followed by the handoff to the next stage
  void Process(ILaunchHandler& handler,
               const LaunchRequest& request);
};
