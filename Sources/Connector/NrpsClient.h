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

#include "Connector.h"
#include "NrpsModels.h"


/**
 * Client of the Names and Role Provisioning Services (NRPS 2.0) of
 * the platform, for the context of the launch.
 **/
class NrpsClient : public boost::noncopyable
{
private:
  Connector&   connector_;
  std::string  membershipsUrl_;

public:
  // Throws "ErrorCode_NotImplemented" if NRPS is not enabled for the launch
  explicit NrpsClient(Connector& connector);

  const std::string& GetMembershipsUrl() const
  {
    return membershipsUrl_;
  }

  void GetMembership(Membership& target);

  // "limit" must be at least 1, see "Connector::ExecutePagedRequest()" for "cursor"
  bool GetPagedMembership(Membership& page,
                          std::string& cursor,
                          unsigned int limit);

  /**
   * Member describing the user who performed the launch, built from
   * the claims without contacting the platform. The status and the
   * roles are not available in the claims.
   **/
  void GetLaunchingMember(Member& target) const;
};
