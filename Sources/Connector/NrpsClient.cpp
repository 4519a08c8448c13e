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


#include "NrpsClient.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"

#include <Logging.h>
#include <OrthancException.h>

#include <boost/lexical_cast.hpp>


static void CheckLaunchClaim(const std::string& value,
                             const std::string& claim)
{
  if (value.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The launch has no \"" + claim + "\" claim");
  }
}


NrpsClient::NrpsClient(Connector& connector) :
  connector_(connector)
{
  const LaunchClaims& claims = connector.GetClaims();

  if (!claims.HasNrpsEndpoint() ||
      claims.GetNrpsMembershipsUrl().empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NotImplemented, "The platform has not enabled NRPS for this launch");
  }

  membershipsUrl_ = claims.GetNrpsMembershipsUrl();
}


void NrpsClient::GetMembership(Membership& target)
{
  ServiceRequest request(Orthanc::HttpMethod_Get, membershipsUrl_);
  request.AddScope(LTI_SCOPE_NRPS_MEMBERSHIP_READONLY);
  request.SetAccept(MIME_LTI_MEMBERSHIP_CONTAINER);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);

  Json::Value membership;
  response.ParseJsonObject(membership);
  Membership::Unserialize(target, membership);
}


bool NrpsClient::GetPagedMembership(Membership& page,
                                    std::string& cursor,
                                    unsigned int limit)
{
  if (limit < 1)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "The paging limit must be at least 1");
  }

  std::map<std::string, std::string> arguments;
  arguments["limit"] = boost::lexical_cast<std::string>(limit);

  std::string uri;
  HttpToolbox::FormatRedirectionUrl(uri, membershipsUrl_, arguments);

  ServiceRequest request(Orthanc::HttpMethod_Get, uri);
  request.AddScope(LTI_SCOPE_NRPS_MEMBERSHIP_READONLY);
  request.SetAccept(MIME_LTI_MEMBERSHIP_CONTAINER);

  ServiceResponse response;
  const bool hasMore = connector_.ExecutePagedRequest(response, request, cursor);

  Json::Value membership;
  response.ParseJsonObject(membership);
  Membership::Unserialize(page, membership);

  LOG(INFO) << "Received " << page.GetMembers().size() << " members from " << membershipsUrl_;
  return hasMore;
}


void NrpsClient::GetLaunchingMember(Member& target) const
{
  const LaunchClaims& claims = connector_.GetClaims();

  CheckLaunchClaim(claims.GetEmail(), "email");
  CheckLaunchClaim(claims.GetFamilyName(), "family_name");
  CheckLaunchClaim(claims.GetGivenName(), "given_name");
  CheckLaunchClaim(claims.GetName(), "name");

  target = Member();
  target.SetEmail(claims.GetEmail());
  target.SetFamilyName(claims.GetFamilyName());
  target.SetGivenName(claims.GetGivenName());
  target.SetName(claims.GetName());
  target.SetUserId(claims.GetSubject());
}
