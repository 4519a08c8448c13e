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


#include "Connector.h"

#include "../HttpToolbox.h"

#include <Logging.h>
#include <OrthancException.h>

#include <boost/lexical_cast.hpp>
#include <time.h>


void Connector::ResolveRegistration()
{
  const std::set<std::string>& candidates = claims_.GetAudience();

  const std::string clientId = claims_.GetClientId();
  if (!clientId.empty() &&
      stores_.GetRegistrations().LookupRegistration(registration_, claims_.GetIssuer(), clientId))
  {
    return;
  }

  for (std::set<std::string>::const_iterator it = candidates.begin(); it != candidates.end(); ++it)
  {
    if (stores_.GetRegistrations().LookupRegistration(registration_, claims_.GetIssuer(), *it))
    {
      return;
    }
  }

  throw Orthanc::OrthancException(Orthanc::ErrorCode_UnknownResource,
                                  "No registration for the issuer of launch " + launchId_);
}


Connector::Connector(const Datastores& stores,
                     IHttpClient& client,
                     const std::string& launchId) :
  stores_(stores),
  client_(client),
  launchId_(launchId),
  accessTokens_(stores.GetAccessTokens(), client),
  timeout_(LTI_DEFAULT_HTTP_TIMEOUT)
{
  if (!stores_.GetLaunchData().LookupLaunchData(launchData_, launchId, time(NULL)))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_UnknownResource, "Unknown or expired launch: " + launchId);
  }

  LaunchClaims::Parse(claims_, launchData_);
  ResolveRegistration();
}


void Connector::SetSigningKey(const std::string& keyId,
                              const std::string& pem)
{
  std::unique_ptr<RSAPrivateKey> key(new RSAPrivateKey);
  key->Unserialize(pem);

  signingKey_.reset(key.release());
  keyId_ = keyId;
}


void Connector::SetTimeout(unsigned int seconds)
{
  accessTokens_.SetTimeout(seconds);
  timeout_ = seconds;
}


void Connector::ObtainAccessToken(const std::set<std::string>& scopes)
{
  accessTokens_.Obtain(accessToken_, registration_, signingKey_.get(), keyId_, scopes);
}


void Connector::ExecuteServiceRequest(ServiceResponse& response,
                                      const ServiceRequest& request)
{
  response.Clear();

  if (request.GetScopes().empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "A service request must declare its scopes");
  }

  ObtainAccessToken(request.GetScopes());

  HttpRequest http(request.GetMethod(), request.GetUri());
  http.SetHeader("Authorization", "Bearer " + accessToken_.GetToken());
  http.SetHeader("Accept", request.GetAccept());
  http.SetTimeout(timeout_);

  const std::string contentType = request.GetContentType();
  if (!contentType.empty())
  {
    http.SetHeader("Content-Type", contentType);
  }

  if (request.GetMethod() == Orthanc::HttpMethod_Post ||
      request.GetMethod() == Orthanc::HttpMethod_Put)
  {
    http.SetBody(request.GetBody());
  }

  HttpResponse answer;
  client_.Execute(answer, http);

  if (answer.GetStatus() != request.GetExpectedStatus())
  {
    LOG(ERROR) << "Platform service " << request.GetUri() << " answered with HTTP status "
               << answer.GetStatus() << " instead of " << request.GetExpectedStatus();
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NetworkProtocol,
                                    "Platform service answered with HTTP status " +
                                    boost::lexical_cast<std::string>(answer.GetStatus()));
  }

  response.SetHeaders(answer.GetHeaders());
  response.SetBody(answer.GetBody());
}


bool Connector::ExecutePagedRequest(ServiceResponse& response,
                                    const ServiceRequest& firstPage,
                                    std::string& cursor)
{
  ServiceRequest request(firstPage);

  if (!cursor.empty())
  {
    request.SetUri(cursor);
  }

  ExecuteServiceRequest(response, request);

  std::string link;
  if (response.LookupHeader(link, "link") &&
      HttpToolbox::LookupNextPageLink(cursor, link))
  {
    LOG(INFO) << "More pages are available from " << firstPage.GetUri();
    return true;
  }
  else
  {
    cursor.clear();
    return false;
  }
}
