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
#include "../LTI/LaunchClaims.h"
#include "AccessTokenManager.h"
#include "ServiceRequest.h"

#include <Compatibility.h>  // For std::unique_ptr<>


/**
 * Session of the tool with the platform, reconstructed from the ID
 * of a successful launch. A connector is meant to serve one request
 * of the tool, and must not be shared between threads.
 **/
class Connector : public boost::noncopyable
{
private:
  Datastores                      stores_;
  IHttpClient&                    client_;
  std::string                     launchId_;
  std::string                     launchData_;
  LaunchClaims                    claims_;
  Registration                    registration_;
  AccessTokenManager              accessTokens_;
  std::unique_ptr<RSAPrivateKey>  signingKey_;
  std::string                     keyId_;
  AccessToken                     accessToken_;
  unsigned int                    timeout_;

  void ResolveRegistration();

public:
  Connector(const Datastores& stores,
            IHttpClient& client,
            const std::string& launchId);

  const std::string& GetLaunchId() const
  {
    return launchId_;
  }

  const LaunchClaims& GetClaims() const
  {
    return claims_;
  }

  // The claims of the launch, exactly as received from the platform
  const std::string& GetLaunchData() const
  {
    return launchData_;
  }

  const Registration& GetRegistration() const
  {
    return registration_;
  }

  void SetSigningKey(const std::string& keyId,
                     const std::string& pem);

  bool HasSigningKey() const
  {
    return signingKey_.get() != NULL;
  }

  void SetTimeout(unsigned int seconds);

  void ObtainAccessToken(const std::set<std::string>& scopes);

  // The token obtained by the last call to "ObtainAccessToken()"
  const AccessToken& GetAccessToken() const
  {
    return accessToken_;
  }

  /**
   * Throws "ErrorCode_NetworkProtocol" if the platform answers with
   * another HTTP status than the expected one. The body of such an
   * answer is discarded.
   **/
  void ExecuteServiceRequest(ServiceResponse& response,
                             const ServiceRequest& request);

  /**
   * One step of a walk over a paginated collection. "cursor" must be
   * empty for the first page, it is then updated with the URI of the
   * next page from the "Link" header. Returns "false" once the last
   * page has been received, in which case "cursor" is cleared.
   **/
  bool ExecutePagedRequest(ServiceResponse& response,
                           const ServiceRequest& firstPage,
                           std::string& cursor);
};
