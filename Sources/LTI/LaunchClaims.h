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

#include <json/value.h>
#include <set>
#include <string>


/**
 * Fixed-shape view of the claims of a verified launch. Decoding
 * fails if a claim is present with an unexpected type. Absent claims
 * are left empty, so that each validation step reports its own
 * missing claim.
 **/
class LaunchClaims
{
private:
  std::string            issuer_;
  std::string            subject_;
  std::set<std::string>  audience_;
  std::string            authorizedParty_;
  std::string            nonce_;
  std::string            targetLinkUri_;
  std::string            deploymentId_;
  std::string            version_;
  std::string            messageType_;

  bool                   hasResourceLink_;
  std::string            resourceLinkId_;
  std::string            resourceLinkTitle_;
  std::string            resourceLinkDescription_;

  std::string            email_;
  std::string            name_;
  std::string            givenName_;
  std::string            familyName_;

  bool                   hasAgsEndpoint_;
  std::string            agsLineItem_;
  std::string            agsLineItems_;
  bool                   hasAgsScopes_;
  std::set<std::string>  agsScopes_;

  bool                   hasNrpsEndpoint_;
  std::string            nrpsMembershipsUrl_;

public:
  LaunchClaims();

  explicit LaunchClaims(const Json::Value& payload);

  static void Parse(LaunchClaims& target,
                    const std::string& rawPayload);

  const std::string& GetIssuer() const
  {
    return issuer_;
  }

  const std::string& GetSubject() const
  {
    return subject_;
  }

  const std::set<std::string>& GetAudience() const
  {
    return audience_;
  }

  // The "azp" claim, if any, or the single audience
  std::string GetClientId() const;

  const std::string& GetNonce() const
  {
    return nonce_;
  }

  const std::string& GetTargetLinkUri() const
  {
    return targetLinkUri_;
  }

  const std::string& GetDeploymentId() const
  {
    return deploymentId_;
  }

  const std::string& GetVersion() const
  {
    return version_;
  }

  const std::string& GetMessageType() const
  {
    return messageType_;
  }

  bool HasResourceLink() const
  {
    return hasResourceLink_;
  }

  const std::string& GetResourceLinkId() const
  {
    return resourceLinkId_;
  }

  const std::string& GetResourceLinkTitle() const
  {
    return resourceLinkTitle_;
  }

  const std::string& GetResourceLinkDescription() const
  {
    return resourceLinkDescription_;
  }

  const std::string& GetEmail() const
  {
    return email_;
  }

  const std::string& GetName() const
  {
    return name_;
  }

  const std::string& GetGivenName() const
  {
    return givenName_;
  }

  const std::string& GetFamilyName() const
  {
    return familyName_;
  }

  bool HasAgsEndpoint() const
  {
    return hasAgsEndpoint_;
  }

  const std::string& GetAgsLineItem() const
  {
    return agsLineItem_;
  }

  const std::string& GetAgsLineItems() const
  {
    return agsLineItems_;
  }

  bool HasAgsScopes() const
  {
    return hasAgsScopes_;
  }

  const std::set<std::string>& GetAgsScopes() const
  {
    return agsScopes_;
  }

  bool HasNrpsEndpoint() const
  {
    return hasNrpsEndpoint_;
  }

  const std::string& GetNrpsMembershipsUrl() const
  {
    return nrpsMembershipsUrl_;
  }

  void Format(Json::Value& target) const;
};
