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
#include <string>


/**
 * Trust relationship between one platform (the issuer) and this
 * tool, as configured out-of-band by the operators. Unique for each
 * (issuer, client ID) pair.
 **/
class Registration
{
private:
  std::string  issuer_;
  std::string  clientId_;
  std::string  tokenUri_;
  std::string  authLoginUri_;
  std::string  keySetUri_;
  std::string  targetLinkUri_;

public:
  Registration()
  {
  }

  Registration(const std::string& issuer,
               const std::string& clientId,
               const std::string& tokenUri,
               const std::string& authLoginUri,
               const std::string& keySetUri,
               const std::string& targetLinkUri);

  const std::string& GetIssuer() const
  {
    return issuer_;
  }

  const std::string& GetClientId() const
  {
    return clientId_;
  }

  const std::string& GetTokenUri() const
  {
    return tokenUri_;
  }

  const std::string& GetAuthLoginUri() const
  {
    return authLoginUri_;
  }

  const std::string& GetKeySetUri() const
  {
    return keySetUri_;
  }

  const std::string& GetTargetLinkUri() const
  {
    return targetLinkUri_;
  }

  void Check() const;

  // Reads one item of the "Registrations" list of the configuration file
  void Unserialize(const Json::Value& source);

  static void CheckDeploymentId(const std::string& deploymentId);
};
