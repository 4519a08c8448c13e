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

#include <Cache/LeastRecentlyUsedIndex.h>
#include <Compatibility.h>

#include <boost/thread/shared_mutex.hpp>
#include <map>


/**
 * Store keeping everything in RAM, to be used by a single process.
 * This class is thread-safe.
 **/
class MemoryDatastore :
  public IRegistrationStore,
  public INonceStore,
  public ILaunchDataStore,
  public IAccessTokenStore
{
private:
  typedef std::pair<std::string, std::string>  IssuerAndIdentifier;

  struct LaunchData
  {
    std::string  claims_;
    int64_t      expiration_;
  };

  typedef std::map<IssuerAndIdentifier, Registration>                Registrations;
  typedef std::set<IssuerAndIdentifier>                              Deployments;
  typedef Orthanc::LeastRecentlyUsedIndex<std::string, std::string>  Nonces;
  typedef std::map<std::string, LaunchData>                          LaunchDataMap;
  typedef std::map<std::string, AccessToken>                         AccessTokens;

  boost::shared_mutex  mutex_;
  Registrations        registrations_;
  Deployments          deployments_;
  Nonces               nonces_;
  size_t               maxPendingNonces_;
  LaunchDataMap        launchData_;
  AccessTokens         accessTokens_;

public:
  MemoryDatastore();

  // Beyond this number of pending logins, the oldest nonces are discarded
  void SetMaxPendingNonces(size_t count);

  virtual void StoreRegistration(const Registration& registration) ORTHANC_OVERRIDE;

  virtual bool LookupRegistration(Registration& target,
                                  const std::string& issuer,
                                  const std::string& clientId) ORTHANC_OVERRIDE;

  virtual bool LookupUniqueRegistration(Registration& target,
                                        const std::string& issuer) ORTHANC_OVERRIDE;

  virtual void StoreDeployment(const std::string& issuer,
                               const std::string& deploymentId) ORTHANC_OVERRIDE;

  virtual bool HasDeployment(const std::string& issuer,
                             const std::string& deploymentId) ORTHANC_OVERRIDE;

  virtual void StoreNonce(const std::string& nonce,
                          const std::string& targetLinkUri) ORTHANC_OVERRIDE;

  virtual NonceStatus TestAndClearNonce(const std::string& nonce,
                                        const std::string& targetLinkUri) ORTHANC_OVERRIDE;

  virtual void StoreLaunchData(const std::string& launchId,
                               const std::string& claims,
                               int64_t expiration) ORTHANC_OVERRIDE;

  virtual bool LookupLaunchData(std::string& claims,
                                const std::string& launchId,
                                int64_t now) ORTHANC_OVERRIDE;

  virtual void StoreAccessToken(const AccessToken& token) ORTHANC_OVERRIDE;

  virtual AccessTokenStatus LookupAccessToken(AccessToken& target,
                                              const std::string& tokenUri,
                                              const std::string& clientId,
                                              const std::set<std::string>& scopes,
                                              int64_t now) ORTHANC_OVERRIDE;
};
