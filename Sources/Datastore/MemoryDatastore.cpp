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


#include "MemoryDatastore.h"

#include <Logging.h>
#include <OrthancException.h>

#include <time.h>


static const size_t DEFAULT_MAX_PENDING_NONCES = 10000;


MemoryDatastore::MemoryDatastore() :
  maxPendingNonces_(DEFAULT_MAX_PENDING_NONCES)
{
}


void MemoryDatastore::SetMaxPendingNonces(size_t count)
{
  if (count == 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  maxPendingNonces_ = count;
}


void MemoryDatastore::StoreRegistration(const Registration& registration)
{
  registration.Check();

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  registrations_[std::make_pair(registration.GetIssuer(), registration.GetClientId())] = registration;
}


bool MemoryDatastore::LookupRegistration(Registration& target,
                                         const std::string& issuer,
                                         const std::string& clientId)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  Registrations::const_iterator found = registrations_.find(std::make_pair(issuer, clientId));
  if (found == registrations_.end())
  {
    return false;
  }
  else
  {
    target = found->second;
    return true;
  }
}


bool MemoryDatastore::LookupUniqueRegistration(Registration& target,
                                               const std::string& issuer)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  Registrations::const_iterator it = registrations_.lower_bound(std::make_pair(issuer, std::string()));

  if (it == registrations_.end() ||
      it->first.first != issuer)
  {
    return false;
  }

  Registrations::const_iterator next = it;
  ++next;

  if (next != registrations_.end() &&
      next->first.first == issuer)
  {
    return false;  // Ambiguous, the client ID is needed
  }
  else
  {
    target = it->second;
    return true;
  }
}


void MemoryDatastore::StoreDeployment(const std::string& issuer,
                                      const std::string& deploymentId)
{
  Registration::CheckDeploymentId(deploymentId);

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  deployments_.insert(std::make_pair(issuer, deploymentId));
}


bool MemoryDatastore::HasDeployment(const std::string& issuer,
                                    const std::string& deploymentId)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  return deployments_.find(std::make_pair(issuer, deploymentId)) != deployments_.end();
}


void MemoryDatastore::StoreNonce(const std::string& nonce,
                                 const std::string& targetLinkUri)
{
  if (nonce.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  boost::unique_lock<boost::shared_mutex> lock(mutex_);

  if (nonces_.Contains(nonce))
  {
    nonces_.Invalidate(nonce);
  }

  nonces_.Add(nonce, targetLinkUri);

  while (nonces_.GetSize() > maxPendingNonces_)
  {
    std::string uri;
    nonces_.RemoveOldest(uri);
    LOG(INFO) << "Too many pending logins, discarding the oldest nonce";
  }
}


NonceStatus MemoryDatastore::TestAndClearNonce(const std::string& nonce,
                                               const std::string& targetLinkUri)
{
  boost::unique_lock<boost::shared_mutex> lock(mutex_);

  if (!nonces_.Contains(nonce))
  {
    return NonceStatus_NotFound;
  }

  const std::string storedUri = nonces_.Invalidate(nonce);

  if (storedUri == targetLinkUri)
  {
    return NonceStatus_Valid;
  }
  else
  {
    return NonceStatus_TargetLinkUriMismatch;
  }
}


void MemoryDatastore::StoreLaunchData(const std::string& launchId,
                                      const std::string& claims,
                                      int64_t expiration)
{
  if (launchId.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  const int64_t now = time(NULL);

  boost::unique_lock<boost::shared_mutex> lock(mutex_);

  // Purge the sessions that have expired
  LaunchDataMap::iterator it = launchData_.begin();
  while (it != launchData_.end())
  {
    if (it->second.expiration_ <= now)
    {
      launchData_.erase(it++);
    }
    else
    {
      ++it;
    }
  }

  LaunchData& data = launchData_[launchId];
  data.claims_ = claims;
  data.expiration_ = expiration;
}


bool MemoryDatastore::LookupLaunchData(std::string& claims,
                                       const std::string& launchId,
                                       int64_t now)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  LaunchDataMap::const_iterator found = launchData_.find(launchId);
  if (found == launchData_.end() ||
      found->second.expiration_ <= now)
  {
    return false;
  }
  else
  {
    claims = found->second.claims_;
    return true;
  }
}


void MemoryDatastore::StoreAccessToken(const AccessToken& token)
{
  boost::unique_lock<boost::shared_mutex> lock(mutex_);

  AccessTokens::iterator found = accessTokens_.find(token.GetCacheKey());
  if (found == accessTokens_.end())
  {
    accessTokens_.insert(std::make_pair(token.GetCacheKey(), token));
  }
  else
  {
    found->second = token;
  }
}


AccessTokenStatus MemoryDatastore::LookupAccessToken(AccessToken& target,
                                                     const std::string& tokenUri,
                                                     const std::string& clientId,
                                                     const std::set<std::string>& scopes,
                                                     int64_t now)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  AccessTokens::const_iterator found = accessTokens_.find(AccessToken::FormatCacheKey(tokenUri, clientId, scopes));
  if (found == accessTokens_.end())
  {
    return AccessTokenStatus_NotFound;
  }
  else if (found->second.IsExpired(now))
  {
    return AccessTokenStatus_Expired;
  }
  else
  {
    target = found->second;
    return AccessTokenStatus_Valid;
  }
}
