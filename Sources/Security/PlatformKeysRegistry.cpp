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


#include "PlatformKeysRegistry.h"

#include "../LtiConstants.h"
#include "SecurityConstants.h"

#include <Logging.h>
#include <SerializationToolbox.h>
#include <Toolbox.h>

#include <time.h>


static const unsigned int MIN_REFRESH_INTERVAL = 5;  // In seconds, against floods of unknown key IDs


bool PlatformKeysRegistry::IsUpToDate(const std::string& url,
                                      unsigned int maxAge)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  KeySets::const_iterator found = keySets_.find(url);

  return (found != keySets_.end() &&
          static_cast<int64_t>(time(NULL)) - found->second.lastUpdate_ < static_cast<int64_t>(maxAge));
}


bool PlatformKeysRegistry::LookupJwk(Json::Value& target,
                                     const std::string& url,
                                     const JWT& jwt)
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  KeySets::const_iterator keySet = keySets_.find(url);
  if (keySet == keySets_.end())
  {
    return false;
  }

  const Keys& keys = keySet->second.keys_;

  if (jwt.HasKeyId())
  {
    Keys::const_iterator found = keys.find(jwt.GetKeyId());
    if (found == keys.end())
    {
      return false;
    }
    else
    {
      target = found->second;
      return true;
    }
  }
  else if (keys.size() == 1)
  {
    // No "kid" in the header of the JWT, which is only unambiguous if the platform has one single key
    target = keys.begin()->second;
    return true;
  }
  else
  {
    return false;
  }
}


PlatformKeysRegistry::PlatformKeysRegistry(IHttpClient& client,
                                           unsigned int maxAge) :
  client_(client),
  maxAge_(maxAge),
  timeout_(LTI_DEFAULT_HTTP_TIMEOUT)
{
}


void PlatformKeysRegistry::SetTimeout(unsigned int seconds)
{
  if (seconds == 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  timeout_ = seconds;
}


void PlatformKeysRegistry::LoadKeys(const std::string& url)
{
  HttpRequest request(Orthanc::HttpMethod_Get, url);
  request.SetHeader("Accept", MIME_JSON);

  {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    request.SetTimeout(timeout_);
  }

  HttpResponse response;
  client_.Execute(response, request);

  if (response.GetStatus() != 200)
  {
    LOG(ERROR) << "Cannot load the platform keys from " << url << ", HTTP status: " << response.GetStatus();
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NetworkProtocol, "Cannot load the platform keys from: " + url);
  }

  Json::Value jwks;
  if (!Orthanc::Toolbox::ReadJson(jwks, response.GetBody()) ||
      jwks.type() != Json::objectValue ||
      !jwks.isMember(JWKS_FIELD_KEYS) ||
      jwks[JWKS_FIELD_KEYS].type() != Json::arrayValue)
  {
    LOG(ERROR) << "Not a JSON Web Key Set: " << url;
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NetworkProtocol, "Not a JSON Web Key Set: " + url);
  }

  KeySet keySet;
  keySet.lastUpdate_ = time(NULL);

  const Json::Value& keys = jwks[JWKS_FIELD_KEYS];

  for (Json::Value::ArrayIndex i = 0; i < keys.size(); i++)
  {
    if (keys[i].type() == Json::objectValue)
    {
      const std::string keyId = Orthanc::SerializationToolbox::ReadString(keys[i], JWKS_FIELD_KID, "");

      if (keySet.keys_.find(keyId) == keySet.keys_.end())  // Don't load twice the same key
      {
        keySet.keys_[keyId] = keys[i];
      }
    }
  }

  LOG(INFO) << "Loaded " << keySet.keys_.size() << " platform key(s) from " << url;

  {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    keySets_[url] = keySet;
  }
}


bool PlatformKeysRegistry::VerifySignature(const JWT& jwt,
                                           const std::string& url)
{
  unsigned int maxAge;

  {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    maxAge = maxAge_;
  }

  bool justLoaded = false;
  if (!IsUpToDate(url, maxAge))
  {
    LoadKeys(url);
    justLoaded = true;
  }

  Json::Value jwk;
  if (!LookupJwk(jwk, url, jwt))
  {
    if (justLoaded ||
        IsUpToDate(url, MIN_REFRESH_INTERVAL))
    {
      LOG(WARNING) << "Unknown platform key ID: " << jwt.GetKeyId();
      return false;
    }

    LOG(INFO) << "Unknown platform key ID, reloading the key set: " << url;
    LoadKeys(url);

    if (!LookupJwk(jwk, url, jwt))
    {
      LOG(WARNING) << "Unknown platform key ID: " << jwt.GetKeyId();
      return false;
    }
  }

  RSAPublicKey key;

  try
  {
    key.ImportJwk(jwk);
  }
  catch (Orthanc::OrthancException& e)
  {
    LOG(WARNING) << "Unusable platform key \"" << jwt.GetKeyId() << "\" in " << url << ": " << e.What();
    return false;
  }

  return jwt.VerifySignature(key);
}
