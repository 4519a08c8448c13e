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

#include "../Http/IHttpClient.h"
#include "JWT.h"

#include <boost/thread/shared_mutex.hpp>
#include <map>
#include <stdint.h>


/**
 * Cache of the JSON Web Key Sets published by the platforms, indexed
 * by the URL of the key set. A key set is refreshed once older than
 * "maxAge" seconds, or if a JWT refers to an unknown key ID (which
 * happens after the platform has rotated its keys).
 **/
class PlatformKeysRegistry : public boost::noncopyable
{
private:
  typedef std::map<std::string, Json::Value>  Keys;

  struct KeySet
  {
    Keys     keys_;
    int64_t  lastUpdate_;
  };

  typedef std::map<std::string, KeySet>  KeySets;

  boost::shared_mutex  mutex_;
  IHttpClient&         client_;
  unsigned int         maxAge_;
  unsigned int         timeout_;
  KeySets              keySets_;

  bool IsUpToDate(const std::string& url,
                  unsigned int maxAge);

  bool LookupJwk(Json::Value& target,
                 const std::string& url,
                 const JWT& jwt);

public:
  PlatformKeysRegistry(IHttpClient& client,
                       unsigned int maxAge /* in seconds */);

  // Timeout of the requests to the key sets of the platforms
  void SetTimeout(unsigned int seconds);

  // Throws "ErrorCode_NetworkProtocol" if the key set cannot be retrieved
  void LoadKeys(const std::string& url);

  /**
   * Returns "false" if the signature is not genuine, or if the
   * key ID is unknown to the platform. Throws if the key set of the
   * platform is unavailable.
   **/
  bool VerifySignature(const JWT& jwt,
                       const std::string& url);
};
