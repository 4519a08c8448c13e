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

#include <set>
#include <stdint.h>
#include <string>


/**
 * Bearer token granted by the token endpoint of a platform. The set
 * of scopes is sorted, which makes the cache key independent of the
 * order in which the scopes were requested.
 **/
class AccessToken
{
private:
  std::string            tokenUri_;
  std::string            clientId_;
  std::set<std::string>  scopes_;
  std::string            token_;
  int64_t                expiration_;   // Seconds since the epoch

public:
  AccessToken() :
    expiration_(0)
  {
  }

  AccessToken(const std::string& tokenUri,
              const std::string& clientId,
              const std::set<std::string>& scopes,
              const std::string& token,
              int64_t expiration);

  const std::string& GetTokenUri() const
  {
    return tokenUri_;
  }

  const std::string& GetClientId() const
  {
    return clientId_;
  }

  const std::set<std::string>& GetScopes() const
  {
    return scopes_;
  }

  const std::string& GetToken() const
  {
    return token_;
  }

  int64_t GetExpiration() const
  {
    return expiration_;
  }

  bool IsExpired(int64_t now) const
  {
    return now >= expiration_;
  }

  std::string GetCacheKey() const
  {
    return FormatCacheKey(tokenUri_, clientId_, scopes_);
  }

  static std::string FormatScopes(const std::set<std::string>& scopes);

  static void ParseScopes(std::set<std::string>& target,
                          const std::string& scopes);

  static std::string FormatCacheKey(const std::string& tokenUri,
                                    const std::string& clientId,
                                    const std::set<std::string>& scopes);
};
