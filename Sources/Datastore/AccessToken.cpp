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


#include "AccessToken.h"

#include <OrthancException.h>
#include <Toolbox.h>

#include <vector>


AccessToken::AccessToken(const std::string& tokenUri,
                         const std::string& clientId,
                         const std::set<std::string>& scopes,
                         const std::string& token,
                         int64_t expiration) :
  tokenUri_(tokenUri),
  clientId_(clientId),
  scopes_(scopes),
  token_(token),
  expiration_(expiration)
{
  if (tokenUri.empty() ||
      clientId.empty() ||
      scopes.empty() ||
      token.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}


std::string AccessToken::FormatScopes(const std::set<std::string>& scopes)
{
  std::string s;

  for (std::set<std::string>::const_iterator it = scopes.begin(); it != scopes.end(); ++it)
  {
    if (!s.empty())
    {
      s += " ";
    }

    s += *it;
  }

  return s;
}


void AccessToken::ParseScopes(std::set<std::string>& target,
                              const std::string& scopes)
{
  target.clear();

  std::vector<std::string> tokens;
  Orthanc::Toolbox::TokenizeString(tokens, scopes, ' ');

  for (size_t i = 0; i < tokens.size(); i++)
  {
    if (!tokens[i].empty())
    {
      target.insert(tokens[i]);
    }
  }
}


std::string AccessToken::FormatCacheKey(const std::string& tokenUri,
                                        const std::string& clientId,
                                        const std::set<std::string>& scopes)
{
  return tokenUri + "\n" + clientId + "\n" + FormatScopes(scopes);
}
