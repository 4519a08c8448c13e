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

#include "../Datastore/IAccessTokenStore.h"
#include "../Datastore/Registration.h"
#include "../Http/IHttpClient.h"
#include "../Security/RSAPrivateKey.h"


/**
 * Obtains bearer tokens from the token endpoint of a platform,
 * using the OAuth 2.0 client credentials grant with a signed JWT as
 * the client assertion. The tokens are cached by the store, indexed
 * by token endpoint, client ID and set of scopes.
 **/
class AccessTokenManager : public boost::noncopyable
{
private:
  IAccessTokenStore&  store_;
  IHttpClient&        client_;
  unsigned int        timeout_;

public:
  AccessTokenManager(IAccessTokenStore& store,
                     IHttpClient& client);

  void SetTimeout(unsigned int seconds);

  static void ForgeClientAssertion(std::string& target,
                                   const Registration& registration,
                                   const RSAPrivateKey& signingKey,
                                   const std::string& keyId,
                                   int64_t now);

  /**
   * A cached token is returned without contacting the platform if it
   * has not expired. "signingKey" can be NULL as long as the token is
   * cached, otherwise "ErrorCode_IncompatibleConfigurations" is thrown.
   **/
  void Obtain(AccessToken& target,
              const Registration& registration,
              const RSAPrivateKey* signingKey,
              const std::string& keyId,
              const std::set<std::string>& scopes);
};
