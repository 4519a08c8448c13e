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

#include <list>
#include <map>


// Outcome of a third-party initiated login
class LoginRedirection
{
private:
  std::string  url_;
  std::string  state_;
  std::string  nonce_;
  std::string  cookiePath_;

public:
  LoginRedirection()
  {
  }

  LoginRedirection(const std::string& url,
                   const std::string& state,
                   const std::string& nonce,
                   const std::string& cookiePath) :
    url_(url),
    state_(state),
    nonce_(nonce),
    cookiePath_(cookiePath)
  {
  }

  // Authentication endpoint of the platform, with the OIDC arguments
  const std::string& GetUrl() const
  {
    return url_;
  }

  const std::string& GetState() const
  {
    return state_;
  }

  const std::string& GetNonce() const
  {
    return nonce_;
  }

  const std::string& GetCookiePath() const
  {
    return cookiePath_;
  }

  /**
   * Values of the two "Set-Cookie" headers holding the state. The
   * legacy cookie has no "SameSite" attribute, for the browsers that
   * reject "SameSite=None".
   **/
  void FormatStateCookies(std::list<std::string>& target,
                          bool secure) const;
};


/**
 * First leg of the LTI 1.3 launch (OIDC third-party initiated
 * login). The platform posts "iss", "login_hint" and
 * "target_link_uri", and the tool answers with a redirection to the
 * authentication endpoint of the platform.
 **/
class LoginHandler : public boost::noncopyable
{
private:
  IRegistrationStore&  registrations_;
  INonceStore&         nonces_;

public:
  explicit LoginHandler(const Datastores& stores);

  void Process(LoginRedirection& target,
               const std::map<std::string, std::string>& form);
};
