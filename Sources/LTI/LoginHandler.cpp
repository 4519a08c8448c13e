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


#include "LoginHandler.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"

#include <Logging.h>
#include <OrthancException.h>
#include <Toolbox.h>


void LoginRedirection::FormatStateCookies(std::list<std::string>& target,
                                          bool secure) const
{
  target.clear();
  target.push_back(HttpToolbox::FormatSetCookie(LTI_COOKIE_STATE, state_, cookiePath_, CookieSameSite_None, secure));
  target.push_back(HttpToolbox::FormatSetCookie(LTI_COOKIE_STATE_LEGACY, state_, cookiePath_, CookieSameSite_Unspecified, secure));
}


LoginHandler::LoginHandler(const Datastores& stores) :
  registrations_(stores.GetRegistrations()),
  nonces_(stores.GetNonces())
{
}


void LoginHandler::Process(LoginRedirection& target,
                           const std::map<std::string, std::string>& form)
{
  const std::string issuer = HttpToolbox::ReadMandatoryString(form, "iss");
  const std::string loginHint = HttpToolbox::ReadMandatoryString(form, "login_hint");

  // Only checked for presence, the registration tells where to launch
  HttpToolbox::ReadMandatoryString(form, "target_link_uri");

  const std::string clientId = HttpToolbox::ReadOptionalString(form, "client_id", "");
  const std::string messageHint = HttpToolbox::ReadOptionalString(form, "lti_message_hint", "");

  Registration registration;

  if (clientId.empty())
  {
    if (!registrations_.LookupUniqueRegistration(registration, issuer))
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_BadRequest, "No unique registration for issuer \"" + issuer + "\"");
    }
  }
  else if (!registrations_.LookupRegistration(registration, issuer, clientId))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadRequest, "No registration for issuer \"" + issuer +
                                    "\" and client \"" + clientId + "\"");
  }

  const std::string state = LTI_STATE_PREFIX + Orthanc::Toolbox::GenerateUuid();
  const std::string nonce = Orthanc::Toolbox::GenerateUuid();

  nonces_.StoreNonce(nonce, registration.GetTargetLinkUri());

  std::map<std::string, std::string> arguments;
  arguments["scope"] = "openid";
  arguments["response_type"] = "id_token";
  arguments["response_mode"] = "form_post";
  arguments["prompt"] = "none";
  arguments["client_id"] = registration.GetClientId();
  arguments["redirect_uri"] = registration.GetTargetLinkUri();
  arguments["state"] = state;
  arguments["nonce"] = nonce;
  arguments["login_hint"] = loginHint;

  if (!messageHint.empty())
  {
    arguments["lti_message_hint"] = messageHint;
  }

  std::string url;
  HttpToolbox::FormatRedirectionUrl(url, registration.GetAuthLoginUri(), arguments);

  LOG(INFO) << "LTI login from issuer " << issuer << " for client " << registration.GetClientId();

  target = LoginRedirection(url, state, nonce, HttpToolbox::GetUrlPath(registration.GetTargetLinkUri()));
}
