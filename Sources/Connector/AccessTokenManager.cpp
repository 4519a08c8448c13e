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


#include "AccessTokenManager.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"
#include "../Security/SecurityConstants.h"

#include <Logging.h>
#include <OrthancException.h>
#include <Toolbox.h>

#include <boost/lexical_cast.hpp>
#include <time.h>


static const char* const CLIENT_ASSERTION_TYPE = "urn:ietf:params:oauth:client-assertion-type:jwt-bearer";
static const char* const GRANT_TYPE = "client_credentials";
static const char* const FIELD_ACCESS_TOKEN = "access_token";
static const char* const FIELD_EXPIRES_IN = "expires_in";

static const int64_t CLOCK_SKEW_ALLOWANCE = 120;  // Back-dating of "iat", in seconds
static const int64_t ASSERTION_LIFETIME = 3600;   // In seconds


AccessTokenManager::AccessTokenManager(IAccessTokenStore& store,
                                       IHttpClient& client) :
  store_(store),
  client_(client),
  timeout_(LTI_DEFAULT_HTTP_TIMEOUT)
{
}


void AccessTokenManager::SetTimeout(unsigned int seconds)
{
  if (seconds == 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  timeout_ = seconds;
}


void AccessTokenManager::ForgeClientAssertion(std::string& target,
                                              const Registration& registration,
                                              const RSAPrivateKey& signingKey,
                                              const std::string& keyId,
                                              int64_t now)
{
  Json::Value payload = Json::objectValue;
  payload[JWT_CLAIM_ISS] = registration.GetClientId();
  payload[JWT_CLAIM_SUB] = registration.GetClientId();
  payload[JWT_CLAIM_AUD] = registration.GetTokenUri();
  payload[JWT_CLAIM_IAT] = static_cast<Json::Int64>(now - CLOCK_SKEW_ALLOWANCE);
  payload[JWT_CLAIM_EXP] = static_cast<Json::Int64>(now + ASSERTION_LIFETIME);
  payload[JWT_CLAIM_JTI] = "lti-service-token" + Orthanc::Toolbox::GenerateUuid();

  signingKey.ForgeJWT(target, keyId, payload);
}


void AccessTokenManager::Obtain(AccessToken& target,
                                const Registration& registration,
                                const RSAPrivateKey* signingKey,
                                const std::string& keyId,
                                const std::set<std::string>& scopes)
{
  if (scopes.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "An access token needs at least one scope");
  }

  const int64_t now = time(NULL);

  AccessToken cached;
  AccessTokenStatus status = store_.LookupAccessToken(cached, registration.GetTokenUri(), registration.GetClientId(), scopes, now);

  if (status == AccessTokenStatus_Valid)
  {
    target = cached;
    return;
  }

  if (signingKey == NULL ||
      !signingKey->IsValid())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_IncompatibleConfigurations,
                                    "No private key is configured to sign the client assertion");
  }

  LOG(INFO) << "Requesting an access token from " << registration.GetTokenUri()
            << " (" << EnumerationToString(status) << " in cache)";

  std::string assertion;
  ForgeClientAssertion(assertion, registration, *signingKey, keyId, now);

  std::map<std::string, std::string> form;
  form["grant_type"] = GRANT_TYPE;
  form["client_assertion_type"] = CLIENT_ASSERTION_TYPE;
  form["client_assertion"] = assertion;
  form["scope"] = AccessToken::FormatScopes(scopes);

  std::string body;
  HttpToolbox::EncodeFormUrl(body, form);

  HttpRequest request(Orthanc::HttpMethod_Post, registration.GetTokenUri());
  request.SetHeader("Content-Type", "application/x-www-form-urlencoded");
  request.SetHeader("Accept", MIME_JSON);
  request.SetBody(body);
  request.SetTimeout(timeout_);

  HttpResponse response;
  client_.Execute(response, request);

  if (response.GetStatus() != 200)
  {
    LOG(ERROR) << "The token endpoint " << registration.GetTokenUri() << " answered with HTTP status " << response.GetStatus();
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NetworkProtocol,
                                    "Token endpoint answered with HTTP status " +
                                    boost::lexical_cast<std::string>(response.GetStatus()));
  }

  Json::Value answer;
  if (!Orthanc::Toolbox::ReadJson(answer, response.GetBody()) ||
      answer.type() != Json::objectValue ||
      !answer.isMember(FIELD_ACCESS_TOKEN) ||
      answer[FIELD_ACCESS_TOKEN].type() != Json::stringValue ||
      !answer.isMember(FIELD_EXPIRES_IN) ||
      !answer[FIELD_EXPIRES_IN].isIntegral() ||
      answer[FIELD_EXPIRES_IN].asInt64() < 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NetworkProtocol, "Invalid answer from the token endpoint");
  }

  AccessToken token(registration.GetTokenUri(), registration.GetClientId(), scopes,
                    answer[FIELD_ACCESS_TOKEN].asString(), now + answer[FIELD_EXPIRES_IN].asInt64());

  store_.StoreAccessToken(token);
  target = token;
}
