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

#include "FakePlatform.h"

#include "../Sources/Datastore/MemoryDatastore.h"
#include "../Sources/HttpToolbox.h"
#include "../Sources/LTI/LaunchValidator.h"
#include "../Sources/LTI/LoginHandler.h"
#include "../Sources/LtiConstants.h"
#include "../Sources/Security/SecurityConstants.h"

#include <OrthancException.h>
#include <Toolbox.h>

#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>
#include <time.h>


namespace
{
  class LaunchEnvironment : public boost::noncopyable
  {
  private:
    MemoryDatastore       store_;
    Datastores            stores_;
    FakePlatform          platform_;
    PlatformKeysRegistry  keys_;
    LaunchValidator       validator_;

  public:
    LaunchEnvironment() :
      stores_(store_, store_, store_, store_),
      keys_(platform_, 3600),
      validator_(stores_, keys_)
    {
      platform_.Register(store_);
    }

    MemoryDatastore& GetStore()
    {
      return store_;
    }

    const Datastores& GetStores() const
    {
      return stores_;
    }

    FakePlatform& GetPlatform()
    {
      return platform_;
    }

    PlatformKeysRegistry& GetKeys()
    {
      return keys_;
    }

    LaunchValidator& GetValidator()
    {
      return validator_;
    }

    // Claims of a valid launch, whose nonce was issued by a login
    void FormatClaims(Json::Value& claims)
    {
      const std::string nonce = Orthanc::Toolbox::GenerateUuid();
      store_.StoreNonce(nonce, FakePlatform::TARGET_LINK_URL);
      platform_.FormatLaunchClaims(claims, nonce);
    }

    // What the browser posts to the launch endpoint
    void PrepareRequest(LaunchRequest& request,
                        const Json::Value& claims)
    {
      std::string token;
      platform_.ForgeIdToken(token, claims);

      request = LaunchRequest();
      request.SetFormField("id_token", token);
      request.SetFormField("state", "state-1");
      request.SetCookieHeader("lti-state=state-1");
    }
  };


  class RecordingHandler : public ILaunchHandler
  {
  private:
    unsigned int  count_;
    std::string   launchId_;
    std::string   resourceLinkId_;

  public:
    RecordingHandler() :
      count_(0)
    {
    }

    virtual void HandleLaunch(const std::string& launchId,
                              const LaunchClaims& claims) ORTHANC_OVERRIDE
    {
      count_++;
      launchId_ = launchId;
      resourceLinkId_ = claims.GetResourceLinkId();
    }

    unsigned int GetCount() const
    {
      return count_;
    }

    const std::string& GetLaunchId() const
    {
      return launchId_;
    }

    const std::string& GetResourceLinkId() const
    {
      return resourceLinkId_;
    }
  };


  class FailingHandler : public ILaunchHandler
  {
  public:
    virtual void HandleLaunch(const std::string& launchId,
                              const LaunchClaims& claims) ORTHANC_OVERRIDE
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_InexistentFile);
    }
  };


  class BrokenLaunchDataStore : public ILaunchDataStore
  {
  public:
    virtual void StoreLaunchData(const std::string& launchId,
                                 const std::string& claims,
                                 int64_t expiration) ORTHANC_OVERRIDE
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_Database);
    }

    virtual bool LookupLaunchData(std::string& claims,
                                  const std::string& launchId,
                                  int64_t now) ORTHANC_OVERRIDE
    {
      return false;
    }
  };
}


static void CheckRejected(LaunchValidator& validator,
                          const LaunchRequest& request,
                          LaunchStep expectedStep,
                          uint16_t expectedStatus)
{
  LaunchClaims claims;

  try
  {
    validator.Validate(claims, request);
    FAIL() << "The launch was accepted";
  }
  catch (LaunchException& e)
  {
    ASSERT_EQ(expectedStep, e.GetStep());
    ASSERT_EQ(expectedStatus, e.GetHttpStatusCode());
    ASSERT_TRUE(boost::starts_with(e.GetDetails(), std::string(EnumerationToString(expectedStep)) + ": "));
  }
}


TEST(LaunchClaims, Decoding)
{
  FakePlatform platform;

  Json::Value payload;
  platform.FormatLaunchClaims(payload, "nonce-1");

  LaunchClaims claims(payload);
  ASSERT_EQ(FakePlatform::ISSUER, claims.GetIssuer());
  ASSERT_EQ("user-1", claims.GetSubject());
  ASSERT_EQ(FakePlatform::CLIENT_ID, claims.GetClientId());
  ASSERT_EQ("nonce-1", claims.GetNonce());
  ASSERT_EQ(FakePlatform::DEPLOYMENT_ID, claims.GetDeploymentId());
  ASSERT_EQ(LTI_SUPPORTED_VERSION, claims.GetVersion());
  ASSERT_TRUE(claims.HasResourceLink());
  ASSERT_EQ("resource-1", claims.GetResourceLinkId());
  ASSERT_EQ("Chest CT reading", claims.GetResourceLinkTitle());
  ASSERT_TRUE(claims.GetResourceLinkDescription().empty());
  ASSERT_EQ("Jane", claims.GetGivenName());
  ASSERT_TRUE(claims.HasAgsEndpoint());
  ASSERT_TRUE(claims.HasAgsScopes());
  ASSERT_EQ(4u, claims.GetAgsScopes().size());
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, claims.GetAgsLineItem());
  ASSERT_TRUE(claims.HasNrpsEndpoint());
  ASSERT_EQ(FakePlatform::MEMBERSHIPS_URL, claims.GetNrpsMembershipsUrl());

  Json::Value formatted;
  claims.Format(formatted);
  ASSERT_EQ("resource-1", formatted["ResourceLinkId"].asString());
  ASSERT_TRUE(formatted["HasAgs"].asBool());

  std::string raw;
  Orthanc::Toolbox::WriteFastJson(raw, payload);

  LaunchClaims parsed;
  LaunchClaims::Parse(parsed, raw);
  ASSERT_EQ("user-1", parsed.GetSubject());
  ASSERT_THROW(LaunchClaims::Parse(parsed, "nope"), Orthanc::OrthancException);

  // Multiple audiences require "azp"
  payload[JWT_CLAIM_AUD].append("other");
  ASSERT_TRUE(LaunchClaims(payload).GetClientId().empty());
  payload[JWT_CLAIM_AZP] = FakePlatform::CLIENT_ID;
  ASSERT_EQ(FakePlatform::CLIENT_ID, LaunchClaims(payload).GetClientId());

  // Absent optional claims
  Json::Value minimal = Json::objectValue;
  LaunchClaims empty(minimal);
  ASSERT_FALSE(empty.HasResourceLink());
  ASSERT_FALSE(empty.HasAgsEndpoint());
  ASSERT_FALSE(empty.HasNrpsEndpoint());
  ASSERT_TRUE(empty.GetAudience().empty());

  // Mistyped claims
  Json::Value bad = payload;
  bad["email"] = 42;
  ASSERT_THROW(LaunchClaims c(bad), Orthanc::OrthancException);

  bad = payload;
  bad[LTI_CLAIM_RESOURCE_LINK] = "resource-1";
  ASSERT_THROW(LaunchClaims c(bad), Orthanc::OrthancException);

  bad = payload;
  bad[LTI_CLAIM_AGS_ENDPOINT]["scope"] = 3;
  ASSERT_THROW(LaunchClaims c(bad), Orthanc::OrthancException);

  ASSERT_THROW(LaunchClaims(Json::Value(Json::arrayValue)), Orthanc::OrthancException);
}


TEST(LaunchRequest, StateCookies)
{
  LaunchRequest request;

  std::string value;
  ASSERT_FALSE(request.LookupFormField(value, "state"));
  request.SetFormField("state", "");
  ASSERT_FALSE(request.LookupFormField(value, "state"));
  request.SetFormField("state", "state-1");
  ASSERT_TRUE(request.LookupFormField(value, "state"));
  ASSERT_EQ("state-1", value);

  std::list<std::string> cookies;
  request.GetStateCookies(cookies);
  ASSERT_TRUE(cookies.empty());

  request.SetCookieHeader("session=abc; lti-state=state-1; lti-state-legacy=state-1; lti-state=");
  request.GetStateCookies(cookies);
  ASSERT_EQ(2u, cookies.size());
  ASSERT_EQ("state-1", cookies.front());
  ASSERT_EQ("state-1", cookies.back());
}


TEST(LaunchValidator, Accepted)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);

  LaunchRequest request;
  environment.PrepareRequest(request, claims);

  const int64_t before = time(NULL);

  LaunchClaims accepted;
  const std::string launchId = environment.GetValidator().Validate(accepted, request);
  ASSERT_TRUE(boost::starts_with(launchId, LTI_LAUNCH_ID_PREFIX));
  ASSERT_EQ("resource-1", accepted.GetResourceLinkId());
  ASSERT_EQ("user-1", accepted.GetSubject());

  // The claims are stored untouched, for the default lifetime
  std::string stored;
  ASSERT_TRUE(environment.GetStore().LookupLaunchData(stored, launchId, before));
  ASSERT_TRUE(environment.GetStore().LookupLaunchData(stored, launchId, before + LTI_DEFAULT_LAUNCH_DATA_LIFETIME - 1));
  ASSERT_FALSE(environment.GetStore().LookupLaunchData(stored, launchId, time(NULL) + LTI_DEFAULT_LAUNCH_DATA_LIFETIME + 1));

  std::string token;
  ASSERT_TRUE(request.LookupFormField(token, "id_token"));
  ASSERT_EQ(JWT(token).GetRawPayload(), stored);

  // Replaying the same identity token fails, as the nonce is consumed
  CheckRejected(environment.GetValidator(), request, LaunchStep_Nonce, 400);
}


TEST(LaunchValidator, Handoff)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);

  LaunchRequest request;
  environment.PrepareRequest(request, claims);

  RecordingHandler handler;
  environment.GetValidator().Process(handler, request);
  ASSERT_EQ(1u, handler.GetCount());
  ASSERT_EQ("resource-1", handler.GetResourceLinkId());

  std::string stored;
  ASSERT_TRUE(environment.GetStore().LookupLaunchData(stored, handler.GetLaunchId(), time(NULL)));

  // A rejected launch never reaches the handler
  ASSERT_THROW(environment.GetValidator().Process(handler, request), LaunchException);
  ASSERT_EQ(1u, handler.GetCount());

  environment.FormatClaims(claims);
  environment.PrepareRequest(request, claims);

  FailingHandler failing;

  try
  {
    environment.GetValidator().Process(failing, request);
    FAIL();
  }
  catch (LaunchException& e)
  {
    ASSERT_EQ(LaunchStep_Handoff, e.GetStep());
    ASSERT_FALSE(e.IsClientError());
    ASSERT_EQ(500, e.GetHttpStatusCode());
  }
}


TEST(LaunchValidator, TokenIntake)
{
  LaunchEnvironment environment;

  LaunchRequest request;
  request.SetFormField("state", "state-1");
  request.SetCookieHeader("lti-state=state-1");
  CheckRejected(environment.GetValidator(), request, LaunchStep_TokenIntake, 400);

  request.SetFormField("id_token", "not-a-jwt");
  CheckRejected(environment.GetValidator(), request, LaunchStep_TokenIntake, 400);

  request.SetFormField("id_token", "a.b.c");
  CheckRejected(environment.GetValidator(), request, LaunchStep_TokenIntake, 400);
}


TEST(LaunchValidator, Registration)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_ISS] = "https://unknown.example.org";

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Registration, 400);

  environment.FormatClaims(claims);
  claims[JWT_CLAIM_AUD] = "unknown-client";
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Registration, 400);

  environment.FormatClaims(claims);
  claims.removeMember(JWT_CLAIM_ISS);
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Registration, 400);

  // No signature check has been attempted
  ASSERT_EQ(0u, environment.GetPlatform().GetCallCount(FakePlatform::KEYS_URL));
}


TEST(LaunchValidator, Signature)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);

  LaunchRequest request;
  environment.PrepareRequest(request, claims);

  std::string token;
  ASSERT_TRUE(request.LookupFormField(token, "id_token"));

  std::vector<std::string> parts;
  Orthanc::Toolbox::TokenizeString(parts, token, '.');
  ASSERT_EQ(3u, parts.size());

  // Tampering with one byte of the payload
  claims[JWT_CLAIM_SUB] = "user-2";

  std::string payload, encoded;
  Orthanc::Toolbox::WriteFastJson(payload, claims);
  HttpToolbox::EncodeBase64Url(encoded, payload);

  request.SetFormField("id_token", parts[0] + "." + encoded + "." + parts[2]);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 400);

  // The nonce was not consumed by the rejected launch
  ASSERT_EQ(NonceStatus_Valid, environment.GetStore().TestAndClearNonce(claims[JWT_CLAIM_NONCE].asString(),
                                                                        FakePlatform::TARGET_LINK_URL));

  // Signed by another key using the same key ID
  RSAPrivateKey other;
  other.Generate();
  environment.FormatClaims(claims);
  other.ForgeJWT(token, environment.GetPlatform().GetKeyId(), claims);
  request.SetFormField("id_token", token);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 400);

  // Expired identity token, beyond the leeway
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_EXP] = static_cast<Json::Int64>(time(NULL) - 3600);
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 400);

  // Not valid yet
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_NBF] = static_cast<Json::Int64>(time(NULL) + 3600);
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 400);

  // Malformed time claims
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_EXP] = "tomorrow";
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 400);

  environment.FormatClaims(claims);
  claims[JWT_CLAIM_EXP] = 1e300;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 400);

  // Within the leeway
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_EXP] = static_cast<Json::Int64>(time(NULL) - 10);
  environment.PrepareRequest(request, claims);

  LaunchClaims accepted;
  ASSERT_NO_THROW(environment.GetValidator().Validate(accepted, request));
}


TEST(LaunchValidator, KeySetUnavailable)
{
  LaunchEnvironment environment;

  environment.GetStore().StoreRegistration(Registration(FakePlatform::ISSUER, "broken-client", FakePlatform::TOKEN_URL,
                                                        FakePlatform::AUTH_URL, "https://platform.example.org/missing",
                                                        FakePlatform::TARGET_LINK_URL));

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_AUD] = "broken-client";

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Signature, 500);
}


TEST(LaunchValidator, ClaimsDecoding)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[LTI_CLAIM_DEPLOYMENT_ID] = 12;

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Claims, 400);
}


TEST(LaunchValidator, State)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);

  LaunchRequest request;
  environment.PrepareRequest(request, claims);

  request.SetCookieHeader("");
  CheckRejected(environment.GetValidator(), request, LaunchStep_State, 400);

  request.SetCookieHeader("lti-state=state-2");
  CheckRejected(environment.GetValidator(), request, LaunchStep_State, 400);

  request.SetCookieHeader("lti-state=state-1");
  request.SetFormField("state", "");
  CheckRejected(environment.GetValidator(), request, LaunchStep_State, 400);

  // Browsers dropping the "SameSite=None" cookie still send the legacy one
  request.SetFormField("state", "state-1");
  request.SetCookieHeader("lti-state-legacy=state-1");

  LaunchClaims accepted;
  ASSERT_NO_THROW(environment.GetValidator().Validate(accepted, request));
}


TEST(LaunchValidator, Audience)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_AZP] = FakePlatform::CLIENT_ID;
  claims[JWT_CLAIM_AUD] = Json::arrayValue;
  claims[JWT_CLAIM_AUD].append("other");

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Audience, 400);

  // "azp" selects the registration among several audiences
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_AZP] = FakePlatform::CLIENT_ID;
  claims[JWT_CLAIM_AUD].append("other");
  environment.PrepareRequest(request, claims);

  LaunchClaims accepted;
  ASSERT_NO_THROW(environment.GetValidator().Validate(accepted, request));

  // Without "azp", the registration is looked up from the first audience
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_AUD].append("aaa-other");
  environment.PrepareRequest(request, claims);
  ASSERT_NO_THROW(environment.GetValidator().Validate(accepted, request));

  environment.FormatClaims(claims);
  claims[JWT_CLAIM_AUD] = Json::arrayValue;
  claims[JWT_CLAIM_AUD].append("aaa-other");
  claims[JWT_CLAIM_AUD].append(FakePlatform::CLIENT_ID);
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Registration, 400);
}


TEST(LaunchValidator, Nonce)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[JWT_CLAIM_NONCE] = "never-issued";

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Nonce, 400);

  environment.FormatClaims(claims);
  claims.removeMember(JWT_CLAIM_NONCE);
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Nonce, 400);

  // The target link URI must be the one of the login
  environment.FormatClaims(claims);
  const std::string nonce = claims[JWT_CLAIM_NONCE].asString();
  claims[LTI_CLAIM_TARGET_LINK_URI] = "https://tool.example.org/lti/other";
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Nonce, 400);
  ASSERT_EQ(NonceStatus_NotFound, environment.GetStore().TestAndClearNonce(nonce, FakePlatform::TARGET_LINK_URL));
}


TEST(LaunchValidator, Deployment)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[LTI_CLAIM_DEPLOYMENT_ID] = "deployment-2";

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Deployment, 400);

  environment.FormatClaims(claims);
  claims.removeMember(LTI_CLAIM_DEPLOYMENT_ID);
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Deployment, 400);

  environment.FormatClaims(claims);
  claims[LTI_CLAIM_DEPLOYMENT_ID] = std::string(256, 'd');
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Deployment, 400);
}


TEST(LaunchValidator, Version)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims[LTI_CLAIM_VERSION] = "1.2.0";
  claims.removeMember(LTI_CLAIM_RESOURCE_LINK);  // Not reached

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Version, 400);

  environment.FormatClaims(claims);
  claims[LTI_CLAIM_MESSAGE_TYPE] = "LtiDeepLinkingRequest";
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_Version, 400);
}


TEST(LaunchValidator, ResourceLink)
{
  LaunchEnvironment environment;

  Json::Value claims;
  environment.FormatClaims(claims);
  claims.removeMember(LTI_CLAIM_RESOURCE_LINK);

  LaunchRequest request;
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_ResourceLink, 400);

  environment.FormatClaims(claims);
  claims[LTI_CLAIM_RESOURCE_LINK]["id"] = "";
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_ResourceLink, 400);

  environment.FormatClaims(claims);
  claims[LTI_CLAIM_RESOURCE_LINK]["id"] = std::string(256, 'r');
  environment.PrepareRequest(request, claims);
  CheckRejected(environment.GetValidator(), request, LaunchStep_ResourceLink, 400);

  environment.FormatClaims(claims);
  claims[LTI_CLAIM_RESOURCE_LINK]["id"] = std::string(255, 'r');
  environment.PrepareRequest(request, claims);

  LaunchClaims accepted;
  ASSERT_NO_THROW(environment.GetValidator().Validate(accepted, request));
}


TEST(LaunchValidator, LaunchData)
{
  LaunchEnvironment environment;

  ASSERT_THROW(environment.GetValidator().SetLaunchDataLifetime(0), Orthanc::OrthancException);
  environment.GetValidator().SetLaunchDataLifetime(10);
  ASSERT_EQ(10u, environment.GetValidator().GetLaunchDataLifetime());

  Json::Value claims;
  environment.FormatClaims(claims);

  LaunchRequest request;
  environment.PrepareRequest(request, claims);

  LaunchClaims accepted;
  const std::string launchId = environment.GetValidator().Validate(accepted, request);

  std::string stored;
  ASSERT_TRUE(environment.GetStore().LookupLaunchData(stored, launchId, time(NULL)));
  ASSERT_FALSE(environment.GetStore().LookupLaunchData(stored, launchId, time(NULL) + 11));

  // Failure of the store is reported as a server error
  BrokenLaunchDataStore broken;
  Datastores stores(environment.GetStore(), environment.GetStore(), broken, environment.GetStore());
  LaunchValidator validator(stores, environment.GetKeys());

  environment.FormatClaims(claims);
  environment.PrepareRequest(request, claims);
  CheckRejected(validator, request, LaunchStep_LaunchData, 500);
}


TEST(LoginHandler, Redirection)
{
  LaunchEnvironment environment;
  LoginHandler handler(environment.GetStores());

  std::map<std::string, std::string> form;
  form["iss"] = FakePlatform::ISSUER;
  form["login_hint"] = "hint-42";
  form["target_link_uri"] = FakePlatform::TARGET_LINK_URL;
  form["lti_message_hint"] = "message-hint";

  LoginRedirection redirection;
  handler.Process(redirection, form);

  ASSERT_TRUE(boost::starts_with(redirection.GetState(), LTI_STATE_PREFIX));
  ASSERT_FALSE(redirection.GetNonce().empty());
  ASSERT_EQ("/lti/launch", redirection.GetCookiePath());

  const std::string prefix = std::string(FakePlatform::AUTH_URL) + "?";
  ASSERT_TRUE(boost::starts_with(redirection.GetUrl(), prefix));

  const std::string query = redirection.GetUrl().substr(prefix.size());
  std::map<std::string, std::string> arguments;
  HttpToolbox::ParseFormUrlEncoded(arguments, query.c_str(), query.size());

  ASSERT_EQ(10u, arguments.size());
  ASSERT_EQ("openid", arguments["scope"]);
  ASSERT_EQ("id_token", arguments["response_type"]);
  ASSERT_EQ("form_post", arguments["response_mode"]);
  ASSERT_EQ("none", arguments["prompt"]);
  ASSERT_EQ(FakePlatform::CLIENT_ID, arguments["client_id"]);
  ASSERT_EQ(FakePlatform::TARGET_LINK_URL, arguments["redirect_uri"]);
  ASSERT_EQ(redirection.GetState(), arguments["state"]);
  ASSERT_EQ(redirection.GetNonce(), arguments["nonce"]);
  ASSERT_EQ("hint-42", arguments["login_hint"]);
  ASSERT_EQ("message-hint", arguments["lti_message_hint"]);

  std::list<std::string> cookies;
  redirection.FormatStateCookies(cookies, false);
  ASSERT_EQ(2u, cookies.size());
  ASSERT_EQ("lti-state=" + redirection.GetState() + "; HttpOnly; Path=/lti/launch; SameSite=None; Secure", cookies.front());
  ASSERT_EQ("lti-state-legacy=" + redirection.GetState() + "; HttpOnly; Path=/lti/launch", cookies.back());

  // The nonce is pending, bound to the target link URI of the registration
  ASSERT_EQ(NonceStatus_Valid, environment.GetStore().TestAndClearNonce(redirection.GetNonce(), FakePlatform::TARGET_LINK_URL));

  // Each login has its own state and nonce
  LoginRedirection second;
  handler.Process(second, form);
  ASSERT_NE(redirection.GetState(), second.GetState());
  ASSERT_NE(redirection.GetNonce(), second.GetNonce());
}


TEST(LoginHandler, Errors)
{
  LaunchEnvironment environment;
  LoginHandler handler(environment.GetStores());

  std::map<std::string, std::string> form;
  form["iss"] = FakePlatform::ISSUER;
  form["login_hint"] = "hint";
  form["target_link_uri"] = FakePlatform::TARGET_LINK_URL;

  LoginRedirection redirection;

  {
    std::map<std::string, std::string> f = form;
    f.erase("iss");
    ASSERT_THROW(handler.Process(redirection, f), Orthanc::OrthancException);

    f = form;
    f["login_hint"] = "";
    ASSERT_THROW(handler.Process(redirection, f), Orthanc::OrthancException);

    f = form;
    f.erase("target_link_uri");
    ASSERT_THROW(handler.Process(redirection, f), Orthanc::OrthancException);

    f = form;
    f["iss"] = "https://unknown.example.org";
    ASSERT_THROW(handler.Process(redirection, f), Orthanc::OrthancException);

    f = form;
    f["client_id"] = "unknown-client";
    ASSERT_THROW(handler.Process(redirection, f), Orthanc::OrthancException);
  }

  // With two registrations for the issuer, "client_id" is required
  environment.GetStore().StoreRegistration(Registration(FakePlatform::ISSUER, "second-client", FakePlatform::TOKEN_URL,
                                                        FakePlatform::AUTH_URL, FakePlatform::KEYS_URL,
                                                        "https://tool.example.org/lti/second"));

  try
  {
    handler.Process(redirection, form);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    ASSERT_EQ(Orthanc::ErrorCode_BadRequest, e.GetErrorCode());
  }

  form["client_id"] = "second-client";
  handler.Process(redirection, form);
  ASSERT_EQ("/lti/second", redirection.GetCookiePath());
  ASSERT_NE(std::string::npos, redirection.GetUrl().find("client_id=second-client"));
}


TEST(LoginHandler, EndToEnd)
{
  LaunchEnvironment environment;
  LoginHandler handler(environment.GetStores());

  std::map<std::string, std::string> form;
  form["iss"] = FakePlatform::ISSUER;
  form["login_hint"] = "hint";
  form["target_link_uri"] = FakePlatform::TARGET_LINK_URL;
  form["client_id"] = FakePlatform::CLIENT_ID;

  LoginRedirection redirection;
  handler.Process(redirection, form);

  // The platform authenticates the user, then posts the identity token
  Json::Value claims;
  environment.GetPlatform().FormatLaunchClaims(claims, redirection.GetNonce());

  std::string token;
  environment.GetPlatform().ForgeIdToken(token, claims);

  LaunchRequest request;
  request.SetFormField("id_token", token);
  request.SetFormField("state", redirection.GetState());
  request.SetCookieHeader("other=1; lti-state=" + redirection.GetState());

  RecordingHandler recorder;
  environment.GetValidator().Process(recorder, request);
  ASSERT_EQ(1u, recorder.GetCount());
  ASSERT_TRUE(boost::starts_with(recorder.GetLaunchId(), LTI_LAUNCH_ID_PREFIX));
}
