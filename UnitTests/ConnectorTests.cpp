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

#include "../Sources/Connector/AgsClient.h"
#include "../Sources/Connector/NrpsClient.h"
#include "../Sources/Datastore/MemoryDatastore.h"
#include "../Sources/LtiConstants.h"
#include "../Sources/Security/JWT.h"
#include "../Sources/Security/SecurityConstants.h"

#include <Compatibility.h>  // For std::unique_ptr<>
#include <OrthancException.h>
#include <Toolbox.h>

#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>
#include <time.h>


namespace
{
  class ConnectorEnvironment : public boost::noncopyable
  {
  private:
    MemoryDatastore  store_;
    Datastores       stores_;
    FakePlatform     platform_;
    RSAPrivateKey    toolKey_;
    std::string      toolKeyPem_;

  public:
    ConnectorEnvironment() :
      stores_(store_, store_, store_, store_)
    {
      platform_.Register(store_);

      toolKey_.Generate();
      toolKey_.SerializePrivate(toolKeyPem_);
      platform_.SetToolKey(toolKey_);
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

    // Same state as after a successful launch
    void StoreLaunch(const std::string& launchId,
                     const Json::Value& claims)
    {
      std::string raw;
      Orthanc::Toolbox::WriteFastJson(raw, claims);
      store_.StoreLaunchData(launchId, raw, static_cast<int64_t>(time(NULL)) + 3600);
    }

    void StoreLaunch(const std::string& launchId)
    {
      Json::Value claims;
      platform_.FormatLaunchClaims(claims, "nonce-1");
      StoreLaunch(launchId, claims);
    }

    Connector* CreateConnector(const std::string& launchId)
    {
      std::unique_ptr<Connector> connector(new Connector(stores_, platform_, launchId));
      connector->SetSigningKey("tool-key", toolKeyPem_);
      return connector.release();
    }
  };
}


static std::set<std::string> CreateScopes(const std::string& a,
                                          const std::string& b)
{
  std::set<std::string> scopes;
  scopes.insert(a);
  scopes.insert(b);
  return scopes;
}


static void CheckErrorCode(Orthanc::ErrorCode expected,
                           const Orthanc::OrthancException& e)
{
  ASSERT_EQ(expected, e.GetErrorCode());
}


TEST(Connector, Construction)
{
  ConnectorEnvironment environment;

  try
  {
    Connector connector(environment.GetStores(), environment.GetPlatform(), "launch-1");
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_UnknownResource, e);
  }

  Json::Value claims;
  environment.GetPlatform().FormatLaunchClaims(claims, "nonce-1");
  environment.StoreLaunch("launch-1", claims);

  Connector connector(environment.GetStores(), environment.GetPlatform(), "launch-1");
  ASSERT_EQ("launch-1", connector.GetLaunchId());
  ASSERT_EQ("resource-1", connector.GetClaims().GetResourceLinkId());
  ASSERT_EQ(FakePlatform::CLIENT_ID, connector.GetRegistration().GetClientId());
  ASSERT_EQ(FakePlatform::TOKEN_URL, connector.GetRegistration().GetTokenUri());
  ASSERT_FALSE(connector.HasSigningKey());

  Json::Value reloaded;
  ASSERT_TRUE(Orthanc::Toolbox::ReadJson(reloaded, connector.GetLaunchData()));
  ASSERT_EQ(FakePlatform::ISSUER, reloaded[JWT_CLAIM_ISS].asString());
  ASSERT_EQ("nonce-1", reloaded[JWT_CLAIM_NONCE].asString());

  ASSERT_THROW(connector.SetSigningKey("tool-key", "not a key"), Orthanc::OrthancException);
  ASSERT_FALSE(connector.HasSigningKey());
  ASSERT_THROW(connector.SetTimeout(0), Orthanc::OrthancException);

  // Several audiences without "azp": The first registered one is used
  claims[JWT_CLAIM_AUD] = Json::arrayValue;
  claims[JWT_CLAIM_AUD].append("another-tool");
  claims[JWT_CLAIM_AUD].append(FakePlatform::CLIENT_ID);
  environment.StoreLaunch("launch-2", claims);

  Connector connector2(environment.GetStores(), environment.GetPlatform(), "launch-2");
  ASSERT_EQ(FakePlatform::CLIENT_ID, connector2.GetRegistration().GetClientId());

  // The registration was removed after the launch
  claims[JWT_CLAIM_ISS] = "https://unknown.example.org";
  environment.StoreLaunch("launch-3", claims);

  try
  {
    Connector connector3(environment.GetStores(), environment.GetPlatform(), "launch-3");
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_UnknownResource, e);
  }
}


TEST(Connector, ExpiredLaunch)
{
  ConnectorEnvironment environment;

  Json::Value claims;
  environment.GetPlatform().FormatLaunchClaims(claims, "nonce-1");

  std::string raw;
  Orthanc::Toolbox::WriteFastJson(raw, claims);
  environment.GetStore().StoreLaunchData("launch-1", raw, static_cast<int64_t>(time(NULL)) - 1);

  ASSERT_THROW(Connector c(environment.GetStores(), environment.GetPlatform(), "launch-1"), Orthanc::OrthancException);
}


TEST(AccessTokenManager, ClientAssertion)
{
  RSAPrivateKey key;
  key.Generate();

  Registration registration(FakePlatform::ISSUER, FakePlatform::CLIENT_ID, FakePlatform::TOKEN_URL,
                            FakePlatform::AUTH_URL, FakePlatform::KEYS_URL, FakePlatform::TARGET_LINK_URL);

  std::string assertion;
  AccessTokenManager::ForgeClientAssertion(assertion, registration, key, "tool-key", 10000);

  JWT jwt(assertion);
  ASSERT_EQ("tool-key", jwt.GetKeyId());

  RSAPublicKey publicKey;
  publicKey.LoadFromPrivate(key);
  ASSERT_TRUE(jwt.VerifySignature(publicKey));

  const Json::Value& payload = jwt.GetPayload();
  ASSERT_EQ(FakePlatform::CLIENT_ID, payload[JWT_CLAIM_ISS].asString());
  ASSERT_EQ(FakePlatform::CLIENT_ID, payload[JWT_CLAIM_SUB].asString());
  ASSERT_EQ(FakePlatform::TOKEN_URL, payload[JWT_CLAIM_AUD].asString());
  ASSERT_EQ(10000 - 120, payload[JWT_CLAIM_IAT].asInt64());
  ASSERT_EQ(10000 + 3600, payload[JWT_CLAIM_EXP].asInt64());
  ASSERT_TRUE(boost::starts_with(payload[JWT_CLAIM_JTI].asString(), "lti-service-token"));

  std::string other;
  AccessTokenManager::ForgeClientAssertion(other, registration, key, "tool-key", 10000);
  ASSERT_NE(JWT(other).GetPayload()[JWT_CLAIM_JTI].asString(), payload[JWT_CLAIM_JTI].asString());
}


TEST(AccessTokenManager, Cache)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  ASSERT_TRUE(connector->HasSigningKey());

  connector->ObtainAccessToken(CreateScopes(LTI_SCOPE_AGS_SCORE, LTI_SCOPE_AGS_RESULT_READONLY));
  ASSERT_EQ("token-1", connector->GetAccessToken().GetToken());
  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());

  // Scopes are space-separated, in a canonical order
  ASSERT_EQ(std::string(LTI_SCOPE_AGS_RESULT_READONLY) + " " + LTI_SCOPE_AGS_SCORE,
            environment.GetPlatform().GetLastScope());

  connector->ObtainAccessToken(CreateScopes(LTI_SCOPE_AGS_RESULT_READONLY, LTI_SCOPE_AGS_SCORE));
  ASSERT_EQ("token-1", connector->GetAccessToken().GetToken());
  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());

  // The cache is shared by the connectors of all the launches
  environment.StoreLaunch("launch-2");
  std::unique_ptr<Connector> connector2(environment.CreateConnector("launch-2"));
  connector2->ObtainAccessToken(CreateScopes(LTI_SCOPE_AGS_SCORE, LTI_SCOPE_AGS_RESULT_READONLY));
  ASSERT_EQ("token-1", connector2->GetAccessToken().GetToken());
  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());

  // Another set of scopes needs another token
  connector->ObtainAccessToken(CreateScopes(LTI_SCOPE_AGS_SCORE, LTI_SCOPE_AGS_LINE_ITEM));
  ASSERT_EQ("token-2", connector->GetAccessToken().GetToken());
  ASSERT_EQ(2u, environment.GetPlatform().GetTokenCount());

  AccessToken cached;
  ASSERT_EQ(AccessTokenStatus_Valid, environment.GetStore().LookupAccessToken(
              cached, FakePlatform::TOKEN_URL, FakePlatform::CLIENT_ID,
              CreateScopes(LTI_SCOPE_AGS_SCORE, LTI_SCOPE_AGS_LINE_ITEM), time(NULL)));
  ASSERT_EQ("token-2", cached.GetToken());
}


TEST(AccessTokenManager, Expiration)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");
  environment.GetPlatform().SetTokenLifetime(0);

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));

  const std::set<std::string> scopes = CreateScopes(LTI_SCOPE_AGS_SCORE, LTI_SCOPE_AGS_RESULT_READONLY);
  connector->ObtainAccessToken(scopes);
  ASSERT_EQ("token-1", connector->GetAccessToken().GetToken());

  connector->ObtainAccessToken(scopes);
  ASSERT_EQ("token-2", connector->GetAccessToken().GetToken());
  ASSERT_EQ(2u, environment.GetPlatform().GetTokenCount());

  environment.GetPlatform().SetTokenLifetime(3600);
  connector->ObtainAccessToken(scopes);
  connector->ObtainAccessToken(scopes);
  ASSERT_EQ("token-3", connector->GetAccessToken().GetToken());
  ASSERT_EQ(3u, environment.GetPlatform().GetTokenCount());
}


TEST(AccessTokenManager, Errors)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  const std::set<std::string> scopes = CreateScopes(LTI_SCOPE_AGS_SCORE, LTI_SCOPE_AGS_RESULT_READONLY);

  {
    // No private key to sign the client assertion
    Connector connector(environment.GetStores(), environment.GetPlatform(), "launch-1");

    try
    {
      connector.ObtainAccessToken(scopes);
      FAIL();
    }
    catch (Orthanc::OrthancException& e)
    {
      CheckErrorCode(Orthanc::ErrorCode_IncompatibleConfigurations, e);
    }

    ASSERT_EQ(0u, environment.GetPlatform().GetTokenCount());
  }

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));

  try
  {
    connector->ObtainAccessToken(std::set<std::string>());
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_ParameterOutOfRange, e);
  }

  environment.GetPlatform().SetTokenStatus(401);

  try
  {
    connector->ObtainAccessToken(scopes);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_NetworkProtocol, e);
  }

  // Client assertion signed by a key that is unknown to the platform
  environment.GetPlatform().SetTokenStatus(200);

  RSAPrivateKey other;
  other.Generate();

  std::string pem;
  other.SerializePrivate(pem);
  connector->SetSigningKey("tool-key", pem);
  ASSERT_THROW(connector->ObtainAccessToken(scopes), Orthanc::OrthancException);
  ASSERT_EQ(0u, environment.GetPlatform().GetTokenCount());

  // A cached token can be used without the private key
  environment.GetStore().StoreAccessToken(AccessToken(FakePlatform::TOKEN_URL, FakePlatform::CLIENT_ID, scopes,
                                                      "cached-token", static_cast<int64_t>(time(NULL)) + 100));

  Connector withoutKey(environment.GetStores(), environment.GetPlatform(), "launch-1");
  withoutKey.ObtainAccessToken(scopes);
  ASSERT_EQ("cached-token", withoutKey.GetAccessToken().GetToken());
}


TEST(ServiceRequest, Defaults)
{
  ServiceRequest get(Orthanc::HttpMethod_Get, "https://lms/a");
  ASSERT_TRUE(get.GetContentType().empty());
  ASSERT_EQ(MIME_JSON, get.GetAccept());
  ASSERT_EQ(200, get.GetExpectedStatus());
  ASSERT_TRUE(get.GetScopes().empty());

  ServiceRequest post(Orthanc::HttpMethod_Post, "https://lms/a");
  ASSERT_EQ(MIME_JSON, post.GetContentType());
  post.SetContentType(MIME_LTI_SCORE);
  ASSERT_EQ(MIME_LTI_SCORE, post.GetContentType());

  ServiceRequest remove(Orthanc::HttpMethod_Delete, "https://lms/a");
  ASSERT_EQ(200, remove.GetExpectedStatus());
  remove.SetExpectedStatus(204);
  ASSERT_EQ(204, remove.GetExpectedStatus());

  Json::Value body = Json::objectValue;
  body["a"] = 1;
  post.SetJsonBody(body);
  ASSERT_EQ("{\"a\":1}", post.GetBody());

  ServiceResponse response;
  response.SetBody("[1]");

  Json::Value v;
  ASSERT_THROW(response.ParseJsonObject(v), Orthanc::OrthancException);
  response.ParseJsonArray(v);
  ASSERT_EQ(1u, v.size());

  response.SetBody("{");
  ASSERT_THROW(response.ParseJsonArray(v), Orthanc::OrthancException);
}


TEST(Connector, ServiceRequest)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));

  ServiceRequest request(Orthanc::HttpMethod_Get, FakePlatform::LINE_ITEM_URL);
  ServiceResponse response;

  try
  {
    connector->ExecuteServiceRequest(response, request);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_ParameterOutOfRange, e);
  }

  ASSERT_EQ(0u, environment.GetPlatform().GetCallCount(FakePlatform::LINE_ITEM_URL));

  request.AddScope(LTI_SCOPE_AGS_LINE_ITEM_READONLY);
  request.SetAccept(MIME_LTI_LINE_ITEM);
  connector->ExecuteServiceRequest(response, request);
  ASSERT_EQ(MIME_LTI_LINE_ITEM, environment.GetPlatform().GetLastAccept());
  ASSERT_TRUE(environment.GetPlatform().GetLastContentType().empty());

  std::string contentType;
  ASSERT_TRUE(response.LookupHeader(contentType, "Content-Type"));
  ASSERT_EQ(MIME_JSON, contentType);

  Json::Value item;
  response.ParseJsonObject(item);
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, item["id"].asString());

  // Status that is not the expected one
  request.SetExpectedStatus(201);

  try
  {
    connector->ExecuteServiceRequest(response, request);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_NetworkProtocol, e);
  }

  ASSERT_TRUE(response.GetBody().empty());

  request.SetExpectedStatus(200);
  environment.GetPlatform().SetServiceStatus(503);

  try
  {
    connector->ExecuteServiceRequest(response, request);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_NetworkProtocol, e);
  }

  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());
}


TEST(AgsClient, Availability)
{
  ConnectorEnvironment environment;

  Json::Value claims;
  environment.GetPlatform().FormatLaunchClaims(claims, "nonce-1");
  claims.removeMember(LTI_CLAIM_AGS_ENDPOINT);
  environment.StoreLaunch("launch-1", claims);

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));

  try
  {
    AgsClient ags(*connector);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_NotImplemented, e);
  }

  environment.GetPlatform().FormatLaunchClaims(claims, "nonce-1");
  claims[LTI_CLAIM_AGS_ENDPOINT].removeMember("lineitem");
  environment.StoreLaunch("launch-2", claims);

  std::unique_ptr<Connector> connector2(environment.CreateConnector("launch-2"));
  ASSERT_THROW(AgsClient ags(*connector2), Orthanc::OrthancException);
}


TEST(AgsClient, PutScore)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  AgsClient ags(*connector);
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, ags.GetLineItemUri());
  ASSERT_EQ(FakePlatform::LINE_ITEMS_URL, ags.GetLineItemsUri());
  ASSERT_TRUE(ags.HasScope(LTI_SCOPE_AGS_SCORE));

  Score score(8.5, 10);
  score.SetComment("Good reading");
  ags.PutScore(score);

  ASSERT_EQ(MIME_LTI_SCORE, environment.GetPlatform().GetLastContentType());
  ASSERT_EQ(std::string(LTI_SCOPE_AGS_SCORE), environment.GetPlatform().GetLastScope());

  const Json::Value& scores = environment.GetPlatform().GetScores();
  ASSERT_EQ(1u, scores.size());
  ASSERT_EQ("user-1", scores[0]["userId"].asString());  // Subject of the launch
  ASSERT_DOUBLE_EQ(8.5, scores[0]["scoreGiven"].asDouble());
  ASSERT_DOUBLE_EQ(10, scores[0]["scoreMaximum"].asDouble());
  ASSERT_EQ("Good reading", scores[0]["comment"].asString());
  ASSERT_EQ("Completed", scores[0]["activityProgress"].asString());
  ASSERT_EQ("FullyGraded", scores[0]["gradingProgress"].asString());
  ASSERT_TRUE(boost::ends_with(scores[0]["timestamp"].asString(), "Z"));

  Score other;
  other.SetScore(1, 2);
  other.SetUserId("user-7");
  other.SetActivityProgress(ActivityProgress_Submitted);
  other.SetGradingProgress(GradingProgress_Pending);
  other.SetTimestamp("2026-01-01T10:00:00Z");
  ags.PutScore(other);

  ASSERT_EQ(2u, scores.size());
  ASSERT_EQ("user-7", scores[1]["userId"].asString());
  ASSERT_EQ("Submitted", scores[1]["activityProgress"].asString());
  ASSERT_EQ("Pending", scores[1]["gradingProgress"].asString());
  ASSERT_EQ("2026-01-01T10:00:00Z", scores[1]["timestamp"].asString());

  // Same scope for both calls, a single token exchange
  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());
}


TEST(AgsClient, Results)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  environment.GetPlatform().AddResult("user-1", 5, 10);
  environment.GetPlatform().AddResult("user-2", 6, 10);
  environment.GetPlatform().AddResult("user-3", 7, 10);
  environment.GetPlatform().AddResult("user-2", 8, 10);
  environment.GetPlatform().AddResult("user-4", 9, 10);

  const std::string resultsUrl = std::string(FakePlatform::LINE_ITEM_URL) + "/results";

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  AgsClient ags(*connector);

  // Walk over 3 pages of 2 results
  std::list<Result> results;
  ags.GetResults(results);
  ASSERT_EQ(5u, results.size());
  ASSERT_EQ(3u, environment.GetPlatform().GetCallCount(resultsUrl));
  ASSERT_EQ(MIME_LTI_RESULT_CONTAINER, environment.GetPlatform().GetLastAccept());
  ASSERT_EQ("user-1", results.front().GetUserId());
  ASSERT_DOUBLE_EQ(5, results.front().GetResultScore());
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, results.front().GetScoreOf());
  ASSERT_EQ("user-4", results.back().GetUserId());
  ASSERT_DOUBLE_EQ(10, results.back().GetResultMaximum());

  ags.GetUserResults(results, "user-2");
  ASSERT_EQ(2u, results.size());
  ASSERT_DOUBLE_EQ(6, results.front().GetResultScore());
  ASSERT_DOUBLE_EQ(8, results.back().GetResultScore());

  ags.GetUserResults(results, "nobody");
  ASSERT_TRUE(results.empty());

  ASSERT_THROW(ags.GetUserResults(results, ""), Orthanc::OrthancException);

  // Explicit paging with a limit
  std::string cursor;
  std::list<Result> page;
  ASSERT_TRUE(ags.GetPagedResults(page, cursor, 3, ""));
  ASSERT_EQ(3u, page.size());
  ASSERT_FALSE(cursor.empty());
  ASSERT_NE(std::string::npos, cursor.find("limit=3"));

  ASSERT_FALSE(ags.GetPagedResults(page, cursor, 3, ""));
  ASSERT_EQ(2u, page.size());
  ASSERT_TRUE(cursor.empty());
  ASSERT_EQ("user-4", page.back().GetUserId());

  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());
}


TEST(AgsClient, LineItems)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  AgsClient ags(*connector);

  LineItem item;
  ags.GetLineItem(item, "");
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, item.GetId());
  ASSERT_EQ("Chest CT reading", item.GetLabel());
  ASSERT_DOUBLE_EQ(100, item.GetScoreMaximum());
  ASSERT_EQ(MIME_LTI_LINE_ITEM, environment.GetPlatform().GetLastAccept());

  std::list<LineItem> items;
  ags.GetLineItems(items);
  ASSERT_EQ(1u, items.size());
  ASSERT_EQ(MIME_LTI_LINE_ITEM_CONTAINER, environment.GetPlatform().GetLastAccept());

  LineItem request;
  request.SetLabel("MRI reading");
  request.SetScoreMaximum(20);
  request.SetTag("mri");
  request.SetResourceLinkId("resource-1");

  LineItem created;
  ags.CreateLineItem(created, request);
  ASSERT_EQ(std::string(FakePlatform::LINE_ITEMS_URL) + "/2", created.GetId());
  ASSERT_EQ("MRI reading", created.GetLabel());
  ASSERT_EQ("mri", created.GetTag());
  ASSERT_DOUBLE_EQ(20, created.GetScoreMaximum());
  ASSERT_EQ(MIME_LTI_LINE_ITEM, environment.GetPlatform().GetLastContentType());
  ASSERT_EQ(2u, environment.GetPlatform().GetLineItemsCount());

  LineItem fetched;
  ags.GetLineItem(fetched, created.GetId());
  ASSERT_EQ(created.GetId(), fetched.GetId());
  ASSERT_EQ("MRI reading", fetched.GetLabel());
  ASSERT_DOUBLE_EQ(20, fetched.GetScoreMaximum());
  ASSERT_EQ("mri", fetched.GetTag());
  ASSERT_EQ("resource-1", fetched.GetResourceLinkId());
  ASSERT_EQ(MIME_LTI_LINE_ITEM, environment.GetPlatform().GetLastAccept());

  ags.GetLineItems(items);
  ASSERT_EQ(2u, items.size());

  LineItem modified = created;
  modified.SetLabel("MRI reading (updated)");

  LineItem updated;
  ags.UpdateLineItem(updated, modified, created.GetId());
  ASSERT_EQ(created.GetId(), updated.GetId());
  ASSERT_EQ("MRI reading (updated)", updated.GetLabel());

  // Without an explicit URI, the line item of the launch is targeted
  modified.SetLabel("Chest CT reading (updated)");
  ags.UpdateLineItem(updated, modified, "");
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, updated.GetId());
  ASSERT_EQ("Chest CT reading (updated)", updated.GetLabel());

  ags.DeleteLineItem(created.GetId());
  ASSERT_EQ(1u, environment.GetPlatform().GetLineItemsCount());

  ags.GetLineItems(items);
  ASSERT_EQ(1u, items.size());
  ASSERT_EQ(FakePlatform::LINE_ITEM_URL, items.front().GetId());

  // Deleting again fails, as the platform answers with 404
  ASSERT_THROW(ags.DeleteLineItem(created.GetId()), Orthanc::OrthancException);
  ASSERT_THROW(ags.GetLineItem(fetched, created.GetId()), Orthanc::OrthancException);
}


TEST(AgsClient, Scopes)
{
  ConnectorEnvironment environment;

  Json::Value claims;
  environment.GetPlatform().FormatLaunchClaims(claims, "nonce-1");
  claims[LTI_CLAIM_AGS_ENDPOINT]["scope"] = Json::arrayValue;
  claims[LTI_CLAIM_AGS_ENDPOINT]["scope"].append(LTI_SCOPE_AGS_SCORE);
  claims[LTI_CLAIM_AGS_ENDPOINT]["scope"].append(LTI_SCOPE_AGS_LINE_ITEM);
  environment.StoreLaunch("launch-1", claims);

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  AgsClient ags(*connector);
  ASSERT_FALSE(ags.HasScope(LTI_SCOPE_AGS_RESULT_READONLY));

  std::list<Result> results;

  try
  {
    ags.GetResults(results);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_NotImplemented, e);
  }

  ASSERT_EQ(0u, environment.GetPlatform().GetTokenCount());

  // The read-write scope grants read access to the line items
  LineItem item;
  ags.GetLineItem(item, "");
  ASSERT_EQ(std::string(LTI_SCOPE_AGS_LINE_ITEM), environment.GetPlatform().GetLastScope());

  // Read-only launch
  claims[LTI_CLAIM_AGS_ENDPOINT]["scope"] = Json::arrayValue;
  claims[LTI_CLAIM_AGS_ENDPOINT]["scope"].append(LTI_SCOPE_AGS_LINE_ITEM_READONLY);
  environment.StoreLaunch("launch-2", claims);

  std::unique_ptr<Connector> connector2(environment.CreateConnector("launch-2"));
  AgsClient readOnly(*connector2);

  readOnly.GetLineItem(item, "");
  ASSERT_THROW(readOnly.CreateLineItem(item, item), Orthanc::OrthancException);
  ASSERT_THROW(readOnly.DeleteLineItem(""), Orthanc::OrthancException);
  ASSERT_THROW(readOnly.PutScore(Score(1, 1)), Orthanc::OrthancException);
  ASSERT_EQ(1u, environment.GetPlatform().GetLineItemsCount());
}


TEST(AgsModels, Serialization)
{
  ASSERT_THROW(Score(-1, 10), Orthanc::OrthancException);
  ASSERT_THROW(Score(1, -10), Orthanc::OrthancException);

  Score score;
  ASSERT_EQ(ActivityProgress_Completed, score.GetActivityProgress());
  ASSERT_EQ(GradingProgress_FullyGraded, score.GetGradingProgress());

  Json::Value source = Json::objectValue;
  source["scoreGiven"] = 3;
  source["scoreMaximum"] = 4.5;
  source["activityProgress"] = "InProgress";
  source["gradingProgress"] = "PendingManual";
  source["userId"] = "user-9";

  Score::Unserialize(score, source);
  ASSERT_DOUBLE_EQ(3, score.GetScoreGiven());
  ASSERT_DOUBLE_EQ(4.5, score.GetScoreMaximum());
  ASSERT_EQ(ActivityProgress_InProgress, score.GetActivityProgress());
  ASSERT_EQ(GradingProgress_PendingManual, score.GetGradingProgress());
  ASSERT_EQ("user-9", score.GetUserId());

  source["activityProgress"] = "Sleeping";
  ASSERT_THROW(Score::Unserialize(score, source), Orthanc::OrthancException);

  source["activityProgress"] = "InProgress";
  source["scoreGiven"] = "three";
  ASSERT_THROW(Score::Unserialize(score, source), Orthanc::OrthancException);

  LineItem item;
  item.SetLabel("label");

  Json::Value serialized;
  item.Serialize(serialized);
  ASSERT_EQ(1u, serialized.size());
  ASSERT_EQ("label", serialized["label"].asString());

  Result result;
  ASSERT_THROW(Result::Unserialize(result, Json::arrayValue), Orthanc::OrthancException);
}


TEST(NrpsClient, Membership)
{
  ConnectorEnvironment environment;
  environment.StoreLaunch("launch-1");

  environment.GetPlatform().AddMember("user-1", "Jane Doe", "http://purl.imsglobal.org/vocab/lis/v2/membership#Learner");
  environment.GetPlatform().AddMember("user-2", "John Roe", "http://purl.imsglobal.org/vocab/lis/v2/membership#Learner");
  environment.GetPlatform().AddMember("user-3", "Ann Poe", "http://purl.imsglobal.org/vocab/lis/v2/membership#Instructor");
  environment.GetPlatform().AddMember("user-4", "Bob Loe", "http://purl.imsglobal.org/vocab/lis/v2/membership#Learner");
  environment.GetPlatform().AddMember("user-5", "Eve Moe", "http://purl.imsglobal.org/vocab/lis/v2/membership#Learner");

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  NrpsClient nrps(*connector);
  ASSERT_EQ(FakePlatform::MEMBERSHIPS_URL, nrps.GetMembershipsUrl());

  Membership membership;
  nrps.GetMembership(membership);
  ASSERT_EQ(FakePlatform::MEMBERSHIPS_URL, membership.GetId());
  ASSERT_EQ("course-1", membership.GetContextId());
  ASSERT_EQ("RAD101", membership.GetContextLabel());
  ASSERT_EQ("Introduction to radiology", membership.GetContextTitle());
  ASSERT_EQ(5u, membership.GetMembers().size());
  ASSERT_EQ("user-1", membership.GetMembers().front().GetUserId());
  ASSERT_EQ("Jane Doe", membership.GetMembers().front().GetName());
  ASSERT_EQ("Active", membership.GetMembers().front().GetStatus());
  ASSERT_EQ(1u, membership.GetMembers().front().GetRoles().size());
  ASSERT_EQ(MIME_LTI_MEMBERSHIP_CONTAINER, environment.GetPlatform().GetLastAccept());
  ASSERT_EQ(std::string(LTI_SCOPE_NRPS_MEMBERSHIP_READONLY), environment.GetPlatform().GetLastScope());

  // Walk over the pages, accumulating the members
  Membership all;
  std::string cursor;
  unsigned int pages = 0;
  bool hasMore;

  do
  {
    Membership page;
    hasMore = nrps.GetPagedMembership(page, cursor, 2);
    ASSERT_LE(page.GetMembers().size(), 2u);
    all.AppendMembers(page);
    pages++;
  }
  while (hasMore);

  ASSERT_EQ(3u, pages);
  ASSERT_TRUE(cursor.empty());
  ASSERT_EQ(5u, all.GetMembers().size());
  ASSERT_EQ("user-5", all.GetMembers().back().GetUserId());

  Membership page;
  try
  {
    nrps.GetPagedMembership(page, cursor, 0);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_ParameterOutOfRange, e);
  }

  ASSERT_EQ(1u, environment.GetPlatform().GetTokenCount());
}


TEST(NrpsClient, LaunchingMember)
{
  ConnectorEnvironment environment;

  Json::Value claims;
  environment.GetPlatform().FormatLaunchClaims(claims, "nonce-1");
  environment.StoreLaunch("launch-1", claims);

  std::unique_ptr<Connector> connector(environment.CreateConnector("launch-1"));
  NrpsClient nrps(*connector);

  Member member;
  nrps.GetLaunchingMember(member);
  ASSERT_EQ("user-1", member.GetUserId());
  ASSERT_EQ("Jane Doe", member.GetName());
  ASSERT_EQ("Jane", member.GetGivenName());
  ASSERT_EQ("Doe", member.GetFamilyName());
  ASSERT_EQ("jane.doe@example.org", member.GetEmail());
  ASSERT_TRUE(member.GetRoles().empty());

  // No call to the platform
  ASSERT_EQ(0u, environment.GetPlatform().GetTokenCount());
  ASSERT_EQ(0u, environment.GetPlatform().GetCallCount(FakePlatform::MEMBERSHIPS_URL));

  claims.removeMember("email");
  environment.StoreLaunch("launch-2", claims);

  std::unique_ptr<Connector> connector2(environment.CreateConnector("launch-2"));
  NrpsClient nrps2(*connector2);

  try
  {
    nrps2.GetLaunchingMember(member);
    FAIL();
  }
  catch (Orthanc::OrthancException& e)
  {
    CheckErrorCode(Orthanc::ErrorCode_BadFileFormat, e);
  }

  // NRPS is not enabled for this launch
  claims.removeMember(LTI_CLAIM_NRPS);
  environment.StoreLaunch("launch-3", claims);

  std::unique_ptr<Connector> connector3(environment.CreateConnector("launch-3"));
  ASSERT_THROW(NrpsClient c(*connector3), Orthanc::OrthancException);
}


TEST(NrpsModels, Serialization)
{
  Json::Value source = Json::objectValue;
  source["name"] = "Jane";

  Member member;
  ASSERT_THROW(Member::Unserialize(member, source), Orthanc::OrthancException);  // No "user_id"

  source["user_id"] = "user-1";
  source["roles"] = Json::arrayValue;
  source["roles"].append("Learner");
  source["roles"].append("Mentor");
  Member::Unserialize(member, source);
  ASSERT_EQ("user-1", member.GetUserId());
  ASSERT_EQ(2u, member.GetRoles().size());

  Json::Value serialized;
  member.Serialize(serialized);
  ASSERT_EQ("Jane", serialized["name"].asString());
  ASSERT_EQ(2u, serialized["roles"].size());

  Membership membership;
  Json::Value container = Json::objectValue;
  container["members"] = "nope";
  ASSERT_THROW(Membership::Unserialize(membership, container), Orthanc::OrthancException);
}
