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

#include "../Sources/Datastore/MemoryDatastore.h"
#include "../Sources/Datastore/SQLiteDatastore.h"
#include "../Sources/LtiConfiguration.h"

#include <OrthancException.h>
#include <TemporaryFile.h>

#include <gtest/gtest.h>
#include <time.h>


static const char* const ISSUER = "https://platform.example.org";


static Registration CreateRegistration(const std::string& issuer,
                                       const std::string& clientId)
{
  return Registration(issuer, clientId, issuer + "/token", issuer + "/auth",
                      issuer + "/jwks", "https://tool.example.org/lti/launch");
}


static std::set<std::string> CreateScopes(const std::string& a,
                                          const std::string& b)
{
  std::set<std::string> scopes;
  scopes.insert(a);
  scopes.insert(b);
  return scopes;
}


static void CheckRegistrations(IRegistrationStore& store)
{
  Registration r;
  ASSERT_FALSE(store.LookupRegistration(r, ISSUER, "client-1"));
  ASSERT_FALSE(store.LookupUniqueRegistration(r, ISSUER));

  store.StoreRegistration(CreateRegistration(ISSUER, "client-1"));
  ASSERT_TRUE(store.LookupRegistration(r, ISSUER, "client-1"));
  ASSERT_EQ(ISSUER, r.GetIssuer());
  ASSERT_EQ("client-1", r.GetClientId());
  ASSERT_EQ("https://platform.example.org/token", r.GetTokenUri());
  ASSERT_EQ("https://platform.example.org/auth", r.GetAuthLoginUri());
  ASSERT_EQ("https://platform.example.org/jwks", r.GetKeySetUri());
  ASSERT_EQ("https://tool.example.org/lti/launch", r.GetTargetLinkUri());
  ASSERT_FALSE(store.LookupRegistration(r, ISSUER, "client-2"));
  ASSERT_FALSE(store.LookupRegistration(r, "https://other.example.org", "client-1"));

  ASSERT_TRUE(store.LookupUniqueRegistration(r, ISSUER));
  ASSERT_EQ("client-1", r.GetClientId());

  store.StoreRegistration(CreateRegistration("https://other.example.org", "client-3"));
  ASSERT_TRUE(store.LookupUniqueRegistration(r, ISSUER));
  ASSERT_EQ("client-1", r.GetClientId());

  store.StoreRegistration(CreateRegistration(ISSUER, "client-2"));
  ASSERT_FALSE(store.LookupUniqueRegistration(r, ISSUER));  // Ambiguous
  ASSERT_TRUE(store.LookupRegistration(r, ISSUER, "client-2"));

  // Replacement of an existing registration
  store.StoreRegistration(Registration(ISSUER, "client-1", "https://platform.example.org/token2",
                                       "https://platform.example.org/auth", "https://platform.example.org/jwks",
                                       "https://tool.example.org/lti/launch"));
  ASSERT_TRUE(store.LookupRegistration(r, ISSUER, "client-1"));
  ASSERT_EQ("https://platform.example.org/token2", r.GetTokenUri());

  ASSERT_THROW(store.StoreRegistration(Registration(ISSUER, "", "https://a", "https://a", "https://a", "https://a")),
               Orthanc::OrthancException);
  ASSERT_THROW(store.StoreRegistration(Registration(ISSUER, "c", "ftp://a", "https://a", "https://a", "https://a")),
               Orthanc::OrthancException);
}


static void CheckDeployments(IRegistrationStore& store)
{
  ASSERT_FALSE(store.HasDeployment(ISSUER, "deployment-1"));

  store.StoreDeployment(ISSUER, "deployment-1");
  store.StoreDeployment(ISSUER, "deployment-1");
  ASSERT_TRUE(store.HasDeployment(ISSUER, "deployment-1"));
  ASSERT_FALSE(store.HasDeployment(ISSUER, "deployment-2"));
  ASSERT_FALSE(store.HasDeployment("https://other.example.org", "deployment-1"));

  ASSERT_THROW(store.StoreDeployment(ISSUER, ""), Orthanc::OrthancException);
  ASSERT_THROW(store.StoreDeployment(ISSUER, std::string(256, 'a')), Orthanc::OrthancException);
  store.StoreDeployment(ISSUER, std::string(255, 'a'));
  ASSERT_TRUE(store.HasDeployment(ISSUER, std::string(255, 'a')));
}


static void CheckNonces(INonceStore& store)
{
  const std::string uri = "https://tool.example.org/lti/launch";

  ASSERT_EQ(NonceStatus_NotFound, store.TestAndClearNonce("nonce-1", uri));

  store.StoreNonce("nonce-1", uri);
  store.StoreNonce("nonce-2", uri);
  ASSERT_EQ(NonceStatus_Valid, store.TestAndClearNonce("nonce-1", uri));
  ASSERT_EQ(NonceStatus_NotFound, store.TestAndClearNonce("nonce-1", uri));  // Single use

  // A mismatch also consumes the nonce
  ASSERT_EQ(NonceStatus_TargetLinkUriMismatch, store.TestAndClearNonce("nonce-2", "https://evil.example.org/"));
  ASSERT_EQ(NonceStatus_NotFound, store.TestAndClearNonce("nonce-2", uri));

  ASSERT_THROW(store.StoreNonce("", uri), Orthanc::OrthancException);
}


static void CheckLaunchData(ILaunchDataStore& store)
{
  const int64_t now = time(NULL);

  std::string claims;
  ASSERT_FALSE(store.LookupLaunchData(claims, "launch-1", now));

  store.StoreLaunchData("launch-1", "{\"sub\":\"user-1\"}", now + 100);
  ASSERT_TRUE(store.LookupLaunchData(claims, "launch-1", now));
  ASSERT_EQ("{\"sub\":\"user-1\"}", claims);

  ASSERT_TRUE(store.LookupLaunchData(claims, "launch-1", now + 99));
  ASSERT_FALSE(store.LookupLaunchData(claims, "launch-1", now + 100));
  ASSERT_FALSE(store.LookupLaunchData(claims, "launch-2", now));

  ASSERT_THROW(store.StoreLaunchData("", "{}", now + 100), Orthanc::OrthancException);
}


static void CheckAccessTokens(IAccessTokenStore& store)
{
  const int64_t now = time(NULL);
  const std::set<std::string> scopes = CreateScopes("scope-b", "scope-a");

  AccessToken token;
  ASSERT_EQ(AccessTokenStatus_NotFound, store.LookupAccessToken(token, "https://lms/token", "client", scopes, now));

  store.StoreAccessToken(AccessToken("https://lms/token", "client", scopes, "token-1", now + 100));
  ASSERT_EQ(AccessTokenStatus_Valid, store.LookupAccessToken(token, "https://lms/token", "client", scopes, now));
  ASSERT_EQ("token-1", token.GetToken());
  ASSERT_EQ(now + 100, token.GetExpiration());
  ASSERT_EQ(2u, token.GetScopes().size());

  ASSERT_EQ(AccessTokenStatus_Valid, store.LookupAccessToken(token, "https://lms/token", "client",
                                                             CreateScopes("scope-a", "scope-b"), now));
  ASSERT_EQ(AccessTokenStatus_NotFound, store.LookupAccessToken(token, "https://lms/token", "client",
                                                                CreateScopes("scope-a", "scope-c"), now));
  ASSERT_EQ(AccessTokenStatus_NotFound, store.LookupAccessToken(token, "https://lms/token", "other", scopes, now));
  ASSERT_EQ(AccessTokenStatus_Expired, store.LookupAccessToken(token, "https://lms/token", "client", scopes, now + 100));

  store.StoreAccessToken(AccessToken("https://lms/token", "client", scopes, "token-2", now + 200));
  ASSERT_EQ(AccessTokenStatus_Valid, store.LookupAccessToken(token, "https://lms/token", "client", scopes, now + 100));
  ASSERT_EQ("token-2", token.GetToken());
}


TEST(AccessToken, Scopes)
{
  std::set<std::string> scopes;
  AccessToken::ParseScopes(scopes, "  b a  c b ");
  ASSERT_EQ(3u, scopes.size());
  ASSERT_EQ("a b c", AccessToken::FormatScopes(scopes));

  AccessToken::ParseScopes(scopes, "");
  ASSERT_TRUE(scopes.empty());
  ASSERT_EQ("", AccessToken::FormatScopes(scopes));

  ASSERT_EQ(AccessToken::FormatCacheKey("uri", "client", CreateScopes("x", "y")),
            AccessToken::FormatCacheKey("uri", "client", CreateScopes("y", "x")));
  ASSERT_NE(AccessToken::FormatCacheKey("uri", "client", CreateScopes("x", "y")),
            AccessToken::FormatCacheKey("uri", "client2", CreateScopes("x", "y")));

  ASSERT_THROW(AccessToken("uri", "client", scopes, "token", 100), Orthanc::OrthancException);

  AccessToken token("uri", "client", CreateScopes("x", "y"), "token", 100);
  ASSERT_FALSE(token.IsExpired(99));
  ASSERT_TRUE(token.IsExpired(100));
}


TEST(Registration, Unserialize)
{
  Json::Value source = Json::objectValue;
  source["Issuer"] = ISSUER;
  source["ClientId"] = "client-1";
  source["TokenUrl"] = "https://platform.example.org/token";
  source["AuthenticationUrl"] = "https://platform.example.org/auth";
  source["KeySetUrl"] = "https://platform.example.org/jwks";
  source["TargetLinkUrl"] = "https://tool.example.org/lti/launch";

  Registration r;
  r.Unserialize(source);
  ASSERT_EQ("client-1", r.GetClientId());
  ASSERT_EQ("https://platform.example.org/jwks", r.GetKeySetUri());

  source["KeySetUrl"] = "jwks";
  ASSERT_THROW(r.Unserialize(source), Orthanc::OrthancException);

  source.removeMember("KeySetUrl");
  ASSERT_THROW(r.Unserialize(source), Orthanc::OrthancException);
}


TEST(MemoryDatastore, Registrations)
{
  MemoryDatastore store;
  CheckRegistrations(store);
  CheckDeployments(store);
}


TEST(MemoryDatastore, Nonces)
{
  MemoryDatastore store;
  CheckNonces(store);

  ASSERT_THROW(store.SetMaxPendingNonces(0), Orthanc::OrthancException);
  store.SetMaxPendingNonces(2);

  const std::string uri = "https://tool.example.org/lti/launch";
  store.StoreNonce("a", uri);
  store.StoreNonce("b", uri);
  store.StoreNonce("c", uri);
  ASSERT_EQ(NonceStatus_NotFound, store.TestAndClearNonce("a", uri));  // Oldest one was discarded
  ASSERT_EQ(NonceStatus_Valid, store.TestAndClearNonce("b", uri));
  ASSERT_EQ(NonceStatus_Valid, store.TestAndClearNonce("c", uri));
}


TEST(MemoryDatastore, LaunchData)
{
  MemoryDatastore store;
  CheckLaunchData(store);
}


TEST(MemoryDatastore, AccessTokens)
{
  MemoryDatastore store;
  CheckAccessTokens(store);
}


TEST(SQLiteDatastore, Registrations)
{
  SQLiteDatastore store;
  CheckRegistrations(store);
  CheckDeployments(store);
}


TEST(SQLiteDatastore, Nonces)
{
  SQLiteDatastore store;
  CheckNonces(store);
}


TEST(SQLiteDatastore, LaunchData)
{
  SQLiteDatastore store;
  CheckLaunchData(store);
}


TEST(SQLiteDatastore, AccessTokens)
{
  SQLiteDatastore store;
  CheckAccessTokens(store);
}


TEST(SQLiteDatastore, Persistence)
{
  Orthanc::TemporaryFile database;

  {
    SQLiteDatastore store(database.GetPath());
    store.StoreRegistration(CreateRegistration(ISSUER, "client-1"));
    store.StoreDeployment(ISSUER, "deployment-1");
    store.StoreNonce("nonce-1", "https://tool.example.org/lti/launch");
  }

  {
    // Shared with another process opening the same file
    SQLiteDatastore store(database.GetPath());

    Registration r;
    ASSERT_TRUE(store.LookupRegistration(r, ISSUER, "client-1"));
    ASSERT_TRUE(store.HasDeployment(ISSUER, "deployment-1"));
    ASSERT_EQ(NonceStatus_Valid, store.TestAndClearNonce("nonce-1", "https://tool.example.org/lti/launch"));
  }

  {
    SQLiteDatastore store(database.GetPath());
    ASSERT_EQ(NonceStatus_NotFound, store.TestAndClearNonce("nonce-1", "https://tool.example.org/lti/launch"));
  }
}


TEST(LtiConfiguration, Registrations)
{
  Json::Value platform = Json::objectValue;
  platform["Issuer"] = ISSUER;
  platform["ClientId"] = "client-1";
  platform["TokenUrl"] = "https://platform.example.org/token";
  platform["AuthenticationUrl"] = "https://platform.example.org/auth";
  platform["KeySetUrl"] = "https://platform.example.org/jwks";
  platform["TargetLinkUrl"] = "https://tool.example.org/lti/launch";
  platform["Deployments"] = Json::arrayValue;
  platform["Deployments"].append("deployment-1");
  platform["Deployments"].append("deployment-2");

  Json::Value registrations = Json::arrayValue;
  registrations.append(platform);

  MemoryDatastore store;
  LtiConfiguration::LoadRegistrations(store, registrations);

  Registration r;
  ASSERT_TRUE(store.LookupRegistration(r, ISSUER, "client-1"));
  ASSERT_EQ("https://platform.example.org/token", r.GetTokenUri());
  ASSERT_TRUE(store.HasDeployment(ISSUER, "deployment-1"));
  ASSERT_TRUE(store.HasDeployment(ISSUER, "deployment-2"));
  ASSERT_FALSE(store.HasDeployment(ISSUER, "deployment-3"));

  ASSERT_THROW(LtiConfiguration::LoadRegistrations(store, platform), Orthanc::OrthancException);

  // Deployment IDs are limited to 255 characters
  registrations[0]["ClientId"] = "client-2";
  registrations[0]["Deployments"].append(std::string(256, 'a'));

  MemoryDatastore other;
  ASSERT_THROW(LtiConfiguration::LoadRegistrations(other, registrations), Orthanc::OrthancException);
  ASSERT_FALSE(other.LookupRegistration(r, ISSUER, "client-2"));
}


TEST(LtiConfiguration, Settings)
{
  LtiConfiguration& configuration = LtiConfiguration::GetInstance();

  const std::string root = configuration.GetRoot();
  ASSERT_THROW(configuration.SetRoot("lti"), Orthanc::OrthancException);
  configuration.SetRoot("/tools/lti/");
  ASSERT_EQ("/tools/lti", configuration.GetRoot());
  configuration.SetRoot(root);

  ASSERT_THROW(configuration.SetToolUrl("ftp://tool.example.org/"), Orthanc::OrthancException);
  ASSERT_THROW(configuration.SetHttpTimeout(0), Orthanc::OrthancException);
}
