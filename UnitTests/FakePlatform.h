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

#include "../Sources/Datastore/IRegistrationStore.h"
#include "../Sources/Http/IHttpClient.h"
#include "../Sources/Security/RSAPrivateKey.h"
#include "../Sources/Security/RSAPublicKey.h"

#include <Compatibility.h>  // For std::unique_ptr<>

#include <json/value.h>
#include <set>
#include <vector>


/**
 * Emulation of a LTI 1.3 platform, answering the HTTP requests of the
 * tool without any network access. It publishes its key set, runs a
 * token endpoint, and exposes one course with a line item and a list
 * of members. Collections are paginated using the "Link" header.
 **/
class FakePlatform : public IHttpClient
{
public:
  static const char* const ISSUER;
  static const char* const CLIENT_ID;
  static const char* const DEPLOYMENT_ID;
  static const char* const KEYS_URL;
  static const char* const TOKEN_URL;
  static const char* const AUTH_URL;
  static const char* const TARGET_LINK_URL;
  static const char* const LINE_ITEMS_URL;
  static const char* const LINE_ITEM_URL;
  static const char* const MEMBERSHIPS_URL;

private:
  typedef std::map<std::string, Json::Value>  LineItems;

  RSAPrivateKey                  platformKey_;
  std::string                    platformKeyId_;
  unsigned int                   keyGeneration_;
  std::unique_ptr<RSAPublicKey>  toolKey_;
  uint16_t                       tokenStatus_;
  unsigned int                   tokenLifetime_;
  unsigned int                   tokenCount_;
  std::set<std::string>          issuedTokens_;
  std::string                    lastScope_;
  uint16_t                       serviceStatus_;
  LineItems                      lineItems_;
  unsigned int                   lineItemsCount_;
  Json::Value                    scores_;
  std::vector<Json::Value>       results_;
  unsigned int                   resultsPageSize_;
  std::vector<Json::Value>       members_;
  std::map<std::string, unsigned int>  calls_;
  std::string                    lastAccept_;
  std::string                    lastContentType_;
  unsigned int                   lastTimeout_;

  void AnswerToken(HttpResponse& response,
                   const HttpRequest& request);

  bool IsAuthorized(const HttpRequest& request) const;

  static void AnswerPage(HttpResponse& response,
                         Json::Value& page,
                         const std::vector<Json::Value>& items,
                         const std::string& base,
                         std::map<std::string, std::string> arguments,
                         unsigned int defaultPageSize);

  void AnswerService(HttpResponse& response,
                     const HttpRequest& request,
                     const std::string& base,
                     const std::map<std::string, std::string>& arguments);

public:
  FakePlatform();

  const std::string& GetKeyId() const
  {
    return platformKeyId_;
  }

  // Replaces the signing key of the platform, as after a key rotation
  void RotateKey();

  // Makes the token endpoint verify the client assertions with this key
  void SetToolKey(const RSAPrivateKey& key);

  void SetTokenStatus(uint16_t status)
  {
    tokenStatus_ = status;
  }

  void SetTokenLifetime(unsigned int seconds)
  {
    tokenLifetime_ = seconds;
  }

  unsigned int GetTokenCount() const
  {
    return tokenCount_;
  }

  // The "scope" field of the last accepted token request
  const std::string& GetLastScope() const
  {
    return lastScope_;
  }

  // If non-zero, the services answer with this HTTP status
  void SetServiceStatus(uint16_t status)
  {
    serviceStatus_ = status;
  }

  void SetResultsPageSize(unsigned int size)
  {
    resultsPageSize_ = size;
  }

  void AddResult(const std::string& userId,
                 double score,
                 double maximum);

  void AddMember(const std::string& userId,
                 const std::string& name,
                 const std::string& role);

  const Json::Value& GetScores() const
  {
    return scores_;
  }

  size_t GetLineItemsCount() const
  {
    return lineItems_.size();
  }

  // Number of requests received for the given URL, ignoring the query string
  unsigned int GetCallCount(const std::string& url) const;

  const std::string& GetLastAccept() const
  {
    return lastAccept_;
  }

  const std::string& GetLastContentType() const
  {
    return lastContentType_;
  }

  // Timeout of the last request, whatever its URL
  unsigned int GetLastTimeout() const
  {
    return lastTimeout_;
  }

  // Registers the platform and its deployment into the store of the tool
  void Register(IRegistrationStore& store) const;

  // Claims of a valid resource link launch, with AGS and NRPS enabled
  void FormatLaunchClaims(Json::Value& target,
                          const std::string& nonce) const;

  void ForgeIdToken(std::string& token,
                    const Json::Value& claims) const;

  virtual void Execute(HttpResponse& response,
                       const HttpRequest& request) ORTHANC_OVERRIDE;
};
