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

#include "../Sources/HttpToolbox.h"
#include "../Sources/LtiConstants.h"
#include "../Sources/Security/JWT.h"
#include "../Sources/Security/SecurityConstants.h"

#include <OrthancException.h>
#include <Toolbox.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <time.h>


const char* const FakePlatform::ISSUER = "https://platform.example.org";
const char* const FakePlatform::CLIENT_ID = "tool-client";
const char* const FakePlatform::DEPLOYMENT_ID = "deployment-1";
const char* const FakePlatform::KEYS_URL = "https://platform.example.org/jwks";
const char* const FakePlatform::TOKEN_URL = "https://platform.example.org/token";
const char* const FakePlatform::AUTH_URL = "https://platform.example.org/auth";
const char* const FakePlatform::TARGET_LINK_URL = "https://tool.example.org/lti/launch";
const char* const FakePlatform::LINE_ITEMS_URL = "https://platform.example.org/courses/1/lineitems";
const char* const FakePlatform::LINE_ITEM_URL = "https://platform.example.org/courses/1/lineitems/1";
const char* const FakePlatform::MEMBERSHIPS_URL = "https://platform.example.org/courses/1/memberships";


static bool LookupRequestHeader(std::string& value,
                                const HttpRequest& request,
                                const std::string& header)
{
  for (std::map<std::string, std::string>::const_iterator it = request.GetHeaders().begin();
       it != request.GetHeaders().end(); ++it)
  {
    if (boost::iequals(it->first, header))
    {
      value = it->second;
      return true;
    }
  }

  return false;
}


static void AnswerJson(HttpResponse& response,
                       uint16_t status,
                       const Json::Value& body)
{
  std::string s;
  Orthanc::Toolbox::WriteFastJson(s, body);

  response.SetStatus(status);
  response.SetHeader("Content-Type", MIME_JSON);
  response.SetBody(s);
}


static void AnswerError(HttpResponse& response,
                        uint16_t status,
                        const std::string& error)
{
  Json::Value body = Json::objectValue;
  body["error"] = error;
  AnswerJson(response, status, body);
}


static bool ParseJsonBody(Json::Value& target,
                          const HttpRequest& request)
{
  return (Orthanc::Toolbox::ReadJson(target, request.GetBody()) &&
          target.type() == Json::objectValue);
}


FakePlatform::FakePlatform() :
  platformKeyId_("platform-key-1"),
  keyGeneration_(1),
  tokenStatus_(200),
  tokenLifetime_(3600),
  tokenCount_(0),
  serviceStatus_(0),
  lineItemsCount_(1),
  scores_(Json::arrayValue),
  resultsPageSize_(2),
  lastTimeout_(0)
{
  platformKey_.Generate();

  Json::Value item = Json::objectValue;
  item["id"] = LINE_ITEM_URL;
  item["label"] = "Chest CT reading";
  item["scoreMaximum"] = 100;
  item["resourceLinkId"] = "resource-1";
  lineItems_[LINE_ITEM_URL] = item;
}


void FakePlatform::RotateKey()
{
  keyGeneration_++;
  platformKeyId_ = "platform-key-" + boost::lexical_cast<std::string>(keyGeneration_);
  platformKey_.Generate();
}


void FakePlatform::SetToolKey(const RSAPrivateKey& key)
{
  toolKey_.reset(new RSAPublicKey);
  toolKey_->LoadFromPrivate(key);
}


void FakePlatform::AddResult(const std::string& userId,
                             double score,
                             double maximum)
{
  Json::Value result = Json::objectValue;
  result["id"] = std::string(LINE_ITEM_URL) + "/results/" + boost::lexical_cast<std::string>(results_.size() + 1);
  result["scoreOf"] = LINE_ITEM_URL;
  result["userId"] = userId;
  result["resultScore"] = score;
  result["resultMaximum"] = maximum;
  results_.push_back(result);
}


void FakePlatform::AddMember(const std::string& userId,
                             const std::string& name,
                             const std::string& role)
{
  Json::Value member = Json::objectValue;
  member["status"] = "Active";
  member["user_id"] = userId;
  member["name"] = name;
  member["roles"] = Json::arrayValue;
  member["roles"].append(role);
  members_.push_back(member);
}


unsigned int FakePlatform::GetCallCount(const std::string& url) const
{
  std::map<std::string, unsigned int>::const_iterator found = calls_.find(url);
  return (found == calls_.end() ? 0 : found->second);
}


void FakePlatform::Register(IRegistrationStore& store) const
{
  store.StoreRegistration(Registration(ISSUER, CLIENT_ID, TOKEN_URL, AUTH_URL, KEYS_URL, TARGET_LINK_URL));
  store.StoreDeployment(ISSUER, DEPLOYMENT_ID);
}


void FakePlatform::FormatLaunchClaims(Json::Value& target,
                                      const std::string& nonce) const
{
  const int64_t now = time(NULL);

  target = Json::objectValue;
  target[JWT_CLAIM_ISS] = ISSUER;
  target[JWT_CLAIM_SUB] = "user-1";
  target[JWT_CLAIM_AUD] = Json::arrayValue;
  target[JWT_CLAIM_AUD].append(CLIENT_ID);
  target[JWT_CLAIM_IAT] = static_cast<Json::Int64>(now);
  target[JWT_CLAIM_EXP] = static_cast<Json::Int64>(now + 300);
  target[JWT_CLAIM_NONCE] = nonce;

  target["name"] = "Jane Doe";
  target["given_name"] = "Jane";
  target["family_name"] = "Doe";
  target["email"] = "jane.doe@example.org";

  target[LTI_CLAIM_VERSION] = LTI_SUPPORTED_VERSION;
  target[LTI_CLAIM_MESSAGE_TYPE] = LTI_MESSAGE_TYPE_RESOURCE_LINK;
  target[LTI_CLAIM_DEPLOYMENT_ID] = DEPLOYMENT_ID;
  target[LTI_CLAIM_TARGET_LINK_URI] = TARGET_LINK_URL;
  target[LTI_CLAIM_RESOURCE_LINK]["id"] = "resource-1";
  target[LTI_CLAIM_RESOURCE_LINK]["title"] = "Chest CT reading";

  Json::Value scopes = Json::arrayValue;
  scopes.append(LTI_SCOPE_AGS_LINE_ITEM);
  scopes.append(LTI_SCOPE_AGS_LINE_ITEM_READONLY);
  scopes.append(LTI_SCOPE_AGS_RESULT_READONLY);
  scopes.append(LTI_SCOPE_AGS_SCORE);

  target[LTI_CLAIM_AGS_ENDPOINT]["scope"] = scopes;
  target[LTI_CLAIM_AGS_ENDPOINT]["lineitems"] = LINE_ITEMS_URL;
  target[LTI_CLAIM_AGS_ENDPOINT]["lineitem"] = LINE_ITEM_URL;

  target[LTI_CLAIM_NRPS]["context_memberships_url"] = MEMBERSHIPS_URL;
  target[LTI_CLAIM_NRPS]["service_versions"] = Json::arrayValue;
  target[LTI_CLAIM_NRPS]["service_versions"].append("2.0");
}


void FakePlatform::ForgeIdToken(std::string& token,
                                const Json::Value& claims) const
{
  platformKey_.ForgeJWT(token, platformKeyId_, claims);
}


void FakePlatform::AnswerToken(HttpResponse& response,
                               const HttpRequest& request)
{
  if (request.GetMethod() != Orthanc::HttpMethod_Post)
  {
    AnswerError(response, 405, "invalid_request");
    return;
  }

  if (tokenStatus_ != 200)
  {
    AnswerError(response, tokenStatus_, "invalid_client");
    return;
  }

  std::map<std::string, std::string> form;
  HttpToolbox::ParseFormUrlEncoded(form, request.GetBody().c_str(), request.GetBody().size());

  if (form["grant_type"] != "client_credentials" ||
      form["client_assertion_type"] != "urn:ietf:params:oauth:client-assertion-type:jwt-bearer" ||
      form["client_assertion"].empty() ||
      form["scope"].empty())
  {
    AnswerError(response, 400, "invalid_request");
    return;
  }

  if (toolKey_.get() != NULL)
  {
    try
    {
      JWT assertion(form["client_assertion"]);

      std::set<std::string> audience;
      assertion.GetAudience(audience);

      std::string issuer;
      if (!assertion.VerifySignature(*toolKey_) ||
          !assertion.LookupStringClaim(issuer, JWT_CLAIM_ISS) ||
          issuer != CLIENT_ID ||
          audience.find(TOKEN_URL) == audience.end())
      {
        AnswerError(response, 401, "invalid_client");
        return;
      }
    }
    catch (Orthanc::OrthancException&)
    {
      AnswerError(response, 400, "invalid_request");
      return;
    }
  }

  tokenCount_++;
  const std::string token = "token-" + boost::lexical_cast<std::string>(tokenCount_);
  issuedTokens_.insert(token);
  lastScope_ = form["scope"];

  Json::Value body = Json::objectValue;
  body["access_token"] = token;
  body["token_type"] = "Bearer";
  body["expires_in"] = tokenLifetime_;
  body["scope"] = form["scope"];
  AnswerJson(response, 200, body);
}


bool FakePlatform::IsAuthorized(const HttpRequest& request) const
{
  std::string authorization;
  return (LookupRequestHeader(authorization, request, "Authorization") &&
          boost::starts_with(authorization, "Bearer ") &&
          issuedTokens_.find(authorization.substr(7)) != issuedTokens_.end());
}


void FakePlatform::AnswerPage(HttpResponse& response,
                              Json::Value& page,
                              const std::vector<Json::Value>& items,
                              const std::string& base,
                              std::map<std::string, std::string> arguments,
                              unsigned int defaultPageSize)
{
  unsigned int pageSize = defaultPageSize;
  if (arguments.find("limit") != arguments.end())
  {
    pageSize = boost::lexical_cast<unsigned int>(arguments["limit"]);
  }

  size_t pageIndex = 1;
  if (arguments.find("page") != arguments.end())
  {
    pageIndex = boost::lexical_cast<size_t>(arguments["page"]);
  }

  page = Json::arrayValue;

  if (pageSize == 0)
  {
    for (size_t i = 0; i < items.size(); i++)
    {
      page.append(items[i]);
    }

    return;
  }

  const size_t start = (pageIndex - 1) * pageSize;

  for (size_t i = start; i < items.size() && i < start + pageSize; i++)
  {
    page.append(items[i]);
  }

  if (start + pageSize < items.size())
  {
    arguments["page"] = boost::lexical_cast<std::string>(pageIndex + 1);

    std::string next;
    HttpToolbox::FormatRedirectionUrl(next, base, arguments);
    response.SetHeader("Link", "<" + next + ">; rel=\"next\"");
  }
}


void FakePlatform::AnswerService(HttpResponse& response,
                                 const HttpRequest& request,
                                 const std::string& base,
                                 const std::map<std::string, std::string>& arguments)
{
  if (!IsAuthorized(request))
  {
    AnswerError(response, 401, "invalid_token");
    return;
  }

  if (serviceStatus_ != 0)
  {
    AnswerError(response, serviceStatus_, "unavailable");
    return;
  }

  if (!LookupRequestHeader(lastAccept_, request, "Accept"))
  {
    lastAccept_.clear();
  }

  if (!LookupRequestHeader(lastContentType_, request, "Content-Type"))
  {
    lastContentType_.clear();
  }

  const Orthanc::HttpMethod method = request.GetMethod();

  if (base == LINE_ITEMS_URL)
  {
    if (method == Orthanc::HttpMethod_Get)
    {
      Json::Value items = Json::arrayValue;
      for (LineItems::const_iterator it = lineItems_.begin(); it != lineItems_.end(); ++it)
      {
        items.append(it->second);
      }

      AnswerJson(response, 200, items);
    }
    else if (method == Orthanc::HttpMethod_Post)
    {
      Json::Value item;
      if (!ParseJsonBody(item, request))
      {
        AnswerError(response, 400, "invalid_request");
        return;
      }

      lineItemsCount_++;
      item["id"] = std::string(LINE_ITEMS_URL) + "/" + boost::lexical_cast<std::string>(lineItemsCount_);
      lineItems_[item["id"].asString()] = item;
      AnswerJson(response, 200, item);
    }
    else
    {
      AnswerError(response, 405, "invalid_request");
    }

    return;
  }

  LineItems::iterator lineItem = lineItems_.find(base);
  if (lineItem != lineItems_.end())
  {
    if (method == Orthanc::HttpMethod_Get)
    {
      AnswerJson(response, 200, lineItem->second);
    }
    else if (method == Orthanc::HttpMethod_Put)
    {
      Json::Value item;
      if (!ParseJsonBody(item, request))
      {
        AnswerError(response, 400, "invalid_request");
        return;
      }

      item["id"] = base;
      lineItem->second = item;
      AnswerJson(response, 200, item);
    }
    else if (method == Orthanc::HttpMethod_Delete)
    {
      lineItems_.erase(lineItem);
      response.SetStatus(200);
    }
    else
    {
      AnswerError(response, 405, "invalid_request");
    }

    return;
  }

  if (boost::ends_with(base, "/scores") &&
      lineItems_.find(base.substr(0, base.size() - 7)) != lineItems_.end() &&
      method == Orthanc::HttpMethod_Post)
  {
    Json::Value score;
    if (!ParseJsonBody(score, request))
    {
      AnswerError(response, 400, "invalid_request");
      return;
    }

    scores_.append(score);
    response.SetStatus(200);
    return;
  }

  if (boost::ends_with(base, "/results") &&
      lineItems_.find(base.substr(0, base.size() - 8)) != lineItems_.end() &&
      method == Orthanc::HttpMethod_Get)
  {
    std::vector<Json::Value> selected;

    std::map<std::string, std::string>::const_iterator userId = arguments.find("user_id");
    for (size_t i = 0; i < results_.size(); i++)
    {
      if (userId == arguments.end() ||
          results_[i]["userId"].asString() == userId->second)
      {
        selected.push_back(results_[i]);
      }
    }

    Json::Value page;
    AnswerPage(response, page, selected, base, arguments, resultsPageSize_);
    AnswerJson(response, 200, page);
    return;
  }

  if (base == MEMBERSHIPS_URL &&
      method == Orthanc::HttpMethod_Get)
  {
    Json::Value membership = Json::objectValue;
    membership["id"] = MEMBERSHIPS_URL;
    membership["context"]["id"] = "course-1";
    membership["context"]["label"] = "RAD101";
    membership["context"]["title"] = "Introduction to radiology";

    AnswerPage(response, membership["members"], members_, base, arguments, 0);
    AnswerJson(response, 200, membership);
    return;
  }

  AnswerError(response, 404, "not_found");
}


void FakePlatform::Execute(HttpResponse& response,
                           const HttpRequest& request)
{
  response.Clear();

  std::string base = request.GetUrl();
  std::map<std::string, std::string> arguments;

  const size_t query = base.find('?');
  if (query != std::string::npos)
  {
    const std::string s = base.substr(query + 1);
    HttpToolbox::ParseFormUrlEncoded(arguments, s.c_str(), s.size());
    base.resize(query);
  }

  calls_[base]++;
  lastTimeout_ = request.GetTimeout();

  if (base == KEYS_URL)
  {
    Json::Value jwk;
    platformKey_.ExportJwk(jwk, platformKeyId_);

    Json::Value jwks = Json::objectValue;
    jwks[JWKS_FIELD_KEYS] = Json::arrayValue;
    jwks[JWKS_FIELD_KEYS].append(jwk);

    AnswerJson(response, 200, jwks);
  }
  else if (base == TOKEN_URL)
  {
    AnswerToken(response, request);
  }
  else
  {
    AnswerService(response, request, base, arguments);
  }
}
