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


#include "AgsClient.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"

#include <Logging.h>
#include <OrthancException.h>

#include <boost/lexical_cast.hpp>


static void ParseResults(std::list<Result>& target,
                         const ServiceResponse& response)
{
  Json::Value results;
  response.ParseJsonArray(results);

  for (Json::Value::ArrayIndex i = 0; i < results.size(); i++)
  {
    Result result;
    Result::Unserialize(result, results[i]);
    target.push_back(result);
  }
}


AgsClient::AgsClient(Connector& connector) :
  connector_(connector)
{
  const LaunchClaims& claims = connector.GetClaims();

  if (!claims.HasAgsEndpoint())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NotImplemented, "The platform has not enabled AGS for this launch");
  }

  if (claims.GetAgsLineItem().empty() ||
      claims.GetAgsLineItems().empty() ||
      !claims.HasAgsScopes())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NotImplemented, "The AGS claim of this launch is incomplete");
  }

  lineItem_ = claims.GetAgsLineItem();
  lineItems_ = claims.GetAgsLineItems();
  scopes_ = claims.GetAgsScopes();
}


void AgsClient::CheckScope(const std::string& scope) const
{
  if (!HasScope(scope))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NotImplemented, "Scope not granted by the platform: " + scope);
  }
}


void AgsClient::AddScope(ServiceRequest& request,
                         const std::string& scope) const
{
  CheckScope(scope);
  request.AddScope(scope);
}


void AgsClient::AddLineItemReadScope(ServiceRequest& request) const
{
  // The read-write scope also grants read access
  if (!HasScope(LTI_SCOPE_AGS_LINE_ITEM_READONLY) &&
      HasScope(LTI_SCOPE_AGS_LINE_ITEM))
  {
    request.AddScope(LTI_SCOPE_AGS_LINE_ITEM);
  }
  else
  {
    AddScope(request, LTI_SCOPE_AGS_LINE_ITEM_READONLY);
  }
}


void AgsClient::PutScore(const Score& score)
{
  Score s(score);

  if (s.GetUserId().empty())
  {
    if (connector_.GetClaims().GetSubject().empty())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The launch has no subject to publish the score for");
    }

    s.SetUserId(connector_.GetClaims().GetSubject());
  }

  Json::Value body;
  s.Serialize(body);

  ServiceRequest request(Orthanc::HttpMethod_Post, HttpToolbox::AppendPathToUrl(lineItem_, "scores"));
  AddScope(request, LTI_SCOPE_AGS_SCORE);
  request.SetJsonBody(body);
  request.SetContentType(MIME_LTI_SCORE);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);

  LOG(INFO) << "Score published for user " << s.GetUserId() << " in line item " << lineItem_;
}


void AgsClient::ReadAllResults(std::list<Result>& target,
                               const std::string& userId)
{
  target.clear();

  std::string cursor;
  bool hasMore;

  do
  {
    std::list<Result> page;
    hasMore = GetPagedResults(page, cursor, 0, userId);
    target.splice(target.end(), page);
  }
  while (hasMore);
}


void AgsClient::GetResults(std::list<Result>& target)
{
  ReadAllResults(target, "");
}


void AgsClient::GetUserResults(std::list<Result>& target,
                               const std::string& userId)
{
  if (userId.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "No user ID was provided");
  }

  ReadAllResults(target, userId);
}


bool AgsClient::GetPagedResults(std::list<Result>& page,
                                std::string& cursor,
                                unsigned int limit,
                                const std::string& userId)
{
  page.clear();

  std::map<std::string, std::string> arguments;

  if (limit != 0)
  {
    arguments["limit"] = boost::lexical_cast<std::string>(limit);
  }

  if (!userId.empty())
  {
    arguments["user_id"] = userId;
  }

  std::string uri;
  HttpToolbox::FormatRedirectionUrl(uri, HttpToolbox::AppendPathToUrl(lineItem_, "results"), arguments);

  ServiceRequest request(Orthanc::HttpMethod_Get, uri);
  AddScope(request, LTI_SCOPE_AGS_RESULT_READONLY);
  request.SetAccept(MIME_LTI_RESULT_CONTAINER);

  ServiceResponse response;
  const bool hasMore = connector_.ExecutePagedRequest(response, request, cursor);

  ParseResults(page, response);
  return hasMore;
}


void AgsClient::GetLineItem(LineItem& target,
                            const std::string& targetUri)
{
  ServiceRequest request(Orthanc::HttpMethod_Get, targetUri.empty() ? lineItem_ : targetUri);
  AddLineItemReadScope(request);
  request.SetAccept(MIME_LTI_LINE_ITEM);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);

  Json::Value item;
  response.ParseJsonObject(item);
  LineItem::Unserialize(target, item);
}


void AgsClient::GetLineItems(std::list<LineItem>& target)
{
  target.clear();

  ServiceRequest request(Orthanc::HttpMethod_Get, lineItems_);
  AddLineItemReadScope(request);
  request.SetAccept(MIME_LTI_LINE_ITEM_CONTAINER);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);

  Json::Value items;
  response.ParseJsonArray(items);

  for (Json::Value::ArrayIndex i = 0; i < items.size(); i++)
  {
    LineItem item;
    LineItem::Unserialize(item, items[i]);
    target.push_back(item);
  }
}


void AgsClient::CreateLineItem(LineItem& created,
                               const LineItem& lineItem)
{
  Json::Value body;
  lineItem.Serialize(body);

  ServiceRequest request(Orthanc::HttpMethod_Post, lineItems_);
  AddScope(request, LTI_SCOPE_AGS_LINE_ITEM);
  request.SetJsonBody(body);
  request.SetContentType(MIME_LTI_LINE_ITEM);
  request.SetAccept(MIME_LTI_LINE_ITEM);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);

  Json::Value item;
  response.ParseJsonObject(item);
  LineItem::Unserialize(created, item);
}


void AgsClient::UpdateLineItem(LineItem& updated,
                               const LineItem& lineItem,
                               const std::string& targetUri)
{
  Json::Value body;
  lineItem.Serialize(body);

  ServiceRequest request(Orthanc::HttpMethod_Put, targetUri.empty() ? lineItem_ : targetUri);
  AddScope(request, LTI_SCOPE_AGS_LINE_ITEM);
  request.SetJsonBody(body);
  request.SetContentType(MIME_LTI_LINE_ITEM);
  request.SetAccept(MIME_LTI_LINE_ITEM);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);

  Json::Value item;
  response.ParseJsonObject(item);
  LineItem::Unserialize(updated, item);
}


void AgsClient::DeleteLineItem(const std::string& targetUri)
{
  ServiceRequest request(Orthanc::HttpMethod_Delete, targetUri.empty() ? lineItem_ : targetUri);
  AddScope(request, LTI_SCOPE_AGS_LINE_ITEM);

  ServiceResponse response;
  connector_.ExecuteServiceRequest(response, request);
}
