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

#include <Enumerations.h>

#include <json/value.h>
#include <map>
#include <set>
#include <stdint.h>
#include <string>


/**
 * One authenticated call to a service of the platform. The access
 * token is obtained for the declared scopes, so at least one scope
 * must be declared.
 **/
class ServiceRequest
{
private:
  std::set<std::string>  scopes_;
  Orthanc::HttpMethod    method_;
  std::string            uri_;
  std::string            body_;
  std::string            contentType_;
  std::string            accept_;
  uint16_t               expectedStatus_;

public:
  ServiceRequest(Orthanc::HttpMethod method,
                 const std::string& uri) :
    method_(method),
    uri_(uri),
    expectedStatus_(0)
  {
  }

  void AddScope(const std::string& scope)
  {
    scopes_.insert(scope);
  }

  const std::set<std::string>& GetScopes() const
  {
    return scopes_;
  }

  Orthanc::HttpMethod GetMethod() const
  {
    return method_;
  }

  void SetUri(const std::string& uri)
  {
    uri_ = uri;
  }

  const std::string& GetUri() const
  {
    return uri_;
  }

  void SetBody(const std::string& body)
  {
    body_ = body;
  }

  void SetJsonBody(const Json::Value& body);

  const std::string& GetBody() const
  {
    return body_;
  }

  void SetContentType(const std::string& contentType)
  {
    contentType_ = contentType;
  }

  // Defaults to JSON for POST and PUT, empty otherwise
  std::string GetContentType() const;

  void SetAccept(const std::string& accept)
  {
    accept_ = accept;
  }

  // Defaults to JSON
  std::string GetAccept() const;

  void SetExpectedStatus(uint16_t status)
  {
    expectedStatus_ = status;
  }

  // Defaults to 200
  uint16_t GetExpectedStatus() const
  {
    return (expectedStatus_ == 0 ? 200 : expectedStatus_);
  }
};


class ServiceResponse
{
private:
  std::map<std::string, std::string>  headers_;   // Keys are lower-cased
  std::string                         body_;

public:
  void Clear()
  {
    headers_.clear();
    body_.clear();
  }

  void SetHeaders(const std::map<std::string, std::string>& headers)
  {
    headers_ = headers;
  }

  const std::map<std::string, std::string>& GetHeaders() const
  {
    return headers_;
  }

  bool LookupHeader(std::string& value,
                    const std::string& key) const;

  void SetBody(const std::string& body)
  {
    body_ = body;
  }

  const std::string& GetBody() const
  {
    return body_;
  }

  // Throws "ErrorCode_BadFileFormat" if the body is not a JSON object
  void ParseJsonObject(Json::Value& target) const;

  void ParseJsonArray(Json::Value& target) const;
};
