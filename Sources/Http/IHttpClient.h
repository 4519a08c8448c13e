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

#include "../LtiConstants.h"

#include <Enumerations.h>

#include <boost/noncopyable.hpp>
#include <map>
#include <stdint.h>
#include <string>


class HttpRequest
{
private:
  Orthanc::HttpMethod                 method_;
  std::string                         url_;
  std::map<std::string, std::string>  headers_;
  std::string                         body_;
  unsigned int                        timeout_;

public:
  HttpRequest() :
    method_(Orthanc::HttpMethod_Get),
    timeout_(LTI_DEFAULT_HTTP_TIMEOUT)
  {
  }

  HttpRequest(Orthanc::HttpMethod method,
              const std::string& url) :
    method_(method),
    url_(url),
    timeout_(LTI_DEFAULT_HTTP_TIMEOUT)
  {
  }

  void SetMethod(Orthanc::HttpMethod method)
  {
    method_ = method;
  }

  Orthanc::HttpMethod GetMethod() const
  {
    return method_;
  }

  void SetUrl(const std::string& url)
  {
    url_ = url;
  }

  const std::string& GetUrl() const
  {
    return url_;
  }

  void SetHeader(const std::string& key,
                 const std::string& value)
  {
    headers_[key] = value;
  }

  const std::map<std::string, std::string>& GetHeaders() const
  {
    return headers_;
  }

  void SetBody(const std::string& body)
  {
    body_ = body;
  }

  const std::string& GetBody() const
  {
    return body_;
  }

  // In seconds, must be non-zero so that no call blocks indefinitely
  void SetTimeout(unsigned int seconds);

  unsigned int GetTimeout() const
  {
    return timeout_;
  }
};


class HttpResponse
{
private:
  uint16_t                            status_;
  std::map<std::string, std::string>  headers_;   // Keys are lower-cased
  std::string                         body_;

public:
  HttpResponse() :
    status_(0)
  {
  }

  void Clear();

  void SetStatus(uint16_t status)
  {
    status_ = status;
  }

  uint16_t GetStatus() const
  {
    return status_;
  }

  void SetHeader(const std::string& key,
                 const std::string& value);

  bool LookupHeader(std::string& value,
                    const std::string& key) const;

  const std::map<std::string, std::string>& GetHeaders() const
  {
    return headers_;
  }

  void SetBody(const std::string& body)
  {
    body_ = body;
  }

  const std::string& GetBody() const
  {
    return body_;
  }
};


class IHttpClient : public boost::noncopyable
{
public:
  virtual ~IHttpClient()
  {
  }

  /**
   * Whatever the HTTP status, the answer of the remote server is
   * stored in "response". An exception is only thrown if no answer
   * could be received (DNS failure, refused connection, timeout...).
   **/
  virtual void Execute(HttpResponse& response,
                       const HttpRequest& request) = 0;
};
