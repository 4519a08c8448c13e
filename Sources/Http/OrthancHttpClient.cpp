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


#include "OrthancHttpClient.h"

#include <HttpClient.h>
#include <Logging.h>
#include <OrthancException.h>


void OrthancHttpClient::Execute(HttpResponse& response,
                                const HttpRequest& request)
{
  response.Clear();

  Orthanc::HttpClient client;
  client.SetUrl(request.GetUrl());
  client.SetMethod(request.GetMethod());
  client.SetTimeout(request.GetTimeout());
  client.SetHttpsVerifyPeers(verifyPeers_);

  for (std::map<std::string, std::string>::const_iterator
         it = request.GetHeaders().begin(); it != request.GetHeaders().end(); ++it)
  {
    client.AddHeader(it->first, it->second);
  }

  if (request.GetMethod() == Orthanc::HttpMethod_Post ||
      request.GetMethod() == Orthanc::HttpMethod_Put)
  {
    client.AssignBody(request.GetBody());
  }

  std::string body;
  Orthanc::HttpClient::HttpHeaders headers;

  bool success;

  try
  {
    success = client.Apply(body, headers);
  }
  catch (Orthanc::OrthancException& e)
  {
    LOG(ERROR) << "Cannot reach " << request.GetUrl() << ": " << e.What();
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NetworkProtocol, "No answer from remote server: " + request.GetUrl());
  }

  response.SetStatus(static_cast<uint16_t>(client.GetLastStatus()));

  if (!success)
  {
    // Non-2xx statuses are not transport failures, the caller decides
    LOG(INFO) << "HTTP status " << response.GetStatus() << " received from " << request.GetUrl();
  }
  response.SetBody(body);

  for (Orthanc::HttpClient::HttpHeaders::const_iterator it = headers.begin(); it != headers.end(); ++it)
  {
    response.SetHeader(it->first, it->second);
  }
}
