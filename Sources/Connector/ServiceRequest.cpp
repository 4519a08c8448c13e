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


#include "ServiceRequest.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"

#include <OrthancException.h>
#include <Toolbox.h>


void ServiceRequest::SetJsonBody(const Json::Value& body)
{
  Orthanc::Toolbox::WriteFastJson(body_, body);
}


std::string ServiceRequest::GetContentType() const
{
  if (!contentType_.empty())
  {
    return contentType_;
  }
  else if (method_ == Orthanc::HttpMethod_Post ||
           method_ == Orthanc::HttpMethod_Put)
  {
    return MIME_JSON;
  }
  else
  {
    return "";
  }
}


std::string ServiceRequest::GetAccept() const
{
  if (accept_.empty())
  {
    return MIME_JSON;
  }
  else
  {
    return accept_;
  }
}


bool ServiceResponse::LookupHeader(std::string& value,
                                   const std::string& key) const
{
  return HttpToolbox::LookupHttpHeader(value, headers_, key);
}


void ServiceResponse::ParseJsonObject(Json::Value& target) const
{
  if (!Orthanc::Toolbox::ReadJson(target, body_) ||
      target.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The platform service did not answer with a JSON object");
  }
}


void ServiceResponse::ParseJsonArray(Json::Value& target) const
{
  if (!Orthanc::Toolbox::ReadJson(target, body_) ||
      target.type() != Json::arrayValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The platform service did not answer with a JSON array");
  }
}
