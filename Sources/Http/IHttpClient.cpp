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


#include "IHttpClient.h"

#include "../HttpToolbox.h"

#include <OrthancException.h>
#include <Toolbox.h>


void HttpRequest::SetTimeout(unsigned int seconds)
{
  if (seconds == 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "The timeout of a HTTP request cannot be infinite");
  }
  else
  {
    timeout_ = seconds;
  }
}


void HttpResponse::Clear()
{
  status_ = 0;
  headers_.clear();
  body_.clear();
}


void HttpResponse::SetHeader(const std::string& key,
                             const std::string& value)
{
  std::string lower;
  Orthanc::Toolbox::ToLowerCase(lower, key);
  headers_[lower] = value;
}


bool HttpResponse::LookupHeader(std::string& value,
                                const std::string& key) const
{
  return HttpToolbox::LookupHttpHeader(value, headers_, key);
}
