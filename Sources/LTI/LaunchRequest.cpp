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


#include "LaunchRequest.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"


bool LaunchRequest::LookupFormField(std::string& target,
                                    const std::string& key) const
{
  std::map<std::string, std::string>::const_iterator found = form_.find(key);

  if (found == form_.end() ||
      found->second.empty())
  {
    return false;
  }
  else
  {
    target = found->second;
    return true;
  }
}


void LaunchRequest::GetStateCookies(std::list<std::string>& target) const
{
  target.clear();

  std::list<HttpToolbox::Cookie> cookies;
  HttpToolbox::ParseCookies(cookies, cookieHeader_);

  for (std::list<HttpToolbox::Cookie>::const_iterator it = cookies.begin(); it != cookies.end(); ++it)
  {
    if ((it->GetKey() == LTI_COOKIE_STATE ||
         it->GetKey() == LTI_COOKIE_STATE_LEGACY) &&
        !it->GetValue().empty())
    {
      target.push_back(it->GetValue());
    }
  }
}
