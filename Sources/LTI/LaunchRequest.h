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

#include <list>
#include <map>
#include <string>


/**
 * The inputs of a launch, as received by the launch endpoint: the
 * form-encoded fields of the POST body, and the "Cookie" header.
 **/
class LaunchRequest
{
private:
  std::map<std::string, std::string>  form_;
  std::string                         cookieHeader_;

public:
  LaunchRequest()
  {
  }

  LaunchRequest(const std::map<std::string, std::string>& form,
                const std::string& cookieHeader) :
    form_(form),
    cookieHeader_(cookieHeader)
  {
  }

  void SetFormField(const std::string& key,
                    const std::string& value)
  {
    form_[key] = value;
  }

  void SetCookieHeader(const std::string& cookieHeader)
  {
    cookieHeader_ = cookieHeader;
  }

  bool LookupFormField(std::string& target,
                       const std::string& key) const;

  // Values of the current and of the legacy state cookies, if any
  void GetStateCookies(std::list<std::string>& target) const;
};
