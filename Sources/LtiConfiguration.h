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

#include "Datastore/IRegistrationStore.h"
#include "Security/ToolKeyPair.h"

#include <boost/thread/shared_mutex.hpp>


class LtiConfiguration : public boost::noncopyable
{
private:
  ToolKeyPair          toolKeyPair_;   // This class is thread-safe

  boost::shared_mutex  mutex_;
  std::string          root_;
  std::string          toolUrl_;
  bool                 secureCookies_;
  unsigned int         httpTimeout_;   // In seconds

  LtiConfiguration();

public:
  static LtiConfiguration& GetInstance();

  ToolKeyPair& GetToolKeyPair()
  {
    return toolKeyPair_;
  }

  // URI prefix of the routes of the tool, such as "/lti"
  void SetRoot(const std::string& root);

  std::string GetRoot();

  // Where the browser is sent after a successful launch
  void SetToolUrl(const std::string& url);

  std::string GetToolUrl();

  void SetSecureCookies(bool secure);

  bool IsSecureCookies();

  void SetHttpTimeout(unsigned int seconds);

  unsigned int GetHttpTimeout();

  /**
   * Reads the "Registrations" option, a list of objects with the
   * endpoints of the platforms and the list of their "Deployments".
   **/
  static void LoadRegistrations(IRegistrationStore& target,
                                const Json::Value& registrations);
};
