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


#include "RestApiRouter.h"

#include "HttpToolbox.h"

#include <boost/thread.hpp>
#include <set>


static std::set<std::string>  registeredRoutes_;
static boost::mutex           registeredRoutesMutex_;


static std::string FormatRouteRegex(const std::vector<std::string>& path,
                                    const std::string& uri)
{
  std::string regex;

  for (size_t i = 0; i < path.size(); i++)
  {
    regex += "/";

    if (path[i].empty())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
    }
    else if (path[i] == "{}")
    {
      regex += "([0-9a-zA-Z._-]+)";
    }
    else
    {
      for (size_t j = 0; j < path[i].size(); j++)
      {
        if ((path[i][j] >= '0' && path[i][j] <= '9') ||
            (path[i][j] >= 'a' && path[i][j] <= 'z') ||
            (path[i][j] >= 'A' && path[i][j] <= 'Z') ||
            path[i][j] == '_' ||
            path[i][j] == '-')
        {
          regex += path[i][j];
        }
        else if (path[i][j] == '.')
        {
          regex += "\\.";
        }
        else
        {
          throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange,
                                          "Character \"" + std::string(1, path[i][j]) + "\" not allowed in route: " + uri);
        }
      }
    }
  }

  return regex;
}


namespace RestApiRouter
{
  namespace Internals
  {
    void ReadForm(std::map<std::string, std::string>& form,
                  const OrthancPluginHttpRequest* request)
    {
      if (request->method == OrthancPluginHttpMethod_Post)
      {
        HttpToolbox::ParseFormUrlEncoded(form, request->body, request->bodySize);
      }
      else
      {
        HttpToolbox::ConvertDictionaryFromC(form, false, request->getCount, request->getKeys, request->getValues);
      }
    }
  }


  void RegisterRoute(const std::string& uri,
                     OrthancPluginRestCallback callback)
  {
    std::vector<std::string> path;
    Orthanc::Toolbox::SplitUriComponents(path, uri);

    const std::string regex = FormatRouteRegex(path, uri);

    {
      boost::mutex::scoped_lock lock(registeredRoutesMutex_);

      if (registeredRoutes_.find(regex) != registeredRoutes_.end())
      {
        // Cannot register twice the same target
        throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "Route registered twice: " + uri);
      }

      registeredRoutes_.insert(regex);
    }

    // "NoLock" because all the LTI callbacks are thread-safe
    OrthancPluginRegisterRestCallbackNoLock(OrthancPlugins::GetGlobalContext(), regex.c_str(), callback);
  }
}
