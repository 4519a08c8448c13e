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


#include "PluginToolbox.h"

#include "HttpToolbox.h"

#include <Enumerations.h>
#include <OrthancPluginCppWrapper.h>


namespace PluginToolbox
{
  void AnswerJson(OrthancPluginRestOutput* output,
                  const Json::Value& value)
  {
    const std::string s = value.toStyledString();
    OrthancPluginAnswerBuffer(OrthancPlugins::GetGlobalContext(), output, s.c_str(), s.size(),
                              Orthanc::EnumerationToString(Orthanc::MimeType_Json));
  }


  void AnswerText(OrthancPluginRestOutput* output,
                  uint16_t status,
                  const std::string& text)
  {
    if (status == 200)
    {
      OrthancPluginAnswerBuffer(OrthancPlugins::GetGlobalContext(), output, text.c_str(), text.size(),
                                Orthanc::EnumerationToString(Orthanc::MimeType_PlainText));
    }
    else
    {
      OrthancPluginSetHttpHeader(OrthancPlugins::GetGlobalContext(), output, "Content-Type",
                                 Orthanc::EnumerationToString(Orthanc::MimeType_PlainText));
      OrthancPluginSendHttpStatus(OrthancPlugins::GetGlobalContext(), output, status, text.c_str(), text.size());
    }
  }


  void AddSetCookie(OrthancPluginRestOutput* output,
                    const std::string& setCookie)
  {
    OrthancPluginSetHttpHeader(OrthancPlugins::GetGlobalContext(), output, "Set-Cookie", setCookie.c_str());
  }


  void Redirect(OrthancPluginRestOutput* output,
                const std::string& url,
                uint16_t status)
  {
    OrthancPluginSetHttpHeader(OrthancPlugins::GetGlobalContext(), output, "Location", url.c_str());
    OrthancPluginSendHttpStatusCode(OrthancPlugins::GetGlobalContext(), output, status);
  }


  std::string GetCookieHeader(const OrthancPluginHttpRequest* request)
  {
    std::string cookieHeader;
    if (HttpToolbox::LookupCDictionary(cookieHeader, "cookie", true, request->headersCount, request->headersKeys, request->headersValues))
    {
      return cookieHeader;
    }
    else
    {
      return "";
    }
  }
}
