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

#include <OrthancCPlugin.h>

#include <json/value.h>
#include <stdint.h>
#include <string>


namespace PluginToolbox
{
  void AnswerJson(OrthancPluginRestOutput* output,
                  const Json::Value& value);

  // Answers with an arbitrary HTTP status, and a plain text body
  void AnswerText(OrthancPluginRestOutput* output,
                  uint16_t status,
                  const std::string& text);

  // "setCookie" is the full value of the header, as formatted by "HttpToolbox::FormatSetCookie()"
  void AddSetCookie(OrthancPluginRestOutput* output,
                    const std::string& setCookie);

  /**
   * We manually reimplement "OrthancPluginRedirect()", otherwise
   * "Set-Cookie" has no effect, and in order to use "303 See Other"
   * that turns a POST into a GET.
   **/
  void Redirect(OrthancPluginRestOutput* output,
                const std::string& url,
                uint16_t status);

  std::string GetCookieHeader(const OrthancPluginHttpRequest* request);
}
