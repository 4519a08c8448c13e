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

#include <OrthancPluginCppWrapper.h>


namespace RestApiRouter
{
  typedef void (*GetCallback) (OrthancPluginRestOutput* output,
                               const std::string& url,
                               const OrthancPluginHttpRequest* request);

  typedef void (*PostCallback) (OrthancPluginRestOutput* output,
                                const std::string& url,
                                const OrthancPluginHttpRequest* request,
                                const Json::Value& body);

  typedef void (*FormCallback) (OrthancPluginRestOutput* output,
                                const std::string& url,
                                const OrthancPluginHttpRequest* request,
                                const std::map<std::string, std::string>& form);

  namespace Internals
  {
    template <GetCallback Callback>
    static inline void GetCallbackWrapper(OrthancPluginRestOutput* output,
                                          const char* url,
                                          const OrthancPluginHttpRequest* request)
    {
      if (request->method != OrthancPluginHttpMethod_Get)
      {
        OrthancPluginSendMethodNotAllowed(OrthancPlugins::GetGlobalContext(), output, "GET");
      }
      else
      {
        Callback(output, url, request);
      }
    }


    template <PostCallback Callback>
    static inline void PostCallbackWrapper(OrthancPluginRestOutput* output,
                                           const char* url,
                                           const OrthancPluginHttpRequest* request)
    {
      if (request->method != OrthancPluginHttpMethod_Post)
      {
        OrthancPluginSendMethodNotAllowed(OrthancPlugins::GetGlobalContext(), output, "POST");
      }
      else
      {
        Json::Value body;
        if (!Orthanc::Toolbox::ReadJson(body, request->body, request->bodySize))
        {
          throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat);
        }
        else
        {
          Callback(output, url, request, body);
        }
      }
    }


    void ReadForm(std::map<std::string, std::string>& form,
                  const OrthancPluginHttpRequest* request);


    template <FormCallback Callback>
    static inline void FormCallbackWrapper(OrthancPluginRestOutput* output,
                                           const char* url,
                                           const OrthancPluginHttpRequest* request)
    {
      if (request->method != OrthancPluginHttpMethod_Get &&
          request->method != OrthancPluginHttpMethod_Post)
      {
        OrthancPluginSendMethodNotAllowed(OrthancPlugins::GetGlobalContext(), output, "GET,POST");
      }
      else
      {
        std::map<std::string, std::string> form;
        ReadForm(form, request);
        Callback(output, url, request, form);
      }
    }
  }


  /**
   * Registers a route below the configured root. A path component
   * "{}" matches one identifier, which is available in
   * "request->groups".
   **/
  void RegisterRoute(const std::string& uri,
                     OrthancPluginRestCallback callback);


  template <GetCallback Callback>
  static void RegisterGetRoute(const std::string& uri)
  {
    RegisterRoute(uri, OrthancPlugins::Internals::Protect< Internals::GetCallbackWrapper<Callback> >);
  }

  template <PostCallback Callback>
  static void RegisterPostRoute(const std::string& uri)
  {
    RegisterRoute(uri, OrthancPlugins::Internals::Protect< Internals::PostCallbackWrapper<Callback> >);
  }

  // Both GET arguments and POST form-encoded bodies are accepted
  template <FormCallback Callback>
  static void RegisterFormRoute(const std::string& uri)
  {
    RegisterRoute(uri, OrthancPlugins::Internals::Protect< Internals::FormCallbackWrapper<Callback> >);
  }
}
