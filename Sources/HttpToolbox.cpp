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


#include "HttpToolbox.h"

#include <ChunkedBuffer.h>
#include <OrthancException.h>
#include <Toolbox.h>

#include <boost/algorithm/string/predicate.hpp>


namespace HttpToolbox
{
  std::string ReadMandatoryString(const std::map<std::string, std::string>& dictionary,
                                  const std::string& field)
  {
    std::map<std::string, std::string>::const_iterator found = dictionary.find(field);
    if (found == dictionary.end() ||
        found->second.empty())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_BadRequest, "Missing field: \"" + field + "\"");
    }
    else
    {
      return found->second;
    }
  }


  std::string ReadOptionalString(const std::map<std::string, std::string>& dictionary,
                                 const std::string& field,
                                 const std::string& defaultValue)
  {
    std::map<std::string, std::string>::const_iterator found = dictionary.find(field);
    if (found == dictionary.end())
    {
      return defaultValue;
    }
    else
    {
      return found->second;
    }
  }


  void EncodeBase64Url(std::string& base64,
                       const std::string& source)
  {
    Orthanc::Toolbox::EncodeBase64(base64, source);

    // https://en.wikipedia.org/wiki/Base64#URL_applications

    for (size_t i = 0; i < base64.size(); i++)
    {
      if (base64[i] == '+')
      {
        base64[i] = '-';
      }
      else if (base64[i] == '/')
      {
        base64[i] = '_';
      }
      else if (base64[i] == '=')   // Padding is not used in base64url
      {
        base64.resize(i);
        return;
      }
    }
  }


  void DecodeBase64Url(std::string& decoded,
                       const std::string& base64)
  {
    std::string s;
    s.reserve(base64.size() + 3);

    for (size_t i = 0; i < base64.size(); i++)
    {
      switch (base64[i])
      {
        case '-':
          s.push_back('+');
          break;

        case '_':
          s.push_back('/');
          break;

        case '+':
        case '/':
        case '=':
          throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Not a base64url string");

        default:
          s.push_back(base64[i]);
          break;
      }
    }

    while (s.size() % 4 != 0)
    {
      s.push_back('=');
    }

    Orthanc::Toolbox::DecodeBase64(decoded, s);
  }


  void ConvertDictionaryFromC(std::map<std::string, std::string>& target,
                              bool toLowerCase,
                              uint32_t count,
                              const char *const *keys,
                              const char *const *values)
  {
    target.clear();

    for (uint32_t i = 0; i < count; i++)
    {
      std::string s;

      if (toLowerCase)
      {
        Orthanc::Toolbox::ToLowerCase(s, keys[i]);
      }
      else
      {
        s = keys[i];
      }

      target[s] = values[i];
    }
  }


  bool LookupCDictionary(std::string& target,
                         const std::string& key,
                         bool toLowerCase,
                         uint32_t count,
                         const char *const *keys,
                         const char *const *values)
  {
    for (uint32_t i = 0; i < count; i++)
    {
      std::string s;

      if (toLowerCase)
      {
        Orthanc::Toolbox::ToLowerCase(s, keys[i]);
      }
      else
      {
        s = keys[i];
      }

      if (s == key)
      {
        target = values[i];
        return true;
      }
    }

    return false;
  }


  bool LookupHttpHeader(std::string& value,
                        const std::map<std::string, std::string>& headers,
                        const std::string& header)
  {
    std::string lower;
    Orthanc::Toolbox::ToLowerCase(lower, header);

    std::map<std::string, std::string>::const_iterator found = headers.find(lower);

    if (found == headers.end())
    {
      return false;
    }
    else
    {
      value = found->second;
      return true;
    }
  }


  void EncodeFormUrl(std::string& target,
                     const std::map<std::string, std::string>& source)
  {
    Orthanc::ChunkedBuffer buffer;
    bool first = true;

    for (std::map<std::string, std::string>::const_iterator it = source.begin(); it != source.end(); ++it)
    {
      if (!it->first.empty())
      {
        if (first)
        {
          first = false;
        }
        else
        {
          buffer.AddChunk("&");
        }

        std::string key;
        Orthanc::Toolbox::UriEncode(key, it->first);
        buffer.AddChunk(key);

        if (!it->second.empty())
        {
          std::string value;
          Orthanc::Toolbox::UriEncode(value, it->second);
          buffer.AddChunk("=");
          buffer.AddChunk(value);
        }
      }
    }

    buffer.Flatten(target);
  }


  void ParseFormUrlEncoded(std::map<std::string, std::string>& target,
                           const void* body,
                           size_t bodySize)
  {
    target.clear();

    std::string decoded;
    if (bodySize != 0)
    {
      decoded.assign(reinterpret_cast<const char*>(body), bodySize);
    }

    std::vector<std::string> parameters;
    Orthanc::Toolbox::TokenizeString(parameters, decoded, '&');

    for (size_t i = 0; i < parameters.size(); i++)
    {
      if (parameters[i].empty())
      {
        continue;
      }

      // Only the first "=" separates the key from the value
      const size_t separator = parameters[i].find('=');

      std::string key = parameters[i].substr(0, separator);
      Orthanc::Toolbox::UrlDecode(key);

      if (separator == std::string::npos)
      {
        target[key] = "";
      }
      else
      {
        std::string value = parameters[i].substr(separator + 1);
        Orthanc::Toolbox::UrlDecode(value);
        target[key] = value;
      }
    }
  }


  void ParseCookies(std::list<Cookie>& target,
                    const std::string& cookieHeader)
  {
    target.clear();

    std::vector<std::string> cookies;
    Orthanc::Toolbox::TokenizeString(cookies, cookieHeader, ';');

    for (size_t i = 0; i < cookies.size(); i++)
    {
      const size_t separator = cookies[i].find('=');
      const std::string key = Orthanc::Toolbox::StripSpaces(cookies[i].substr(0, separator));

      if (key.empty())
      {
        continue;
      }
      else if (separator == std::string::npos)
      {
        target.push_back(Cookie(key));
      }
      else
      {
        target.push_back(Cookie(key, Orthanc::Toolbox::StripSpaces(cookies[i].substr(separator + 1))));
      }
    }
  }


  std::string FormatSetCookie(const std::string& cookie,
                              const std::string& value,
                              const std::string& path,
                              CookieSameSite sameSite,
                              bool secure)
  {
    // NB: This is a session cookie, as it does not have "Expires" or "Max-Age"
    std::string s = cookie + "=" + value + "; HttpOnly; Path=" + (path.empty() ? "/" : path);

    if (sameSite != CookieSameSite_Unspecified)
    {
      s += "; SameSite=" + std::string(EnumerationToString(sameSite));
    }

    if (secure ||
        sameSite == CookieSameSite_None)  // Browsers drop "SameSite=None" cookies without "Secure"
    {
      s += "; Secure";
    }

    return s;
  }


  void FormatRedirectionUrl(std::string& target,
                            const std::string& base,
                            const std::map<std::string, std::string>& arguments)
  {
    std::string form;
    EncodeFormUrl(form, arguments);

    if (form.empty())
    {
      target = base;
    }
    else if (base.find('?') == std::string::npos)
    {
      target = base + "?" + form;
    }
    else
    {
      target = base + "&" + form;
    }
  }


  void CheckUrlScheme(const std::string& url)
  {
    if (!boost::starts_with(url, "http://") &&
        !boost::starts_with(url, "https://"))
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "Not a valid HTTP or HTTPS URL: " + url);
    }
  }


  std::string RemoveTrailingSlashes(const std::string& url)
  {
    size_t slash = url.size();

    while (slash > 0 &&
           url[slash - 1] == '/')
    {
      slash--;
    }

    return url.substr(0, slash);
  }


  std::string GetUrlPath(const std::string& url)
  {
    size_t start = url.find("://");
    if (start == std::string::npos)
    {
      start = 0;
    }
    else
    {
      start = url.find('/', start + 3);
      if (start == std::string::npos)
      {
        return "/";
      }
    }

    const size_t end = url.find_first_of("?#", start);
    const std::string path = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    return (path.empty() ? "/" : path);
  }


  std::string AppendPathToUrl(const std::string& url,
                              const std::string& segment)
  {
    const size_t query = url.find_first_of("?#");

    if (query == std::string::npos)
    {
      return RemoveTrailingSlashes(url) + "/" + segment;
    }
    else
    {
      return RemoveTrailingSlashes(url.substr(0, query)) + "/" + segment + url.substr(query);
    }
  }


  bool LookupNextPageLink(std::string& target,
                          const std::string& linkHeader)
  {
    // Example: <https://lms/members?page=2>; rel="next", <https://lms/members?page=9>; rel="last"

    size_t position = 0;

    for (;;)
    {
      const size_t open = linkHeader.find('<', position);
      if (open == std::string::npos)
      {
        return false;
      }

      const size_t close = linkHeader.find('>', open + 1);
      if (close == std::string::npos)
      {
        return false;
      }

      const std::string url = Orthanc::Toolbox::StripSpaces(linkHeader.substr(open + 1, close - open - 1));

      size_t next = linkHeader.find('<', close + 1);
      const std::string parameters = linkHeader.substr(close + 1, next == std::string::npos ? std::string::npos : next - close - 1);

      std::vector<std::string> tokens;
      Orthanc::Toolbox::TokenizeString(tokens, parameters, ';');

      for (size_t i = 0; i < tokens.size(); i++)
      {
        std::string token = Orthanc::Toolbox::StripSpaces(tokens[i]);
        if (!token.empty() &&
            token[token.size() - 1] == ',')
        {
          token = Orthanc::Toolbox::StripSpaces(token.substr(0, token.size() - 1));
        }

        if (boost::istarts_with(token, "rel="))
        {
          std::string relations = Orthanc::Toolbox::StripSpaces(token.substr(4));
          if (relations.size() >= 2 &&
              relations[0] == '"' &&
              relations[relations.size() - 1] == '"')
          {
            relations = relations.substr(1, relations.size() - 2);
          }

          std::vector<std::string> values;
          Orthanc::Toolbox::TokenizeString(values, relations, ' ');

          for (size_t j = 0; j < values.size(); j++)
          {
            if (boost::iequals(values[j], "next") &&
                !url.empty())
            {
              target = url;
              return true;
            }
          }
        }
      }

      if (next == std::string::npos)
      {
        return false;
      }
      else
      {
        position = next;
      }
    }
  }
}
