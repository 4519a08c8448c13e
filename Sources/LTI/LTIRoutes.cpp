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


#include "LTIRoutes.h"

#include "../Connector/AgsClient.h"
#include "../Connector/NrpsClient.h"
#include "../HttpToolbox.h"
#include "../LtiConfiguration.h"
#include "../PluginToolbox.h"
#include "../RestApiRouter.h"
#include "LoginHandler.h"

#include <Logging.h>

#include <cassert>


namespace
{
  class Services : public boost::noncopyable
  {
  private:
    Datastores        stores_;
    IHttpClient&      client_;
    LaunchValidator&  validator_;
    LoginHandler      login_;

  public:
    Services(const Datastores& stores,
             IHttpClient& client,
             LaunchValidator& validator) :
      stores_(stores),
      client_(client),
      validator_(validator),
      login_(stores)
    {
    }

    const Datastores& GetStores() const
    {
      return stores_;
    }

    IHttpClient& GetClient() const
    {
      return client_;
    }

    LaunchValidator& GetValidator() const
    {
      return validator_;
    }

    LoginHandler& GetLogin()
    {
      return login_;
    }
  };


  // Sends the browser to the tool, once the launch is accepted
  class RedirectToTool : public ILaunchHandler
  {
  private:
    OrthancPluginRestOutput*  output_;

  public:
    explicit RedirectToTool(OrthancPluginRestOutput* output) :
      output_(output)
    {
    }

    virtual void HandleLaunch(const std::string& launchId,
                              const LaunchClaims& claims) ORTHANC_OVERRIDE
    {
      std::map<std::string, std::string> arguments;
      arguments["launch_id"] = launchId;

      std::string url;
      HttpToolbox::FormatRedirectionUrl(url, LtiConfiguration::GetInstance().GetToolUrl(), arguments);

      PluginToolbox::Redirect(output_, url, 303 /* "See Other", to redirect the POST to a GET */);
    }
  };
}


static std::unique_ptr<Services> services_;


static Connector* CreateConnector(const OrthancPluginHttpRequest* request)
{
  assert(services_.get() != NULL);

  if (request->groupsCount != 1)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError);
  }

  std::unique_ptr<Connector> connector(new Connector(services_->GetStores(), services_->GetClient(), request->groups[0]));
  connector->SetTimeout(LtiConfiguration::GetInstance().GetHttpTimeout());

  std::string keyId, pem;
  LtiConfiguration::GetInstance().GetToolKeyPair().ExportPrivateKey(keyId, pem);
  connector->SetSigningKey(keyId, pem);

  return connector.release();
}


static void ServeLogin(OrthancPluginRestOutput* output,
                       const std::string& url,
                       const OrthancPluginHttpRequest* request,
                       const std::map<std::string, std::string>& form)
{
  assert(services_.get() != NULL);

  LoginRedirection redirection;
  services_->GetLogin().Process(redirection, form);

  std::list<std::string> cookies;
  redirection.FormatStateCookies(cookies, LtiConfiguration::GetInstance().IsSecureCookies());

  for (std::list<std::string>::const_iterator it = cookies.begin(); it != cookies.end(); ++it)
  {
    PluginToolbox::AddSetCookie(output, *it);
  }

  PluginToolbox::Redirect(output, redirection.GetUrl(), 302);
}


static void ServeLaunch(OrthancPluginRestOutput* output,
                        const std::string& url,
                        const OrthancPluginHttpRequest* request,
                        const std::map<std::string, std::string>& form)
{
  assert(services_.get() != NULL);

  if (request->method != OrthancPluginHttpMethod_Post)
  {
    OrthancPluginSendMethodNotAllowed(OrthancPlugins::GetGlobalContext(), output, "POST");
    return;
  }

  LaunchRequest launch(form, PluginToolbox::GetCookieHeader(request));
  RedirectToTool handler(output);

  try
  {
    services_->GetValidator().Process(handler, launch);
  }
  catch (LaunchException& e)
  {
    PluginToolbox::AnswerText(output, e.GetHttpStatusCode(), e.GetDetails());
  }
}


static void ServeJwks(OrthancPluginRestOutput* output,
                      const std::string& url,
                      const OrthancPluginHttpRequest* request)
{
  Json::Value jwks;
  LtiConfiguration::GetInstance().GetToolKeyPair().FormatJwks(jwks);
  PluginToolbox::AnswerJson(output, jwks);
}


static void GetLaunch(OrthancPluginRestOutput* output,
                      const std::string& url,
                      const OrthancPluginHttpRequest* request)
{
  std::unique_ptr<Connector> connector(CreateConnector(request));

  Json::Value answer;
  connector->GetClaims().Format(answer);
  answer["LaunchId"] = connector->GetLaunchId();

  PluginToolbox::AnswerJson(output, answer);
}


static void GetMembers(OrthancPluginRestOutput* output,
                       const std::string& url,
                       const OrthancPluginHttpRequest* request)
{
  std::unique_ptr<Connector> connector(CreateConnector(request));
  NrpsClient nrps(*connector);

  Membership membership;
  nrps.GetMembership(membership);

  Json::Value answer;
  membership.Serialize(answer);
  PluginToolbox::AnswerJson(output, answer);
}


static void GetLineItems(OrthancPluginRestOutput* output,
                         const std::string& url,
                         const OrthancPluginHttpRequest* request)
{
  std::unique_ptr<Connector> connector(CreateConnector(request));
  AgsClient ags(*connector);

  std::list<LineItem> items;
  ags.GetLineItems(items);

  Json::Value answer = Json::arrayValue;
  for (std::list<LineItem>::const_iterator it = items.begin(); it != items.end(); ++it)
  {
    Json::Value item;
    it->Serialize(item);
    answer.append(item);
  }

  PluginToolbox::AnswerJson(output, answer);
}


static void GetResults(OrthancPluginRestOutput* output,
                       const std::string& url,
                       const OrthancPluginHttpRequest* request)
{
  std::unique_ptr<Connector> connector(CreateConnector(request));
  AgsClient ags(*connector);

  std::string userId;
  if (!HttpToolbox::LookupCDictionary(userId, "user_id", false, request->getCount, request->getKeys, request->getValues))
  {
    userId.clear();
  }

  std::list<Result> results;
  if (userId.empty())
  {
    ags.GetResults(results);
  }
  else
  {
    ags.GetUserResults(results, userId);
  }

  Json::Value answer = Json::arrayValue;
  for (std::list<Result>::const_iterator it = results.begin(); it != results.end(); ++it)
  {
    Json::Value result;
    it->Serialize(result);
    answer.append(result);
  }

  PluginToolbox::AnswerJson(output, answer);
}


static void PostScore(OrthancPluginRestOutput* output,
                      const std::string& url,
                      const OrthancPluginHttpRequest* request,
                      const Json::Value& body)
{
  Score score;
  Score::Unserialize(score, body);

  std::unique_ptr<Connector> connector(CreateConnector(request));
  AgsClient ags(*connector);
  ags.PutScore(score);

  PluginToolbox::AnswerJson(output, Json::objectValue);
}


void RegisterLTIRoutes(const Datastores& stores,
                       IHttpClient& client,
                       LaunchValidator& validator)
{
  if (services_.get() != NULL)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls);
  }

  services_.reset(new Services(stores, client, validator));

  const std::string root = LtiConfiguration::GetInstance().GetRoot();

  LOG(WARNING) << "Enabling LTI 1.3 routes below " << root;

  // Those routes are called by the platform or by the Web browser
  RestApiRouter::RegisterFormRoute<ServeLogin>(root + "/login");
  RestApiRouter::RegisterFormRoute<ServeLaunch>(root + "/launch");
  RestApiRouter::RegisterGetRoute<ServeJwks>(root + "/jwks");

  // Those routes are used by the tool, the launch ID must be kept private
  RestApiRouter::RegisterGetRoute<GetLaunch>(root + "/launches/{}");
  RestApiRouter::RegisterGetRoute<GetMembers>(root + "/launches/{}/members");
  RestApiRouter::RegisterGetRoute<GetLineItems>(root + "/launches/{}/line-items");
  RestApiRouter::RegisterGetRoute<GetResults>(root + "/launches/{}/results");
  RestApiRouter::RegisterPostRoute<PostScore>(root + "/launches/{}/scores");
}


void FinalizeLTIRoutes()
{
  services_.reset(NULL);
}
