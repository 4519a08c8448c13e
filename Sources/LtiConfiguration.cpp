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


#include "LtiConfiguration.h"

#include "HttpToolbox.h"
#include "LtiConstants.h"

#include <Logging.h>
#include <OrthancException.h>
#include <SerializationToolbox.h>


static const char* const FIELD_DEPLOYMENTS = "Deployments";


LtiConfiguration::LtiConfiguration() :
  root_("/lti"),
  secureCookies_(true),
  httpTimeout_(LTI_DEFAULT_HTTP_TIMEOUT)
{
}


LtiConfiguration& LtiConfiguration::GetInstance()
{
  static LtiConfiguration instance;
  return instance;
}


void LtiConfiguration::SetRoot(const std::string& root)
{
  if (root.empty() ||
      root[0] != '/')
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "The root of the LTI routes must start with a slash: " + root);
  }

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  root_ = HttpToolbox::RemoveTrailingSlashes(root);
}


std::string LtiConfiguration::GetRoot()
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  return root_;
}


void LtiConfiguration::SetToolUrl(const std::string& url)
{
  HttpToolbox::CheckUrlScheme(url);

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  toolUrl_ = url;
}


std::string LtiConfiguration::GetToolUrl()
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);

  if (toolUrl_.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "The URL of the tool is not configured");
  }
  else
  {
    return toolUrl_;
  }
}


void LtiConfiguration::SetSecureCookies(bool secure)
{
  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  secureCookies_ = secure;
}


bool LtiConfiguration::IsSecureCookies()
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  return secureCookies_;
}


void LtiConfiguration::SetHttpTimeout(unsigned int seconds)
{
  if (seconds == 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  httpTimeout_ = seconds;
}


unsigned int LtiConfiguration::GetHttpTimeout()
{
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  return httpTimeout_;
}


void LtiConfiguration::LoadRegistrations(IRegistrationStore& target,
                                         const Json::Value& registrations)
{
  if (registrations.type() != Json::arrayValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The LTI registrations must be provided as a list");
  }

  for (Json::Value::ArrayIndex i = 0; i < registrations.size(); i++)
  {
    Registration registration;
    registration.Unserialize(registrations[i]);

    std::set<std::string> deployments;
    if (registrations[i].isMember(FIELD_DEPLOYMENTS))
    {
      Orthanc::SerializationToolbox::ReadSetOfStrings(deployments, registrations[i], FIELD_DEPLOYMENTS);
    }

    for (std::set<std::string>::const_iterator it = deployments.begin(); it != deployments.end(); ++it)
    {
      Registration::CheckDeploymentId(*it);
    }

    target.StoreRegistration(registration);

    for (std::set<std::string>::const_iterator it = deployments.begin(); it != deployments.end(); ++it)
    {
      target.StoreDeployment(registration.GetIssuer(), *it);
    }

    LOG(WARNING) << "LTI platform registered: " << registration.GetIssuer() << " (client " << registration.GetClientId()
                 << ", " << deployments.size() << " deployment(s))";
  }
}
