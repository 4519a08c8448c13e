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


#include "Registration.h"

#include "../HttpToolbox.h"
#include "../LtiConstants.h"

#include <OrthancException.h>
#include <SerializationToolbox.h>

#include <boost/lexical_cast.hpp>


static const char* const FIELD_ISSUER = "Issuer";
static const char* const FIELD_CLIENT_ID = "ClientId";
static const char* const FIELD_TOKEN_URL = "TokenUrl";
static const char* const FIELD_AUTHENTICATION_URL = "AuthenticationUrl";
static const char* const FIELD_KEY_SET_URL = "KeySetUrl";
static const char* const FIELD_TARGET_LINK_URL = "TargetLinkUrl";


Registration::Registration(const std::string& issuer,
                           const std::string& clientId,
                           const std::string& tokenUri,
                           const std::string& authLoginUri,
                           const std::string& keySetUri,
                           const std::string& targetLinkUri) :
  issuer_(issuer),
  clientId_(clientId),
  tokenUri_(tokenUri),
  authLoginUri_(authLoginUri),
  keySetUri_(keySetUri),
  targetLinkUri_(targetLinkUri)
{
  Check();
}


void Registration::Check() const
{
  if (issuer_.empty() ||
      clientId_.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "A registration needs an issuer and a client ID");
  }

  HttpToolbox::CheckUrlScheme(tokenUri_);
  HttpToolbox::CheckUrlScheme(authLoginUri_);
  HttpToolbox::CheckUrlScheme(keySetUri_);
  HttpToolbox::CheckUrlScheme(targetLinkUri_);
}


void Registration::Unserialize(const Json::Value& source)
{
  issuer_ = Orthanc::SerializationToolbox::ReadString(source, FIELD_ISSUER);
  clientId_ = Orthanc::SerializationToolbox::ReadString(source, FIELD_CLIENT_ID);
  tokenUri_ = Orthanc::SerializationToolbox::ReadString(source, FIELD_TOKEN_URL);
  authLoginUri_ = Orthanc::SerializationToolbox::ReadString(source, FIELD_AUTHENTICATION_URL);
  keySetUri_ = Orthanc::SerializationToolbox::ReadString(source, FIELD_KEY_SET_URL);
  targetLinkUri_ = Orthanc::SerializationToolbox::ReadString(source, FIELD_TARGET_LINK_URL);
  Check();
}


void Registration::CheckDeploymentId(const std::string& deploymentId)
{
  if (deploymentId.empty() ||
      deploymentId.size() > LTI_MAX_DEPLOYMENT_ID_LENGTH)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange,
                                    "A deployment ID must have between 1 and " +
                                    boost::lexical_cast<std::string>(LTI_MAX_DEPLOYMENT_ID_LENGTH) + " characters");
  }
}
