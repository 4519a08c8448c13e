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


#include "LaunchClaims.h"

#include "../LtiConstants.h"
#include "../Security/SecurityConstants.h"

#include <OrthancException.h>
#include <Toolbox.h>


static const char* const CLAIM_EMAIL = "email";
static const char* const CLAIM_NAME = "name";
static const char* const CLAIM_GIVEN_NAME = "given_name";
static const char* const CLAIM_FAMILY_NAME = "family_name";

static const char* const FIELD_ID = "id";
static const char* const FIELD_TITLE = "title";
static const char* const FIELD_DESCRIPTION = "description";
static const char* const FIELD_LINE_ITEM = "lineitem";
static const char* const FIELD_LINE_ITEMS = "lineitems";
static const char* const FIELD_SCOPE = "scope";
static const char* const FIELD_CONTEXT_MEMBERSHIPS_URL = "context_memberships_url";


static void ReadOptionalString(std::string& target,
                               const Json::Value& source,
                               const std::string& field)
{
  if (!source.isMember(field) ||
      source[field].isNull())
  {
    target.clear();
  }
  else if (source[field].type() == Json::stringValue)
  {
    target = source[field].asString();
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Claim \"" + field + "\" must be a string");
  }
}


static bool LookupObject(const Json::Value*& target,
                         const Json::Value& source,
                         const std::string& field)
{
  if (!source.isMember(field) ||
      source[field].isNull())
  {
    return false;
  }
  else if (source[field].type() == Json::objectValue)
  {
    target = &source[field];
    return true;
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Claim \"" + field + "\" must be an object");
  }
}


static void ReadStringList(std::set<std::string>& target,
                           const Json::Value& source,
                           const std::string& field)
{
  target.clear();

  const Json::Value& value = source[field];

  if (value.type() == Json::stringValue)
  {
    target.insert(value.asString());
  }
  else if (value.type() == Json::arrayValue)
  {
    for (Json::Value::ArrayIndex i = 0; i < value.size(); i++)
    {
      if (value[i].type() != Json::stringValue)
      {
        throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Claim \"" + field + "\" must only contain strings");
      }

      target.insert(value[i].asString());
    }
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Claim \"" + field + "\" must be a string or a list of strings");
  }
}


LaunchClaims::LaunchClaims() :
  hasResourceLink_(false),
  hasAgsEndpoint_(false),
  hasAgsScopes_(false),
  hasNrpsEndpoint_(false)
{
}


LaunchClaims::LaunchClaims(const Json::Value& payload) :
  hasResourceLink_(false),
  hasAgsEndpoint_(false),
  hasAgsScopes_(false),
  hasNrpsEndpoint_(false)
{
  if (payload.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The claims must be a JSON object");
  }

  ReadOptionalString(issuer_, payload, JWT_CLAIM_ISS);
  ReadOptionalString(subject_, payload, JWT_CLAIM_SUB);
  ReadOptionalString(authorizedParty_, payload, JWT_CLAIM_AZP);
  ReadOptionalString(nonce_, payload, JWT_CLAIM_NONCE);

  if (payload.isMember(JWT_CLAIM_AUD))
  {
    ReadStringList(audience_, payload, JWT_CLAIM_AUD);
  }

  ReadOptionalString(targetLinkUri_, payload, LTI_CLAIM_TARGET_LINK_URI);
  ReadOptionalString(deploymentId_, payload, LTI_CLAIM_DEPLOYMENT_ID);
  ReadOptionalString(version_, payload, LTI_CLAIM_VERSION);
  ReadOptionalString(messageType_, payload, LTI_CLAIM_MESSAGE_TYPE);

  ReadOptionalString(email_, payload, CLAIM_EMAIL);
  ReadOptionalString(name_, payload, CLAIM_NAME);
  ReadOptionalString(givenName_, payload, CLAIM_GIVEN_NAME);
  ReadOptionalString(familyName_, payload, CLAIM_FAMILY_NAME);

  const Json::Value* object = NULL;

  if (LookupObject(object, payload, LTI_CLAIM_RESOURCE_LINK))
  {
    hasResourceLink_ = true;
    ReadOptionalString(resourceLinkId_, *object, FIELD_ID);
    ReadOptionalString(resourceLinkTitle_, *object, FIELD_TITLE);
    ReadOptionalString(resourceLinkDescription_, *object, FIELD_DESCRIPTION);
  }

  if (LookupObject(object, payload, LTI_CLAIM_AGS_ENDPOINT))
  {
    hasAgsEndpoint_ = true;
    ReadOptionalString(agsLineItem_, *object, FIELD_LINE_ITEM);
    ReadOptionalString(agsLineItems_, *object, FIELD_LINE_ITEMS);

    if (object->isMember(FIELD_SCOPE))
    {
      hasAgsScopes_ = true;
      ReadStringList(agsScopes_, *object, FIELD_SCOPE);
    }
  }

  if (LookupObject(object, payload, LTI_CLAIM_NRPS))
  {
    hasNrpsEndpoint_ = true;
    ReadOptionalString(nrpsMembershipsUrl_, *object, FIELD_CONTEXT_MEMBERSHIPS_URL);
  }
}


void LaunchClaims::Parse(LaunchClaims& target,
                         const std::string& rawPayload)
{
  Json::Value payload;
  if (!Orthanc::Toolbox::ReadJson(payload, rawPayload))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The launch data is not a JSON document");
  }

  target = LaunchClaims(payload);
}


std::string LaunchClaims::GetClientId() const
{
  if (!authorizedParty_.empty())
  {
    return authorizedParty_;
  }
  else if (audience_.size() == 1)
  {
    return *audience_.begin();
  }
  else
  {
    // Multiple audiences without "azp" is not allowed by OpenID Connect
    return "";
  }
}


void LaunchClaims::Format(Json::Value& target) const
{
  target = Json::objectValue;
  target["Issuer"] = issuer_;
  target["Subject"] = subject_;
  target["DeploymentId"] = deploymentId_;
  target["TargetLinkUri"] = targetLinkUri_;
  target["ResourceLinkId"] = resourceLinkId_;
  target["ResourceLinkTitle"] = resourceLinkTitle_;
  target["Email"] = email_;
  target["Name"] = name_;
  target["HasAgs"] = hasAgsEndpoint_;
  target["HasNrps"] = hasNrpsEndpoint_;
}
