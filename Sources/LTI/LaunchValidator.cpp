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


#include "LaunchValidator.h"

#include "../LtiConstants.h"
#include "../Security/SecurityConstants.h"

#include <Compatibility.h>
#include <Logging.h>
#include <Toolbox.h>

#include <boost/lexical_cast.hpp>
#include <list>
#include <time.h>


static const char* const FORM_ID_TOKEN = "id_token";
static const char* const FORM_STATE = "state";


static void Reject(LaunchStep step,
                   const std::string& reason)
{
  LOG(WARNING) << "Rejected LTI launch during " << EnumerationToString(step) << ": " << reason;
  throw LaunchException(step, LaunchFailure_ClientError, reason);
}


static void Fail(LaunchStep step,
                 const std::string& reason,
                 const Orthanc::OrthancException& cause)
{
  LOG(ERROR) << "LTI launch failed during " << EnumerationToString(step) << ": " << reason
             << " (" << cause.What() << ")";
  throw LaunchException(step, LaunchFailure_ServerError, reason);
}


static std::string GetUnverifiedClientId(const JWT& jwt)
{
  std::string azp;
  if (jwt.LookupStringClaim(azp, JWT_CLAIM_AZP))
  {
    return azp;
  }

  // Validates the type of the audience
  std::set<std::string> audience;
  jwt.GetAudience(audience);

  if (audience.empty())
  {
    return "";
  }

  // The first audience in the order of the token
  const Json::Value& aud = jwt.GetPayload()[JWT_CLAIM_AUD];
  if (aud.type() == Json::arrayValue)
  {
    return aud[0].asString();
  }
  else
  {
    return aud.asString();
  }
}


LaunchValidator::LaunchValidator(const Datastores& stores,
                                 PlatformKeysRegistry& platformKeys) :
  stores_(stores),
  platformKeys_(platformKeys),
  launchDataLifetime_(LTI_DEFAULT_LAUNCH_DATA_LIFETIME)
{
}


void LaunchValidator::SetLaunchDataLifetime(unsigned int seconds)
{
  if (seconds == 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "The lifetime of launch data must be positive");
  }

  launchDataLifetime_ = seconds;
}


std::string LaunchValidator::Validate(LaunchClaims& claims,
                                      const LaunchRequest& request)
{
  // Token intake

  std::string token;
  if (!request.LookupFormField(token, FORM_ID_TOKEN))
  {
    Reject(LaunchStep_TokenIntake, "No identity token was provided");
  }

  std::unique_ptr<JWT> jwt;

  try
  {
    jwt.reset(new JWT(token));
  }
  catch (Orthanc::OrthancException& e)
  {
    Reject(LaunchStep_TokenIntake, std::string("Malformed identity token: ") + e.What());
  }

  // Registration lookup, from the claims that are not verified yet

  std::string issuer, clientId;

  try
  {
    if (!jwt->LookupStringClaim(issuer, JWT_CLAIM_ISS))
    {
      issuer.clear();
    }

    clientId = GetUnverifiedClientId(*jwt);
  }
  catch (Orthanc::OrthancException& e)
  {
    Reject(LaunchStep_Registration, std::string("Cannot read the issuer and the audience: ") + e.What());
  }

  if (issuer.empty() ||
      clientId.empty())
  {
    Reject(LaunchStep_Registration, "The identity token has no issuer or no audience");
  }

  Registration registration;
  bool found = false;

  try
  {
    found = stores_.GetRegistrations().LookupRegistration(registration, issuer, clientId);
  }
  catch (Orthanc::OrthancException& e)
  {
    Fail(LaunchStep_Registration, "Cannot access the registrations", e);
  }

  if (!found)
  {
    Reject(LaunchStep_Registration, "No registration for issuer \"" + issuer + "\" and client \"" + clientId + "\"");
  }

  // Signature verification

  bool genuine = false;

  try
  {
    genuine = platformKeys_.VerifySignature(*jwt, registration.GetKeySetUri());
  }
  catch (Orthanc::OrthancException& e)
  {
    Fail(LaunchStep_Signature, "Cannot retrieve the key set of the platform", e);
  }

  if (!genuine)
  {
    Reject(LaunchStep_Signature, "Invalid signature of the identity token");
  }

  bool current = false;

  try
  {
    current = jwt->IsCurrent(time(NULL), JWT_CLOCK_LEEWAY);
  }
  catch (Orthanc::OrthancException& e)
  {
    Reject(LaunchStep_Signature, std::string("Bad time claims in the identity token: ") + e.What());
  }

  if (!current)
  {
    Reject(LaunchStep_Signature, "The identity token is expired or not valid yet");
  }

  // From now on, the claims can be trusted

  try
  {
    claims = LaunchClaims(jwt->GetPayload());
  }
  catch (Orthanc::OrthancException& e)
  {
    Reject(LaunchStep_Claims, e.What());
  }

  // State check

  std::string state;
  if (!request.LookupFormField(state, FORM_STATE))
  {
    Reject(LaunchStep_State, "No state was provided");
  }

  std::list<std::string> cookies;
  request.GetStateCookies(cookies);

  if (cookies.empty())
  {
    Reject(LaunchStep_State, "No state cookie");
  }

  bool isSameState = false;
  for (std::list<std::string>::const_iterator it = cookies.begin(); it != cookies.end(); ++it)
  {
    if (*it == state)
    {
      isSameState = true;
      break;
    }
  }

  if (!isSameState)
  {
    Reject(LaunchStep_State, "The state does not match the state cookie");
  }

  // Audience check

  if (claims.GetAudience().find(registration.GetClientId()) == claims.GetAudience().end())
  {
    Reject(LaunchStep_Audience, "The client ID \"" + registration.GetClientId() + "\" is not part of the audience");
  }

  // Nonce and target link URI

  if (claims.GetNonce().empty())
  {
    Reject(LaunchStep_Nonce, "No nonce in the identity token");
  }

  if (claims.GetTargetLinkUri().empty())
  {
    Reject(LaunchStep_Nonce, "No target link URI in the identity token");
  }

  NonceStatus nonceStatus = NonceStatus_NotFound;

  try
  {
    nonceStatus = stores_.GetNonces().TestAndClearNonce(claims.GetNonce(), claims.GetTargetLinkUri());
  }
  catch (Orthanc::OrthancException& e)
  {
    Fail(LaunchStep_Nonce, "Cannot access the nonces", e);
  }

  switch (nonceStatus)
  {
    case NonceStatus_Valid:
      break;

    case NonceStatus_NotFound:
      Reject(LaunchStep_Nonce, "Unknown or already used nonce");
      break;

    case NonceStatus_TargetLinkUriMismatch:
      Reject(LaunchStep_Nonce, "The target link URI does not match the login request");
      break;

    default:
      throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  // Deployment check

  if (claims.GetDeploymentId().empty() ||
      claims.GetDeploymentId().size() > LTI_MAX_DEPLOYMENT_ID_LENGTH)
  {
    Reject(LaunchStep_Deployment, "Missing or invalid deployment ID");
  }

  bool isDeployed = false;

  try
  {
    isDeployed = stores_.GetRegistrations().HasDeployment(claims.GetIssuer(), claims.GetDeploymentId());
  }
  catch (Orthanc::OrthancException& e)
  {
    Fail(LaunchStep_Deployment, "Cannot access the deployments", e);
  }

  if (!isDeployed)
  {
    Reject(LaunchStep_Deployment, "Unknown deployment \"" + claims.GetDeploymentId() + "\"");
  }

  // Version and message type

  if (claims.GetVersion() != LTI_SUPPORTED_VERSION)
  {
    Reject(LaunchStep_Version, "Unsupported LTI version \"" + claims.GetVersion() + "\"");
  }

  if (claims.GetMessageType() != LTI_MESSAGE_TYPE_RESOURCE_LINK)
  {
    Reject(LaunchStep_Version, "Unsupported message type \"" + claims.GetMessageType() + "\"");
  }

  // Resource link

  if (!claims.HasResourceLink() ||
      claims.GetResourceLinkId().empty())
  {
    Reject(LaunchStep_ResourceLink, "Missing resource link");
  }

  if (claims.GetResourceLinkId().size() > LTI_MAX_RESOURCE_LINK_ID_LENGTH)
  {
    Reject(LaunchStep_ResourceLink, "The resource link ID exceeds " +
           boost::lexical_cast<std::string>(LTI_MAX_RESOURCE_LINK_ID_LENGTH) + " characters");
  }

  // Store the untouched claims, to be reloaded by the connectors

  const std::string launchId = LTI_LAUNCH_ID_PREFIX + Orthanc::Toolbox::GenerateUuid();

  try
  {
    stores_.GetLaunchData().StoreLaunchData(launchId, jwt->GetRawPayload(),
                                            static_cast<int64_t>(time(NULL)) + launchDataLifetime_);
  }
  catch (Orthanc::OrthancException& e)
  {
    Fail(LaunchStep_LaunchData, "Cannot store the launch data", e);
  }

  LOG(INFO) << "Accepted LTI launch " << launchId << " from issuer " << claims.GetIssuer()
            << " for resource link " << claims.GetResourceLinkId();

  return launchId;
}


void LaunchValidator::Process(ILaunchHandler& handler,
                              const LaunchRequest& request)
{
  LaunchClaims claims;
  const std::string launchId = Validate(claims, request);

  try
  {
    handler.HandleLaunch(launchId, claims);
  }
  catch (LaunchException&)
  {
    throw;
  }
  catch (Orthanc::OrthancException& e)
  {
    Fail(LaunchStep_Handoff, "The launch could not be handed off", e);
  }
}
