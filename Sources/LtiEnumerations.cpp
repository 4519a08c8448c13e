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


#include "LtiEnumerations.h"

#include <OrthancException.h>


const char* EnumerationToString(LaunchStep step)
{
  switch (step)
  {
  case LaunchStep_TokenIntake:
    return "token intake";

  case LaunchStep_Registration:
    return "registration lookup";

  case LaunchStep_Signature:
    return "signature verification";

  case LaunchStep_Claims:
    return "claims decoding";

  case LaunchStep_State:
    return "state check";

  case LaunchStep_Audience:
    return "audience check";

  case LaunchStep_Nonce:
    return "nonce check";

  case LaunchStep_Deployment:
    return "deployment check";

  case LaunchStep_Version:
    return "version check";

  case LaunchStep_ResourceLink:
    return "resource link check";

  case LaunchStep_LaunchData:
    return "launch data storage";

  case LaunchStep_Handoff:
    return "handoff";

  default:
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}


const char* EnumerationToString(NonceStatus status)
{
  switch (status)
  {
  case NonceStatus_Valid:
    return "valid";

  case NonceStatus_NotFound:
    return "nonce not found";

  case NonceStatus_TargetLinkUriMismatch:
    return "target link URI mismatch";

  default:
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}


const char* EnumerationToString(AccessTokenStatus status)
{
  switch (status)
  {
  case AccessTokenStatus_Valid:
    return "valid";

  case AccessTokenStatus_NotFound:
    return "access token not found";

  case AccessTokenStatus_Expired:
    return "access token expired";

  default:
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}


const char* EnumerationToString(ActivityProgress progress)
{
  switch (progress)
  {
  case ActivityProgress_Initialized:
    return "Initialized";

  case ActivityProgress_Started:
    return "Started";

  case ActivityProgress_InProgress:
    return "InProgress";

  case ActivityProgress_Submitted:
    return "Submitted";

  case ActivityProgress_Completed:
    return "Completed";

  default:
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}


ActivityProgress ParseActivityProgress(const std::string& progress)
{
  if (progress == "Initialized")
  {
    return ActivityProgress_Initialized;
  }
  else if (progress == "Started")
  {
    return ActivityProgress_Started;
  }
  else if (progress == "InProgress")
  {
    return ActivityProgress_InProgress;
  }
  else if (progress == "Submitted")
  {
    return ActivityProgress_Submitted;
  }
  else if (progress == "Completed")
  {
    return ActivityProgress_Completed;
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "Unknown activity progress: " + progress);
  }
}


const char* EnumerationToString(GradingProgress progress)
{
  switch (progress)
  {
  case GradingProgress_FullyGraded:
    return "FullyGraded";

  case GradingProgress_Pending:
    return "Pending";

  case GradingProgress_PendingManual:
    return "PendingManual";

  case GradingProgress_Failed:
    return "Failed";

  case GradingProgress_NotReady:
    return "NotReady";

  default:
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}


GradingProgress ParseGradingProgress(const std::string& progress)
{
  if (progress == "FullyGraded")
  {
    return GradingProgress_FullyGraded;
  }
  else if (progress == "Pending")
  {
    return GradingProgress_Pending;
  }
  else if (progress == "PendingManual")
  {
    return GradingProgress_PendingManual;
  }
  else if (progress == "Failed")
  {
    return GradingProgress_Failed;
  }
  else if (progress == "NotReady")
  {
    return GradingProgress_NotReady;
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "Unknown grading progress: " + progress);
  }
}


const char* EnumerationToString(CookieSameSite sameSite)
{
  switch (sameSite)
  {
  case CookieSameSite_Lax:
    return "Lax";

  case CookieSameSite_None:
    return "None";

  default:
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }
}
