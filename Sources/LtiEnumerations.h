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

#include <string>


enum LaunchStep
{
  LaunchStep_TokenIntake,
  LaunchStep_Registration,
  LaunchStep_Signature,
  LaunchStep_Claims,
  LaunchStep_State,
  LaunchStep_Audience,
  LaunchStep_Nonce,
  LaunchStep_Deployment,
  LaunchStep_Version,
  LaunchStep_ResourceLink,
  LaunchStep_LaunchData,
  LaunchStep_Handoff
};

enum LaunchFailure
{
  LaunchFailure_ClientError,  // Rendered as HTTP 400, never retried
  LaunchFailure_ServerError   // Rendered as HTTP 500, caller may retry
};

enum NonceStatus
{
  NonceStatus_Valid,
  NonceStatus_NotFound,
  NonceStatus_TargetLinkUriMismatch
};

enum AccessTokenStatus
{
  AccessTokenStatus_Valid,
  AccessTokenStatus_NotFound,
  AccessTokenStatus_Expired
};

enum ActivityProgress
{
  ActivityProgress_Initialized,
  ActivityProgress_Started,
  ActivityProgress_InProgress,
  ActivityProgress_Submitted,
  ActivityProgress_Completed
};

enum GradingProgress
{
  GradingProgress_FullyGraded,
  GradingProgress_Pending,
  GradingProgress_PendingManual,
  GradingProgress_Failed,
  GradingProgress_NotReady
};

enum CookieSameSite
{
  CookieSameSite_Lax,
  CookieSameSite_None,
  CookieSameSite_Unspecified  // Legacy browsers that reject "SameSite=None"
};


const char* EnumerationToString(LaunchStep step);

const char* EnumerationToString(NonceStatus status);

const char* EnumerationToString(AccessTokenStatus status);

const char* EnumerationToString(ActivityProgress progress);

ActivityProgress ParseActivityProgress(const std::string& progress);

const char* EnumerationToString(GradingProgress progress);

GradingProgress ParseGradingProgress(const std::string& progress);

const char* EnumerationToString(CookieSameSite sameSite);
