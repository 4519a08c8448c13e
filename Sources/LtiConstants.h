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

#include <stddef.h>

// https://www.imsglobal.org/spec/lti/v1p3

static const char* const LTI_SUPPORTED_VERSION = "1.3.0";
static const char* const LTI_MESSAGE_TYPE_RESOURCE_LINK = "LtiResourceLinkRequest";

static const char* const LTI_CLAIM_DEPLOYMENT_ID = "https://purl.imsglobal.org/spec/lti/claim/deployment_id";
static const char* const LTI_CLAIM_MESSAGE_TYPE = "https://purl.imsglobal.org/spec/lti/claim/message_type";
static const char* const LTI_CLAIM_RESOURCE_LINK = "https://purl.imsglobal.org/spec/lti/claim/resource_link";
static const char* const LTI_CLAIM_TARGET_LINK_URI = "https://purl.imsglobal.org/spec/lti/claim/target_link_uri";
static const char* const LTI_CLAIM_VERSION = "https://purl.imsglobal.org/spec/lti/claim/version";
static const char* const LTI_CLAIM_AGS_ENDPOINT = "https://purl.imsglobal.org/spec/lti-ags/claim/endpoint";
static const char* const LTI_CLAIM_NRPS = "https://purl.imsglobal.org/spec/lti-nrps/claim/namesroleservice";

static const char* const LTI_SCOPE_AGS_LINE_ITEM = "https://purl.imsglobal.org/spec/lti-ags/scope/lineitem";
static const char* const LTI_SCOPE_AGS_LINE_ITEM_READONLY = "https://purl.imsglobal.org/spec/lti-ags/scope/lineitem.readonly";
static const char* const LTI_SCOPE_AGS_RESULT_READONLY = "https://purl.imsglobal.org/spec/lti-ags/scope/result.readonly";
static const char* const LTI_SCOPE_AGS_SCORE = "https://purl.imsglobal.org/spec/lti-ags/scope/score";
static const char* const LTI_SCOPE_NRPS_MEMBERSHIP_READONLY = "https://purl.imsglobal.org/spec/lti-nrps/scope/contextmembership.readonly";

static const char* const MIME_JSON = "application/json";
static const char* const MIME_LTI_SCORE = "application/vnd.ims.lis.v1.score+json";
static const char* const MIME_LTI_RESULT_CONTAINER = "application/vnd.ims.lis.v2.resultcontainer+json";
static const char* const MIME_LTI_LINE_ITEM = "application/vnd.ims.lis.v2.lineitem+json";
static const char* const MIME_LTI_LINE_ITEM_CONTAINER = "application/vnd.ims.lis.v2.lineitemcontainer+json";
static const char* const MIME_LTI_MEMBERSHIP_CONTAINER = "application/vnd.ims.lti-nrps.v2.membershipcontainer+json";

static const char* const LTI_COOKIE_STATE = "lti-state";
static const char* const LTI_COOKIE_STATE_LEGACY = "lti-state-legacy";
static const char* const LTI_STATE_PREFIX = "state-";
static const char* const LTI_LAUNCH_ID_PREFIX = "lti1p3-launch-";

static const size_t LTI_MAX_DEPLOYMENT_ID_LENGTH = 255;
static const size_t LTI_MAX_RESOURCE_LINK_ID_LENGTH = 255;

static const unsigned int LTI_DEFAULT_HTTP_TIMEOUT = 15;  // In seconds
static const unsigned int LTI_DEFAULT_LAUNCH_DATA_LIFETIME = 3600;  // In seconds
static const unsigned int LTI_DEFAULT_PLATFORM_KEYS_MAX_AGE = 60;  // In seconds
