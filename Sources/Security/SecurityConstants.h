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

// https://datatracker.ietf.org/doc/html/rfc7517

static const char* const JWKS_FIELD_ALG = "alg";
static const char* const JWKS_FIELD_E = "e";
static const char* const JWKS_FIELD_KEYS = "keys";
static const char* const JWKS_FIELD_KID = "kid";
static const char* const JWKS_FIELD_KTY = "kty";
static const char* const JWKS_FIELD_N = "n";
static const char* const JWKS_FIELD_TYP = "typ";
static const char* const JWKS_FIELD_USE = "use";

// https://datatracker.ietf.org/doc/html/rfc7519#section-4.1

static const char* const JWT_CLAIM_AUD = "aud";
static const char* const JWT_CLAIM_AZP = "azp";
static const char* const JWT_CLAIM_EXP = "exp";
static const char* const JWT_CLAIM_IAT = "iat";
static const char* const JWT_CLAIM_ISS = "iss";
static const char* const JWT_CLAIM_JTI = "jti";
static const char* const JWT_CLAIM_NBF = "nbf";
static const char* const JWT_CLAIM_NONCE = "nonce";
static const char* const JWT_CLAIM_SUB = "sub";

static const unsigned int JWT_CLOCK_LEEWAY = 60;  // In seconds
