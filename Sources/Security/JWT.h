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

#include "RSAPublicKey.h"

#include <json/value.h>
#include <set>
#include <stdint.h>


/**
 * JSON Web Token in its compact serialization. Only RS256 is
 * supported. Parsing does not imply trust: the signature must be
 * checked with "VerifySignature()" before using the claims.
 **/
class JWT : public boost::noncopyable
{
private:
  std::string  message_;     // "header.payload", as signed
  std::string  signature_;
  std::string  keyId_;
  std::string  rawPayload_;
  Json::Value  payload_;

public:
  explicit JWT(const std::string& jwt);

  bool HasKeyId() const
  {
    return !keyId_.empty();
  }

  const std::string& GetKeyId() const
  {
    return keyId_;
  }

  const Json::Value& GetPayload() const
  {
    return payload_;
  }

  // The claims exactly as transmitted by the issuer
  const std::string& GetRawPayload() const
  {
    return rawPayload_;
  }

  bool LookupStringClaim(std::string& target,
                         const std::string& claim) const;

  // The "aud" claim is either a string or an array of strings
  void GetAudience(std::set<std::string>& target) const;

  bool VerifySignature(const RSAPublicKey& key) const;

  // Checks "exp" and "nbf", tolerating some clock skew
  bool IsCurrent(int64_t now,
                 unsigned int leeway) const;

  bool Verify(const RSAPublicKey& key) const;
};
