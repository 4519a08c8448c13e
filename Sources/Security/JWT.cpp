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


#include "JWT.h"

#include "../HttpToolbox.h"
#include "SecurityConstants.h"

#include <SerializationToolbox.h>
#include <Toolbox.h>

#include <boost/math/special_functions/round.hpp>
#include <time.h>


static const double JWT_MAX_TIME_CLAIM = 253402300799.0;


static bool LookupTimeClaim(int64_t& target,
                            const Json::Value& payload,
                            const char* claim)
{
  if (!payload.isMember(claim))
  {
    return false;
  }
  else if (payload[claim].isNumeric())
  {
    // The time claims can be either integers or decimals, so we
    // deal with the worst case of a double
    const double value = payload[claim].asDouble();

    // Seconds since the epoch, up to year 9999 (also rejects NaN)
    if (!(value >= -JWT_MAX_TIME_CLAIM &&
          value <= JWT_MAX_TIME_CLAIM))
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Time claim of a JWT is out of range: " + std::string(claim));
    }

    target = static_cast<int64_t>(boost::math::llround(value));
    return true;
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Time claim of a JWT is not a number: " + std::string(claim));
  }
}


JWT::JWT(const std::string& jwt)
{
  std::vector<std::string> tokens;
  Orthanc::Toolbox::TokenizeString(tokens, jwt, '.');

  if (tokens.size() != 3 ||
      tokens[0].empty() ||
      tokens[1].empty() ||
      tokens[2].empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Not a JWT in compact serialization");
  }

  message_ = tokens[0] + "." + tokens[1];

  std::string headerString;
  HttpToolbox::DecodeBase64Url(headerString, tokens[0]);

  Json::Value header;
  if (!Orthanc::Toolbox::ReadJson(header, headerString) ||
      header.type() != Json::objectValue ||
      Orthanc::SerializationToolbox::ReadString(header, JWKS_FIELD_TYP, "JWT") != "JWT")
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Bad header in JWT");
  }

  if (Orthanc::SerializationToolbox::ReadString(header, JWKS_FIELD_ALG) != "RS256")
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_NotImplemented, "Only RS256 is supported for JWT");
  }

  keyId_ = Orthanc::SerializationToolbox::ReadString(header, JWKS_FIELD_KID, "");

  HttpToolbox::DecodeBase64Url(rawPayload_, tokens[1]);

  if (!Orthanc::Toolbox::ReadJson(payload_, rawPayload_) ||
      payload_.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The payload of a JWT must be a JSON object");
  }

  HttpToolbox::DecodeBase64Url(signature_, tokens[2]);
}


bool JWT::LookupStringClaim(std::string& target,
                            const std::string& claim) const
{
  if (payload_.isMember(claim) &&
      payload_[claim].type() == Json::stringValue)
  {
    target = payload_[claim].asString();
    return true;
  }
  else
  {
    return false;
  }
}


void JWT::GetAudience(std::set<std::string>& target) const
{
  target.clear();

  if (!payload_.isMember(JWT_CLAIM_AUD))
  {
    return;
  }

  const Json::Value& audience = payload_[JWT_CLAIM_AUD];

  if (audience.type() == Json::stringValue)
  {
    target.insert(audience.asString());
  }
  else if (audience.type() == Json::arrayValue)
  {
    for (Json::Value::ArrayIndex i = 0; i < audience.size(); i++)
    {
      if (audience[i].type() != Json::stringValue)
      {
        throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Bad audience in JWT");
      }

      target.insert(audience[i].asString());
    }
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Bad audience in JWT");
  }
}


bool JWT::VerifySignature(const RSAPublicKey& key) const
{
  return key.VerifyRS256(signature_, message_);
}


bool JWT::IsCurrent(int64_t now,
                    unsigned int leeway) const
{
  int64_t exp;
  if (LookupTimeClaim(exp, payload_, JWT_CLAIM_EXP) &&
      now >= exp + static_cast<int64_t>(leeway))
  {
    return false;
  }

  int64_t nbf;
  if (LookupTimeClaim(nbf, payload_, JWT_CLAIM_NBF) &&
      now + static_cast<int64_t>(leeway) < nbf)
  {
    return false;
  }

  return true;
}


bool JWT::Verify(const RSAPublicKey& key) const
{
  return (VerifySignature(key) &&
          IsCurrent(time(NULL), JWT_CLOCK_LEEWAY));
}
