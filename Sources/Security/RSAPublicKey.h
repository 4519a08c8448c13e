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

#include "PointerRAII.h"

#include <openssl/evp.h>
#include <json/value.h>
#include <string>

class RSAPrivateKey;


class RSAPublicKey : public boost::noncopyable
{
private:
  PointerRAII<EVP_PKEY>   key_;

public:
  RSAPublicKey() :
    key_(EVP_PKEY_free)
  {
  }

  bool IsValid() const
  {
    return !key_.IsNull();
  }

  void LoadFromPrivate(const RSAPrivateKey& privateKey);

  void Unserialize(const std::string& pem);

  bool VerifyRS256(const std::string& signature,
                   const std::string& message) const;

  // Imports one entry of a JSON Web Key Set
  void ImportJwk(const Json::Value& jwk);
};
