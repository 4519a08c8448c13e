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


#include "ToolKeyPair.h"

#include "SecurityConstants.h"

#include <Logging.h>
#include <Toolbox.h>


bool ToolKeyPair::IsLoaded()
{
  boost::mutex::scoped_lock lock(mutex_);
  return privateKey_.IsValid();
}


void ToolKeyPair::Generate(unsigned int bits)
{
  boost::mutex::scoped_lock lock(mutex_);

  LOG(WARNING) << "Generating a private RSA key using OpenSSL";
  privateKey_.Generate(bits);
  keyId_ = Orthanc::Toolbox::GenerateUuid();
  LOG(INFO) << "Generation of the private RSA key is done, key ID: " << keyId_;
}


void ToolKeyPair::Load(const std::string& keyId,
                       const std::string& pem)
{
  if (keyId.empty() ||
      pem.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "Both the key ID and the PEM are required");
  }

  boost::mutex::scoped_lock lock(mutex_);
  privateKey_.Unserialize(pem);
  keyId_ = keyId;
}


std::string ToolKeyPair::GetKeyId()
{
  boost::mutex::scoped_lock lock(mutex_);
  return keyId_;
}


void ToolKeyPair::FormatJwks(Json::Value& target)
{
  Json::Value key;

  {
    boost::mutex::scoped_lock lock(mutex_);

    if (!privateKey_.IsValid())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "The private key of the tool is not configured");
    }

    privateKey_.ExportJwk(key, keyId_);
  }

  Json::Value keys = Json::arrayValue;
  keys.append(key);

  target = Json::objectValue;
  target[JWKS_FIELD_KEYS] = keys;
}


void ToolKeyPair::ExportPrivateKey(std::string& keyId,
                                   std::string& pem)
{
  boost::mutex::scoped_lock lock(mutex_);

  if (!privateKey_.IsValid())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "The private key of the tool is not configured");
  }

  privateKey_.SerializePrivate(pem);
  keyId = keyId_;
}
