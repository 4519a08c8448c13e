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

#include "RSAPrivateKey.h"

#include <boost/thread/mutex.hpp>


// The key pair the tool uses to sign its client assertions
class ToolKeyPair : public boost::noncopyable
{
private:
  boost::mutex   mutex_;
  RSAPrivateKey  privateKey_;
  std::string    keyId_;

public:
  bool IsLoaded();

  void Generate(unsigned int bits = 2048);

  void Load(const std::string& keyId,
            const std::string& pem);

  std::string GetKeyId();

  // Single-entry key set, to be published to the platforms
  void FormatJwks(Json::Value& target);

  void ExportPrivateKey(std::string& keyId,
                        std::string& pem);
};
