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

#include "IHttpClient.h"

#include <Compatibility.h>


// Outbound HTTP calls through the libcurl wrapper of the Orthanc framework
class OrthancHttpClient : public IHttpClient
{
private:
  bool  verifyPeers_;

public:
  OrthancHttpClient() :
    verifyPeers_(true)
  {
  }

  void SetHttpsVerifyPeers(bool verify)
  {
    verifyPeers_ = verify;
  }

  virtual void Execute(HttpResponse& response,
                       const HttpRequest& request) ORTHANC_OVERRIDE;
};
