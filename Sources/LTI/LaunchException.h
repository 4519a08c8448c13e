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

#include "../LtiEnumerations.h"

#include <OrthancException.h>

#include <stdint.h>


/**
 * Rejection of a launch by one of the steps of the validation
 * pipeline. Client errors are rendered as HTTP 400, server errors as
 * HTTP 500. The details never contain the token or any secret.
 **/
class LaunchException : public Orthanc::OrthancException
{
private:
  LaunchStep     step_;
  LaunchFailure  failure_;

public:
  LaunchException(LaunchStep step,
                  LaunchFailure failure,
                  const std::string& reason);

  LaunchStep GetStep() const
  {
    return step_;
  }

  LaunchFailure GetFailure() const
  {
    return failure_;
  }

  bool IsClientError() const
  {
    return failure_ == LaunchFailure_ClientError;
  }

  uint16_t GetHttpStatusCode() const
  {
    return (IsClientError() ? 400 : 500);
  }
};
