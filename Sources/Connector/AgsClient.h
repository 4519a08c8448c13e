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

#include "AgsModels.h"
#include "Connector.h"

#include <list>


/**
 * Client of the Assignment and Grade Services (AGS 2.0) of the
 * platform, for the line item of the launch. Throws
 * "ErrorCode_NotImplemented" if the platform has not enabled the
 * service, or a scope that is needed by an operation, for this
 * launch.
 **/
class AgsClient : public boost::noncopyable
{
private:
  Connector&             connector_;
  std::string            lineItem_;
  std::string            lineItems_;
  std::set<std::string>  scopes_;

  void CheckScope(const std::string& scope) const;

  void AddLineItemReadScope(ServiceRequest& request) const;

  void AddScope(ServiceRequest& request,
                const std::string& scope) const;

  void ReadAllResults(std::list<Result>& target,
                      const std::string& userId);

public:
  explicit AgsClient(Connector& connector);

  const std::string& GetLineItemUri() const
  {
    return lineItem_;
  }

  const std::string& GetLineItemsUri() const
  {
    return lineItems_;
  }

  const std::set<std::string>& GetScopes() const
  {
    return scopes_;
  }

  bool HasScope(const std::string& scope) const
  {
    return scopes_.find(scope) != scopes_.end();
  }

  void PutScore(const Score& score);

  void GetResults(std::list<Result>& target);

  void GetUserResults(std::list<Result>& target,
                      const std::string& userId);

  /**
   * Retrieves one page of results. "limit" is a hint that the
   * platform is free to ignore, 0 means no limit. An empty "userId"
   * retrieves the results of all the users.
   **/
  bool GetPagedResults(std::list<Result>& page,
                       std::string& cursor,
                       unsigned int limit,
                       const std::string& userId);

  // If "targetUri" is empty, the line item of the launch is retrieved
  void GetLineItem(LineItem& target,
                   const std::string& targetUri);

  void GetLineItems(std::list<LineItem>& target);

  void CreateLineItem(LineItem& created,
                      const LineItem& lineItem);

  // If "targetUri" is empty, the line item of the launch is updated
  void UpdateLineItem(LineItem& updated,
                      const LineItem& lineItem,
                      const std::string& targetUri);

  // If "targetUri" is empty, the line item of the launch is deleted
  void DeleteLineItem(const std::string& targetUri);
};
