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

#include <json/value.h>
#include <list>
#include <string>


// Participant of the context (course) of a launch
class Member
{
private:
  std::string             status_;
  std::string             name_;
  std::string             picture_;
  std::string             givenName_;
  std::string             familyName_;
  std::string             middleName_;
  std::string             email_;
  std::string             userId_;
  std::string             lisPersonSourcedId_;
  std::list<std::string>  roles_;

public:
  void SetStatus(const std::string& status)
  {
    status_ = status;
  }

  const std::string& GetStatus() const
  {
    return status_;
  }

  void SetName(const std::string& name)
  {
    name_ = name;
  }

  const std::string& GetName() const
  {
    return name_;
  }

  const std::string& GetPicture() const
  {
    return picture_;
  }

  void SetGivenName(const std::string& name)
  {
    givenName_ = name;
  }

  const std::string& GetGivenName() const
  {
    return givenName_;
  }

  void SetFamilyName(const std::string& name)
  {
    familyName_ = name;
  }

  const std::string& GetFamilyName() const
  {
    return familyName_;
  }

  const std::string& GetMiddleName() const
  {
    return middleName_;
  }

  void SetEmail(const std::string& email)
  {
    email_ = email;
  }

  const std::string& GetEmail() const
  {
    return email_;
  }

  void SetUserId(const std::string& userId)
  {
    userId_ = userId;
  }

  const std::string& GetUserId() const
  {
    return userId_;
  }

  const std::string& GetLisPersonSourcedId() const
  {
    return lisPersonSourcedId_;
  }

  const std::list<std::string>& GetRoles() const
  {
    return roles_;
  }

  void Serialize(Json::Value& target) const;

  static void Unserialize(Member& target,
                          const Json::Value& source);
};


class Membership
{
private:
  std::string        id_;
  std::string        contextId_;
  std::string        contextLabel_;
  std::string        contextTitle_;
  std::list<Member>  members_;

public:
  const std::string& GetId() const
  {
    return id_;
  }

  const std::string& GetContextId() const
  {
    return contextId_;
  }

  const std::string& GetContextLabel() const
  {
    return contextLabel_;
  }

  const std::string& GetContextTitle() const
  {
    return contextTitle_;
  }

  const std::list<Member>& GetMembers() const
  {
    return members_;
  }

  // Used to accumulate the members of successive pages
  void AppendMembers(const Membership& other);

  void Serialize(Json::Value& target) const;

  static void Unserialize(Membership& target,
                          const Json::Value& source);
};
