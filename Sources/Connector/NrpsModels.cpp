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


#include "NrpsModels.h"

#include <OrthancException.h>
#include <SerializationToolbox.h>


void Member::Serialize(Json::Value& target) const
{
  target = Json::objectValue;
  target["status"] = status_;
  target["name"] = name_;
  target["picture"] = picture_;
  target["given_name"] = givenName_;
  target["family_name"] = familyName_;
  target["middle_name"] = middleName_;
  target["email"] = email_;
  target["user_id"] = userId_;
  target["lis_person_sourcedid"] = lisPersonSourcedId_;

  Json::Value roles = Json::arrayValue;
  for (std::list<std::string>::const_iterator it = roles_.begin(); it != roles_.end(); ++it)
  {
    roles.append(*it);
  }

  target["roles"] = roles;
}


void Member::Unserialize(Member& target,
                         const Json::Value& source)
{
  if (source.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "A member must be a JSON object");
  }

  target.status_ = Orthanc::SerializationToolbox::ReadString(source, "status", "");
  target.name_ = Orthanc::SerializationToolbox::ReadString(source, "name", "");
  target.picture_ = Orthanc::SerializationToolbox::ReadString(source, "picture", "");
  target.givenName_ = Orthanc::SerializationToolbox::ReadString(source, "given_name", "");
  target.familyName_ = Orthanc::SerializationToolbox::ReadString(source, "family_name", "");
  target.middleName_ = Orthanc::SerializationToolbox::ReadString(source, "middle_name", "");
  target.email_ = Orthanc::SerializationToolbox::ReadString(source, "email", "");
  target.userId_ = Orthanc::SerializationToolbox::ReadString(source, "user_id");
  target.lisPersonSourcedId_ = Orthanc::SerializationToolbox::ReadString(source, "lis_person_sourcedid", "");

  target.roles_.clear();
  if (source.isMember("roles"))
  {
    Orthanc::SerializationToolbox::ReadListOfStrings(target.roles_, source, "roles");
  }
}


void Membership::AppendMembers(const Membership& other)
{
  if (id_.empty())
  {
    id_ = other.id_;
    contextId_ = other.contextId_;
    contextLabel_ = other.contextLabel_;
    contextTitle_ = other.contextTitle_;
  }

  members_.insert(members_.end(), other.members_.begin(), other.members_.end());
}


void Membership::Serialize(Json::Value& target) const
{
  target = Json::objectValue;
  target["id"] = id_;
  target["context"]["id"] = contextId_;
  target["context"]["label"] = contextLabel_;
  target["context"]["title"] = contextTitle_;

  Json::Value members = Json::arrayValue;
  for (std::list<Member>::const_iterator it = members_.begin(); it != members_.end(); ++it)
  {
    Json::Value member;
    it->Serialize(member);
    members.append(member);
  }

  target["members"] = members;
}


void Membership::Unserialize(Membership& target,
                             const Json::Value& source)
{
  if (source.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "A membership container must be a JSON object");
  }

  target.id_ = Orthanc::SerializationToolbox::ReadString(source, "id", "");

  if (source.isMember("context") &&
      source["context"].type() == Json::objectValue)
  {
    const Json::Value& context = source["context"];
    target.contextId_ = Orthanc::SerializationToolbox::ReadString(context, "id", "");
    target.contextLabel_ = Orthanc::SerializationToolbox::ReadString(context, "label", "");
    target.contextTitle_ = Orthanc::SerializationToolbox::ReadString(context, "title", "");
  }
  else
  {
    target.contextId_.clear();
    target.contextLabel_.clear();
    target.contextTitle_.clear();
  }

  target.members_.clear();

  if (source.isMember("members"))
  {
    const Json::Value& members = source["members"];
    if (members.type() != Json::arrayValue)
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The members must be a JSON array");
    }

    for (Json::Value::ArrayIndex i = 0; i < members.size(); i++)
    {
      Member member;
      Member::Unserialize(member, members[i]);
      target.members_.push_back(member);
    }
  }
}
