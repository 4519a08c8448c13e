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


#include "AgsModels.h"

#include <OrthancException.h>
#include <SerializationToolbox.h>

#include <boost/date_time/posix_time/posix_time.hpp>


static double ReadNumber(const Json::Value& source,
                         const std::string& field,
                         double defaultValue)
{
  if (!source.isMember(field) ||
      source[field].isNull())
  {
    return defaultValue;
  }
  else if (source[field].isNumeric())
  {
    return source[field].asDouble();
  }
  else
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Field \"" + field + "\" must be a number");
  }
}


static void CheckObject(const Json::Value& source)
{
  if (source.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Expected a JSON object");
  }
}


static void SetIfNotEmpty(Json::Value& target,
                          const std::string& field,
                          const std::string& value)
{
  if (!value.empty())
  {
    target[field] = value;
  }
}


Score::Score(double scoreGiven,
             double scoreMaximum) :
  activityProgress_(ActivityProgress_Completed),
  gradingProgress_(GradingProgress_FullyGraded)
{
  SetScore(scoreGiven, scoreMaximum);
}


void Score::SetScore(double given,
                     double maximum)
{
  if (given < 0 ||
      maximum < 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "Scores cannot be negative");
  }

  scoreGiven_ = given;
  scoreMaximum_ = maximum;
}


void Score::Serialize(Json::Value& target) const
{
  target = Json::objectValue;
  target["timestamp"] = (timestamp_.empty() ? GetCurrentTimestamp() : timestamp_);
  target["scoreGiven"] = scoreGiven_;
  target["scoreMaximum"] = scoreMaximum_;
  target["comment"] = comment_;
  target["activityProgress"] = EnumerationToString(activityProgress_);
  target["gradingProgress"] = EnumerationToString(gradingProgress_);
  target["userId"] = userId_;
}


void Score::Unserialize(Score& target,
                        const Json::Value& source)
{
  CheckObject(source);

  target = Score(ReadNumber(source, "scoreGiven", 0), ReadNumber(source, "scoreMaximum", 0));
  target.SetTimestamp(Orthanc::SerializationToolbox::ReadString(source, "timestamp", ""));
  target.SetComment(Orthanc::SerializationToolbox::ReadString(source, "comment", ""));
  target.SetUserId(Orthanc::SerializationToolbox::ReadString(source, "userId", ""));

  std::string s = Orthanc::SerializationToolbox::ReadString(source, "activityProgress", "");
  if (!s.empty())
  {
    target.SetActivityProgress(ParseActivityProgress(s));
  }

  s = Orthanc::SerializationToolbox::ReadString(source, "gradingProgress", "");
  if (!s.empty())
  {
    target.SetGradingProgress(ParseGradingProgress(s));
  }
}


std::string Score::GetCurrentTimestamp()
{
  // The platforms expect an explicit timezone
  return boost::posix_time::to_iso_extended_string(boost::posix_time::microsec_clock::universal_time()) + "Z";
}


void Result::Serialize(Json::Value& target) const
{
  target = Json::objectValue;
  target["id"] = id_;
  target["scoreOf"] = scoreOf_;
  target["userId"] = userId_;
  target["resultScore"] = resultScore_;
  target["resultMaximum"] = resultMaximum_;
  target["comment"] = comment_;
}


void Result::Unserialize(Result& target,
                         const Json::Value& source)
{
  CheckObject(source);

  target.id_ = Orthanc::SerializationToolbox::ReadString(source, "id", "");
  target.scoreOf_ = Orthanc::SerializationToolbox::ReadString(source, "scoreOf", "");
  target.userId_ = Orthanc::SerializationToolbox::ReadString(source, "userId", "");
  target.resultScore_ = ReadNumber(source, "resultScore", 0);
  target.resultMaximum_ = ReadNumber(source, "resultMaximum", 0);
  target.comment_ = Orthanc::SerializationToolbox::ReadString(source, "comment", "");
}


void LineItem::Serialize(Json::Value& target) const
{
  target = Json::objectValue;
  SetIfNotEmpty(target, "id", id_);
  SetIfNotEmpty(target, "startDateTime", startDateTime_);
  SetIfNotEmpty(target, "endDateTime", endDateTime_);
  SetIfNotEmpty(target, "label", label_);
  SetIfNotEmpty(target, "tag", tag_);
  SetIfNotEmpty(target, "resourceId", resourceId_);
  SetIfNotEmpty(target, "resourceLinkId", resourceLinkId_);

  if (scoreMaximum_ != 0)
  {
    target["scoreMaximum"] = scoreMaximum_;
  }
}


void LineItem::Unserialize(LineItem& target,
                           const Json::Value& source)
{
  CheckObject(source);

  target.id_ = Orthanc::SerializationToolbox::ReadString(source, "id", "");
  target.startDateTime_ = Orthanc::SerializationToolbox::ReadString(source, "startDateTime", "");
  target.endDateTime_ = Orthanc::SerializationToolbox::ReadString(source, "endDateTime", "");
  target.scoreMaximum_ = ReadNumber(source, "scoreMaximum", 0);
  target.label_ = Orthanc::SerializationToolbox::ReadString(source, "label", "");
  target.tag_ = Orthanc::SerializationToolbox::ReadString(source, "tag", "");
  target.resourceId_ = Orthanc::SerializationToolbox::ReadString(source, "resourceId", "");
  target.resourceLinkId_ = Orthanc::SerializationToolbox::ReadString(source, "resourceLinkId", "");
}
