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

#include <json/value.h>
#include <string>


// Grade published by the tool for one user
class Score
{
private:
  std::string       timestamp_;
  double            scoreGiven_;
  double            scoreMaximum_;
  std::string       comment_;
  ActivityProgress  activityProgress_;
  GradingProgress   gradingProgress_;
  std::string       userId_;

public:
  Score() :
    scoreGiven_(0),
    scoreMaximum_(0),
    activityProgress_(ActivityProgress_Completed),
    gradingProgress_(GradingProgress_FullyGraded)
  {
  }

  Score(double scoreGiven,
        double scoreMaximum);

  // ISO 8601 with timezone. If empty, the current time is used.
  void SetTimestamp(const std::string& timestamp)
  {
    timestamp_ = timestamp;
  }

  const std::string& GetTimestamp() const
  {
    return timestamp_;
  }

  void SetScore(double given,
                double maximum);

  double GetScoreGiven() const
  {
    return scoreGiven_;
  }

  double GetScoreMaximum() const
  {
    return scoreMaximum_;
  }

  void SetComment(const std::string& comment)
  {
    comment_ = comment;
  }

  const std::string& GetComment() const
  {
    return comment_;
  }

  void SetActivityProgress(ActivityProgress progress)
  {
    activityProgress_ = progress;
  }

  ActivityProgress GetActivityProgress() const
  {
    return activityProgress_;
  }

  void SetGradingProgress(GradingProgress progress)
  {
    gradingProgress_ = progress;
  }

  GradingProgress GetGradingProgress() const
  {
    return gradingProgress_;
  }

  // If empty, the subject of the launch is used
  void SetUserId(const std::string& userId)
  {
    userId_ = userId;
  }

  const std::string& GetUserId() const
  {
    return userId_;
  }

  void Serialize(Json::Value& target) const;

  static void Unserialize(Score& target,
                          const Json::Value& source);

  static std::string GetCurrentTimestamp();
};


// Grade recorded by the platform for one user
class Result
{
private:
  std::string  id_;
  std::string  scoreOf_;
  std::string  userId_;
  double       resultScore_;
  double       resultMaximum_;
  std::string  comment_;

public:
  Result() :
    resultScore_(0),
    resultMaximum_(0)
  {
  }

  const std::string& GetId() const
  {
    return id_;
  }

  // URI of the line item
  const std::string& GetScoreOf() const
  {
    return scoreOf_;
  }

  const std::string& GetUserId() const
  {
    return userId_;
  }

  double GetResultScore() const
  {
    return resultScore_;
  }

  double GetResultMaximum() const
  {
    return resultMaximum_;
  }

  const std::string& GetComment() const
  {
    return comment_;
  }

  void Serialize(Json::Value& target) const;

  static void Unserialize(Result& target,
                          const Json::Value& source);
};


// Column of the gradebook of the platform
class LineItem
{
private:
  std::string  id_;
  std::string  startDateTime_;
  std::string  endDateTime_;
  double       scoreMaximum_;
  std::string  label_;
  std::string  tag_;
  std::string  resourceId_;
  std::string  resourceLinkId_;

public:
  LineItem() :
    scoreMaximum_(0)
  {
  }

  void SetId(const std::string& id)
  {
    id_ = id;
  }

  // URI of the line item, assigned by the platform
  const std::string& GetId() const
  {
    return id_;
  }

  void SetStartDateTime(const std::string& value)
  {
    startDateTime_ = value;
  }

  const std::string& GetStartDateTime() const
  {
    return startDateTime_;
  }

  void SetEndDateTime(const std::string& value)
  {
    endDateTime_ = value;
  }

  const std::string& GetEndDateTime() const
  {
    return endDateTime_;
  }

  void SetScoreMaximum(double value)
  {
    scoreMaximum_ = value;
  }

  double GetScoreMaximum() const
  {
    return scoreMaximum_;
  }

  void SetLabel(const std::string& label)
  {
    label_ = label;
  }

  const std::string& GetLabel() const
  {
    return label_;
  }

  void SetTag(const std::string& tag)
  {
    tag_ = tag;
  }

  const std::string& GetTag() const
  {
    return tag_;
  }

  void SetResourceId(const std::string& resourceId)
  {
    resourceId_ = resourceId;
  }

  const std::string& GetResourceId() const
  {
    return resourceId_;
  }

  void SetResourceLinkId(const std::string& resourceLinkId)
  {
    resourceLinkId_ = resourceLinkId;
  }

  const std::string& GetResourceLinkId() const
  {
    return resourceLinkId_;
  }

  // Empty fields are omitted
  void Serialize(Json::Value& target) const;

  static void Unserialize(LineItem& target,
                          const Json::Value& source);
};
