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

#include <Logging.h>
#include <OrthancException.h>

#include <boost/noncopyable.hpp>


/**
 * Owns a pointer allocated by OpenSSL. Some OpenSSL destructors
 * return void, others return a status code that must be checked.
 **/
template <typename T>
class PointerRAII : public boost::noncopyable
{
private:
  typedef void (*VoidFree) (T*);
  typedef int (*StatusFree) (T*);

  T*          value_;
  VoidFree    voidFree_;
  StatusFree  statusFree_;
  int         successCode_;

public:
  explicit PointerRAII(VoidFree free) :
    value_(NULL),
    voidFree_(free),
    statusFree_(NULL),
    successCode_(0)
  {
    if (free == NULL)
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_NullPointer);
    }
  }

  PointerRAII(StatusFree free,
              int successCode) :
    value_(NULL),
    voidFree_(NULL),
    statusFree_(free),
    successCode_(successCode)
  {
    if (free == NULL)
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_NullPointer);
    }
  }

  ~PointerRAII()
  {
    Clear();
  }

  bool IsNull() const
  {
    return value_ == NULL;
  }

  void Clear()
  {
    if (value_ != NULL)
    {
      if (voidFree_ != NULL)
      {
        voidFree_(value_);
      }
      else
      {
        const int code = statusFree_(value_);
        if (code != successCode_)
        {
          LOG(ERROR) << "OpenSSL could not release an object, error code: " << code;
        }
      }

      value_ = NULL;
    }
  }

  // Takes ownership, throws if OpenSSL failed to allocate
  void Assign(T* value)
  {
    Clear();

    if (value == NULL)
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_NullPointer, "OpenSSL failed to allocate an object");
    }
    else
    {
      value_ = value;
    }
  }

  T*& GetValue()
  {
    return value_;
  }

  T* GetValue() const
  {
    return value_;
  }
};
