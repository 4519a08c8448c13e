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


#include "OpenSSLSerializationContext.h"


OpenSSLSerializationContext::OpenSSLSerializationContext() :
  bio_(BIO_free, 1 /* success code of BIO_free() */)
{
  bio_.Assign(BIO_new(BIO_s_mem()));
}


void OpenSSLSerializationContext::Write(std::string& target)
{
  // The memory is still owned by the BIO, hence "BIO_get_mem_data()" instead of "BIO_get_mem_ptr()"
  char* data = NULL;
  const long size = BIO_get_mem_data(bio_.GetValue(), &data);

  if (size < 0 ||
      (size > 0 && data == NULL))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Cannot read the memory BIO of OpenSSL");
  }

  target.assign(data == NULL ? "" : data, static_cast<size_t>(size));
}
