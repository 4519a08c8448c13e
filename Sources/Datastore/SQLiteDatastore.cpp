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


#include "SQLiteDatastore.h"

#include <Logging.h>
#include <OrthancException.h>
#include <SQLite/Statement.h>
#include <SQLite/Transaction.h>

#include <time.h>


static void ExecuteSql(Orthanc::SQLite::Connection& db,
                       const char* sql)
{
  if (!db.Execute(sql))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot initialize the LTI store");
  }
}


void SQLiteDatastore::Initialize()
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Transaction transaction(db_);
  transaction.Begin();

  if (!db_.DoesTableExist("Registrations"))
  {
    LOG(INFO) << "Creating the tables of the LTI store";

    ExecuteSql(db_, "CREATE TABLE Registrations("
                "issuer TEXT NOT NULL, "
                "clientId TEXT NOT NULL, "
                "tokenUri TEXT NOT NULL, "
                "authLoginUri TEXT NOT NULL, "
                "keySetUri TEXT NOT NULL, "
                "targetLinkUri TEXT NOT NULL, "
                "PRIMARY KEY(issuer, clientId))");

    ExecuteSql(db_, "CREATE TABLE Deployments("
                "issuer TEXT NOT NULL, "
                "deploymentId TEXT NOT NULL, "
                "PRIMARY KEY(issuer, deploymentId))");

    ExecuteSql(db_, "CREATE TABLE Nonces("
                "nonce TEXT PRIMARY KEY, "
                "targetLinkUri TEXT NOT NULL)");

    ExecuteSql(db_, "CREATE TABLE LaunchData("
                "launchId TEXT PRIMARY KEY, "
                "claims TEXT NOT NULL, "
                "expiration INTEGER NOT NULL)");

    ExecuteSql(db_, "CREATE TABLE AccessTokens("
                "tokenUri TEXT NOT NULL, "
                "clientId TEXT NOT NULL, "
                "scopes TEXT NOT NULL, "
                "token TEXT NOT NULL, "
                "expiration INTEGER NOT NULL, "
                "PRIMARY KEY(tokenUri, clientId, scopes))");
  }

  transaction.Commit();
}


SQLiteDatastore::SQLiteDatastore()
{
  db_.OpenInMemory();
  Initialize();
}


SQLiteDatastore::SQLiteDatastore(const std::string& path)
{
  LOG(WARNING) << "Opening the LTI store: " << path;
  db_.Open(path);
  Initialize();
}


void SQLiteDatastore::StoreRegistration(const Registration& registration)
{
  registration.Check();

  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE,
                               "INSERT OR REPLACE INTO Registrations VALUES(?, ?, ?, ?, ?, ?)");
  s.BindString(0, registration.GetIssuer());
  s.BindString(1, registration.GetClientId());
  s.BindString(2, registration.GetTokenUri());
  s.BindString(3, registration.GetAuthLoginUri());
  s.BindString(4, registration.GetKeySetUri());
  s.BindString(5, registration.GetTargetLinkUri());

  if (!s.Run())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot store a registration");
  }
}


static void ReadRegistration(Registration& target,
                             Orthanc::SQLite::Statement& s)
{
  target = Registration(s.ColumnString(0), s.ColumnString(1), s.ColumnString(2),
                        s.ColumnString(3), s.ColumnString(4), s.ColumnString(5));
}


bool SQLiteDatastore::LookupRegistration(Registration& target,
                                         const std::string& issuer,
                                         const std::string& clientId)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE,
                               "SELECT issuer, clientId, tokenUri, authLoginUri, keySetUri, targetLinkUri "
                               "FROM Registrations WHERE issuer=? AND clientId=?");
  s.BindString(0, issuer);
  s.BindString(1, clientId);

  if (s.Step())
  {
    ReadRegistration(target, s);
    return true;
  }
  else
  {
    return false;
  }
}


bool SQLiteDatastore::LookupUniqueRegistration(Registration& target,
                                               const std::string& issuer)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE,
                               "SELECT issuer, clientId, tokenUri, authLoginUri, keySetUri, targetLinkUri "
                               "FROM Registrations WHERE issuer=? LIMIT 2");
  s.BindString(0, issuer);

  if (!s.Step())
  {
    return false;
  }

  Registration registration;
  ReadRegistration(registration, s);

  if (s.Step())
  {
    return false;  // Ambiguous, the client ID is needed
  }
  else
  {
    target = registration;
    return true;
  }
}


void SQLiteDatastore::StoreDeployment(const std::string& issuer,
                                      const std::string& deploymentId)
{
  Registration::CheckDeploymentId(deploymentId);

  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "INSERT OR IGNORE INTO Deployments VALUES(?, ?)");
  s.BindString(0, issuer);
  s.BindString(1, deploymentId);

  if (!s.Run())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot store a deployment");
  }
}


bool SQLiteDatastore::HasDeployment(const std::string& issuer,
                                    const std::string& deploymentId)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "SELECT 1 FROM Deployments WHERE issuer=? AND deploymentId=?");
  s.BindString(0, issuer);
  s.BindString(1, deploymentId);

  return s.Step();
}


void SQLiteDatastore::StoreNonce(const std::string& nonce,
                                 const std::string& targetLinkUri)
{
  if (nonce.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "INSERT OR REPLACE INTO Nonces VALUES(?, ?)");
  s.BindString(0, nonce);
  s.BindString(1, targetLinkUri);

  if (!s.Run())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot store a nonce");
  }
}


NonceStatus SQLiteDatastore::TestAndClearNonce(const std::string& nonce,
                                               const std::string& targetLinkUri)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Transaction transaction(db_);
  transaction.Begin();

  std::string storedUri;

  {
    Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "SELECT targetLinkUri FROM Nonces WHERE nonce=?");
    s.BindString(0, nonce);

    if (!s.Step())
    {
      transaction.Commit();
      return NonceStatus_NotFound;
    }

    storedUri = s.ColumnString(0);
  }

  {
    Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "DELETE FROM Nonces WHERE nonce=?");
    s.BindString(0, nonce);

    if (!s.Run())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot clear a nonce");
    }
  }

  transaction.Commit();

  if (storedUri == targetLinkUri)
  {
    return NonceStatus_Valid;
  }
  else
  {
    return NonceStatus_TargetLinkUriMismatch;
  }
}


void SQLiteDatastore::StoreLaunchData(const std::string& launchId,
                                      const std::string& claims,
                                      int64_t expiration)
{
  if (launchId.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange);
  }

  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Transaction transaction(db_);
  transaction.Begin();

  {
    Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "DELETE FROM LaunchData WHERE expiration<=?");
    s.BindInt64(0, time(NULL));

    if (!s.Run())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot purge the expired launch data");
    }
  }

  {
    Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "INSERT OR REPLACE INTO LaunchData VALUES(?, ?, ?)");
    s.BindString(0, launchId);
    s.BindString(1, claims);
    s.BindInt64(2, expiration);

    if (!s.Run())
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot store launch data");
    }
  }

  transaction.Commit();
}


bool SQLiteDatastore::LookupLaunchData(std::string& claims,
                                       const std::string& launchId,
                                       int64_t now)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "SELECT claims FROM LaunchData WHERE launchId=? AND expiration>?");
  s.BindString(0, launchId);
  s.BindInt64(1, now);

  if (s.Step())
  {
    claims = s.ColumnString(0);
    return true;
  }
  else
  {
    return false;
  }
}


void SQLiteDatastore::StoreAccessToken(const AccessToken& token)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE, "INSERT OR REPLACE INTO AccessTokens VALUES(?, ?, ?, ?, ?)");
  s.BindString(0, token.GetTokenUri());
  s.BindString(1, token.GetClientId());
  s.BindString(2, AccessToken::FormatScopes(token.GetScopes()));
  s.BindString(3, token.GetToken());
  s.BindInt64(4, token.GetExpiration());

  if (!s.Run())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_Database, "Cannot store an access token");
  }
}


AccessTokenStatus SQLiteDatastore::LookupAccessToken(AccessToken& target,
                                                     const std::string& tokenUri,
                                                     const std::string& clientId,
                                                     const std::set<std::string>& scopes,
                                                     int64_t now)
{
  boost::mutex::scoped_lock lock(mutex_);

  Orthanc::SQLite::Statement s(db_, SQLITE_FROM_HERE,
                               "SELECT token, expiration FROM AccessTokens WHERE tokenUri=? AND clientId=? AND scopes=?");
  s.BindString(0, tokenUri);
  s.BindString(1, clientId);
  s.BindString(2, AccessToken::FormatScopes(scopes));

  if (!s.Step())
  {
    return AccessTokenStatus_NotFound;
  }

  const int64_t expiration = s.ColumnInt64(1);
  if (now >= expiration)
  {
    return AccessTokenStatus_Expired;
  }
  else
  {
    target = AccessToken(tokenUri, clientId, scopes, s.ColumnString(0), expiration);
    return AccessTokenStatus_Valid;
  }
}
