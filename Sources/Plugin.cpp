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


#include "Datastore/MemoryDatastore.h"
#include "Datastore/SQLiteDatastore.h"
#include "Http/OrthancHttpClient.h"
#include "LTI/LTIRoutes.h"
#include "LtiConfiguration.h"
#include "LtiConstants.h"

#include <HttpClient.h>
#include <Logging.h>
#include <SystemToolbox.h>
#include <Toolbox.h>

#include <OrthancPluginCppWrapper.h>

#include <cassert>


static std::unique_ptr<MemoryDatastore>       memoryDatastore_;
static std::unique_ptr<SQLiteDatastore>       sqliteDatastore_;
static std::unique_ptr<Datastores>            datastores_;
static std::unique_ptr<OrthancHttpClient>     httpClient_;
static std::unique_ptr<PlatformKeysRegistry>  platformKeys_;
static std::unique_ptr<LaunchValidator>       launchValidator_;


template <typename Store>
static Datastores* CreateDatastores(Store& store)
{
  return new Datastores(store, store, store, store);
}


static void ConfigureDatastores(const OrthancPlugins::OrthancConfiguration& configuration)
{
  const std::string path = configuration.GetStringValue("Database", "");

  if (path.empty())
  {
    LOG(WARNING) << "LTI data is stored in memory, pending launches are lost if Orthanc restarts";
    memoryDatastore_.reset(new MemoryDatastore);
    datastores_.reset(CreateDatastores(*memoryDatastore_));
  }
  else
  {
    LOG(WARNING) << "LTI data is stored in SQLite database: " << path;
    sqliteDatastore_.reset(new SQLiteDatastore(path));
    datastores_.reset(CreateDatastores(*sqliteDatastore_));
  }
}


static void ConfigureToolKey(const OrthancPlugins::OrthancConfiguration& configuration)
{
  std::string path;
  if (configuration.LookupStringValue(path, "PrivateKey"))
  {
    std::string keyId;
    if (!configuration.LookupStringValue(keyId, "PrivateKeyId"))
    {
      throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "The \"PrivateKeyId\" option is missing");
    }

    std::string pem;
    Orthanc::SystemToolbox::ReadFile(pem, path);
    LtiConfiguration::GetInstance().GetToolKeyPair().Load(keyId, pem);

    LOG(WARNING) << "Private key of the LTI tool loaded from: " << path;
  }
  else
  {
    // The platforms must be reconfigured each time Orthanc restarts
    LOG(WARNING) << "No private key configured for the LTI tool, generating a temporary one";
    LtiConfiguration::GetInstance().GetToolKeyPair().Generate();
  }
}


static bool DisplayPerformanceWarning()
{
  (void) DisplayPerformanceWarning;   // Disable warning about unused function
  LOG(WARNING) << "Performance warning in plugin: "
               << "Non-release build, runtime debug assertions are turned on";
  return true;
}


extern "C"
{
  ORTHANC_PLUGINS_API int32_t OrthancPluginInitialize(OrthancPluginContext* context)
  {
    OrthancPlugins::SetGlobalContext(context, ORTHANC_PLUGIN_NAME);

#if ORTHANC_FRAMEWORK_VERSION_IS_ABOVE(1, 12, 4)
    Orthanc::Logging::InitializePluginContext(context, ORTHANC_PLUGIN_NAME);
#elif ORTHANC_FRAMEWORK_VERSION_IS_ABOVE(1, 7, 2)
    Orthanc::Logging::InitializePluginContext(context);
#else
    Orthanc::Logging::Initialize(context);
#endif

    assert(DisplayPerformanceWarning());

    Orthanc::Toolbox::InitializeOpenSsl();
    Orthanc::HttpClient::GlobalInitialize();

    /* Check the version of the Orthanc core */
    if (OrthancPluginCheckVersion(context) == 0)
    {
      char info[1024];
      sprintf(info, "Your version of Orthanc (%s) must be above %d.%d.%d to run this plugin",
              context->orthancVersion,
              ORTHANC_PLUGINS_MINIMAL_MAJOR_NUMBER,
              ORTHANC_PLUGINS_MINIMAL_MINOR_NUMBER,
              ORTHANC_PLUGINS_MINIMAL_REVISION_NUMBER);
      OrthancPluginLogError(context, info);
      return -1;
    }

    OrthancPlugins::SetDescription(ORTHANC_PLUGIN_NAME, "LTI 1.3 tool for Orthanc.");

    try
    {
      OrthancPlugins::OrthancConfiguration config;

      OrthancPlugins::OrthancConfiguration configLti(false);
      config.GetSection(configLti, "LTI");

      if (!configLti.GetBooleanValue("Enabled", false))
      {
        LOG(INFO) << "The LTI plugin is disabled";
        return 0;
      }

      LtiConfiguration& configuration = LtiConfiguration::GetInstance();

      configuration.SetRoot(configLti.GetStringValue("Root", "/lti"));
      configuration.SetSecureCookies(configLti.GetBooleanValue("SecureCookies", true));
      configuration.SetHttpTimeout(configLti.GetUnsignedIntegerValue("HttpTimeout", LTI_DEFAULT_HTTP_TIMEOUT));

      const std::string toolUrl = configLti.GetStringValue("ToolUrl", "");
      if (toolUrl.empty())
      {
        throw Orthanc::OrthancException(Orthanc::ErrorCode_ParameterOutOfRange, "The LTI tool URL is missing from the configuration file");
      }

      configuration.SetToolUrl(toolUrl);

      ConfigureToolKey(configLti);
      ConfigureDatastores(configLti);

      if (configLti.GetJson().isMember("Registrations"))
      {
        LtiConfiguration::LoadRegistrations(datastores_->GetRegistrations(), configLti.GetJson()["Registrations"]);
      }

      httpClient_.reset(new OrthancHttpClient);

      platformKeys_.reset(new PlatformKeysRegistry(*httpClient_, configLti.GetUnsignedIntegerValue(
                                                     "PlatformKeysMaxAge", LTI_DEFAULT_PLATFORM_KEYS_MAX_AGE)));
      platformKeys_->SetTimeout(configuration.GetHttpTimeout());

      launchValidator_.reset(new LaunchValidator(*datastores_, *platformKeys_));
      launchValidator_->SetLaunchDataLifetime(configLti.GetUnsignedIntegerValue(
                                                "LaunchDataLifetime", LTI_DEFAULT_LAUNCH_DATA_LIFETIME));

      RegisterLTIRoutes(*datastores_, *httpClient_, *launchValidator_);
    }
    catch (Orthanc::OrthancException& e)
    {
      LOG(ERROR) << "Exception while initializing the plugin: " << e.What();
      return -1;
    }

    return 0;
  }


  ORTHANC_PLUGINS_API void OrthancPluginFinalize()
  {
    LOG(WARNING) << "Finalizing the LTI plugin";

    FinalizeLTIRoutes();
    launchValidator_.reset(NULL);
    platformKeys_.reset(NULL);
    httpClient_.reset(NULL);
    datastores_.reset(NULL);
    sqliteDatastore_.reset(NULL);
    memoryDatastore_.reset(NULL);

    Orthanc::HttpClient::GlobalFinalize();
    Orthanc::Toolbox::FinalizeOpenSsl();
    Orthanc::Logging::Finalize();
  }


  ORTHANC_PLUGINS_API const char* OrthancPluginGetName()
  {
    return ORTHANC_PLUGIN_NAME;
  }


  ORTHANC_PLUGINS_API const char* OrthancPluginGetVersion()
  {
    return ORTHANC_PLUGIN_VERSION;
  }
}
