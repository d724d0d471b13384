/******************************************************************************
 *
 *  Copyright 2024 NXP
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *  http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 ******************************************************************************/
#pragma once
#include <string>

#define cfgPathProvider (ConfigPathProvider::getInstance())

/* Directory overriding the default configuration location */
#define PLF_CONFIG_DIR_ENV "PLF_CONFIG_DIR"

enum FileType {
  PLF_CONFIG,  // libnfc-plf.conf
};

class ConfigPathProvider {
  ConfigPathProvider();

  /*******************************************************************************
  **
  ** Function         getEnvVar.
  **
  ** Description      Returns valid value stored in requested Env variable if
  **                  available, else returns empty string
  **
  ** Returns          value stored in requested Env variable
  **
  *******************************************************************************/
  std::string getEnvVar(std::string const& key);

  /*******************************************************************************
  **
  ** Function         addEnvPathIfAvailable.
  **
  ** Description      If Env variable PLF_CONFIG_DIR is available and names an
  **                  existing directory, the default directory of the file is
  **                  replaced by it.
  **
  ** Returns          None.
  **
  *******************************************************************************/
  void addEnvPathIfAvailable(std::string& path);

 public:
  /*******************************************************************************
  **
  ** Function         getInstance
  **
  ** Description      returns the static instance of ConfigPathProvider
  **
  ** Returns          ConfigPathProvider instance
  *******************************************************************************/
  static ConfigPathProvider& getInstance();

  /*******************************************************************************
  **
  ** Function         getFilePath
  **
  ** Description      Returns file path of requested type of file
  **
  ** Returns          file path, empty if the file does not exist
  **
  *******************************************************************************/
  std::string getFilePath(FileType type);
};
