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
#include "configPathProvider.h"

#include <stdlib.h>
#include <sys/stat.h>

#include "phPlfLog.h"

using namespace ::std;

#define PLF_CONFIG_DEFAULT_DIR "/usr/local/etc/"
#define PLF_CONFIG_FILE_NAME "libnfc-plf.conf"

ConfigPathProvider::ConfigPathProvider() {}

ConfigPathProvider& ConfigPathProvider::getInstance() {
  static ConfigPathProvider mConfigPathProviderInstance;
  return mConfigPathProviderInstance;
}

string ConfigPathProvider::getEnvVar(std::string const& key) {
  char* val = getenv(key.c_str());
  return val == NULL ? std::string("") : std::string(val);
}

void ConfigPathProvider::addEnvPathIfAvailable(string& path) {
  string configDir(getEnvVar(PLF_CONFIG_DIR_ENV));
  struct stat file_stat;
  if (!configDir.empty() && (stat(configDir.c_str(), &file_stat) == 0) &&
      S_ISDIR(file_stat.st_mode)) {
    if (configDir[configDir.size() - 1] != '/') configDir.append("/");
    path = configDir;
  }
}

string ConfigPathProvider::getFilePath(FileType type) {
  PLFLOG_CFG_D("%s: enter FileType:0x%02x", __func__, type);
  switch (type) {
    case PLF_CONFIG: {
      string path = PLF_CONFIG_DEFAULT_DIR;
      addEnvPathIfAvailable(path);
      path.append(PLF_CONFIG_FILE_NAME);
      PLFLOG_CFG_D("%s: path: %s", __func__, path.c_str());
      struct stat file_stat;
      if (stat(path.c_str(), &file_stat) != 0) return "";
      if (S_ISREG(file_stat.st_mode)) return path;
      return "";
    }
    default:
      PLFLOG_CFG_W("%s: Unknown FileType", __func__);
      break;
  }
  return "";
}
