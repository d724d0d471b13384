/*
 * Copyright 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
/******************************************************************************
 *
 *  The original Work has been changed by NXP Semiconductors.
 *
 *  Copyright (C) 2024 NXP Semiconductors
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
#include "plf_config.h"

#include "configPathProvider.h"
#include "phPlfLog.h"

using namespace ::std;

void PlfConfig::loadConfig() {
  PLFLOG_CFG_D("%s: Entry", __func__);
  loaded_ = true;
  string config_path = cfgPathProvider.getFilePath(PLF_CONFIG);
  if (config_path.empty()) {
    PLFLOG_CFG_W("%s: no configuration file found, using defaults", __func__);
    return;
  }
  if (!config_.parseFromFile(config_path)) {
    PLFLOG_CFG_E("%s: %s contains invalid entries", __func__,
                 config_path.c_str());
  }
  PLFLOG_CFG_D("%s: Exit", __func__);
}

PlfConfig::PlfConfig() : loaded_(false) {}

PlfConfig& PlfConfig::instance() {
  static PlfConfig theInstance;
  return theInstance;
}

PlfConfig& PlfConfig::getInstance() {
  PlfConfig& theInstance = instance();
  if (!theInstance.loaded_) {
    theInstance.loadConfig();
  }
  return theInstance;
}

bool PlfConfig::hasKey(const std::string& key) {
  return getInstance().config_.hasKey(key);
}

unsigned PlfConfig::getUnsigned(const std::string& key) {
  return getInstance().config_.getUnsigned(key);
}

unsigned PlfConfig::getUnsigned(const std::string& key,
                                unsigned default_value) {
  if (hasKey(key)) return getUnsigned(key);
  return default_value;
}

void PlfConfig::clear() {
  PlfConfig& theInstance = instance();
  theInstance.config_.clear();
  theInstance.loaded_ = false;
}
