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
#include "config.h"

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

#include <fstream>
#include <sstream>

#include "phPlfLog.h"

using namespace ::std;

namespace {

bool parseBytesString(std::string in, std::vector<uint8_t>& out) {
  vector<uint8_t> ret;
  size_t pos = 0;
  while (pos <= in.size()) {
    size_t next = in.find(':', pos);
    if (next == string::npos) next = in.size();
    string byte = in.substr(pos, next - pos);
    if (byte.size() != 2) return false;
    char* end = nullptr;
    unsigned long value = strtoul(byte.c_str(), &end, 16);
    if (end == nullptr || *end != '\0' || !isxdigit(byte[0])) return false;
    ret.push_back((uint8_t)value);
    pos = next + 1;
  }
  if (ret.empty()) return false;
  out = ret;
  return true;
}

bool parseUnsigned(const std::string& in, unsigned& out) {
  if (in.empty() || in[0] == '-' || in[0] == '+') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long value = strtoull(in.c_str(), &end, 0);
  if (errno != 0 || end == nullptr || *end != '\0') return false;
  if (value > 0xFFFFFFFFULL) return false;
  out = (unsigned)value;
  return true;
}

string trim(const string& str) {
  size_t first = str.find_first_not_of(" \t\r");
  if (first == string::npos) return "";
  size_t last = str.find_last_not_of(" \t\r");
  return str.substr(first, last - first + 1);
}

}  // namespace

ConfigValue::ConfigValue() : type_(UNSIGNED), value_unsigned_(0) {}

ConfigValue::ConfigValue(std::string value)
    : type_(STRING), value_string_(value), value_unsigned_(0) {}

ConfigValue::ConfigValue(unsigned value)
    : type_(UNSIGNED), value_unsigned_(value) {}

ConfigValue::ConfigValue(std::vector<uint8_t> value)
    : type_(BYTES), value_unsigned_(0), value_bytes_(value) {}

ConfigValue::Type ConfigValue::getType() const { return type_; }

std::string ConfigValue::getString() const {
  if (type_ != STRING) {
    PLFLOG_CFG_E("%s: value is not a string", __func__);
    return "";
  }
  return value_string_;
}

unsigned ConfigValue::getUnsigned() const {
  if (type_ != UNSIGNED) {
    PLFLOG_CFG_E("%s: value is not an unsigned", __func__);
    return 0;
  }
  return value_unsigned_;
}

std::vector<uint8_t> ConfigValue::getBytes() const {
  if (type_ != BYTES) {
    PLFLOG_CFG_E("%s: value is not a byte array", __func__);
    return std::vector<uint8_t>();
  }
  return value_bytes_;
}

bool ConfigValue::parseFromString(std::string in) {
  if (in.length() > 1 && in[0] == '"' && in[in.length() - 1] == '"') {
    // Empty strings are rejected
    if (in.length() <= 2) return false;
    type_ = STRING;
    value_string_ = in.substr(1, in.length() - 2);
    return true;
  }

  if (in.length() > 1 && in[0] == '{' && in[in.length() - 1] == '}') {
    std::vector<uint8_t> bytes;
    if (!parseBytesString(in.substr(1, in.length() - 2), bytes)) return false;
    type_ = BYTES;
    value_bytes_ = bytes;
    return true;
  }

  unsigned tmp;
  if (parseUnsigned(in, tmp)) {
    type_ = UNSIGNED;
    value_unsigned_ = tmp;
    return true;
  }

  return false;
}

bool ConfigFile::parseFromFile(const std::string& file_name) {
  ifstream file(file_name);
  if (!file.is_open()) {
    PLFLOG_CFG_W("%s: failed to open %s", __func__, file_name.c_str());
    return false;
  }
  stringstream config;
  config << file.rdbuf();
  PLFLOG_CFG_D("%s: loading %s", __func__, file_name.c_str());
  return parseFromString(config.str());
}

bool ConfigFile::parseFromString(const std::string& config) {
  stringstream ss(config);
  string line;
  bool valid = true;
  while (getline(ss, line)) {
    line = trim(line);
    if (line.empty()) continue;
    if (line.at(0) == '#') continue;
    if (line.at(0) == 0) continue;

    auto search = line.find('=');
    if (search == string::npos) {
      PLFLOG_CFG_E("%s: missing '=' in line: %s", __func__, line.c_str());
      valid = false;
      continue;
    }

    string key(trim(line.substr(0, search)));
    string value_string(trim(line.substr(search + 1, string::npos)));
    if (key.empty()) {
      PLFLOG_CFG_E("%s: empty key in line: %s", __func__, line.c_str());
      valid = false;
      continue;
    }

    ConfigValue value;
    if (!value.parseFromString(value_string)) {
      PLFLOG_CFG_E("%s: invalid value for %s: %s", __func__, key.c_str(),
                   value_string.c_str());
      valid = false;
      continue;
    }

    if (hasKey(key)) {
      PLFLOG_CFG_E("%s: duplicate key %s, keeping the first value", __func__,
                   key.c_str());
      valid = false;
      continue;
    }
    PLFLOG_CFG_D("%s: %s=%s", __func__, key.c_str(), value_string.c_str());
    values_.emplace(key, value);
  }
  return valid;
}

bool ConfigFile::hasKey(const std::string& key) {
  return values_.count(key) != 0;
}

ConfigValue& ConfigFile::getValue(const std::string& key) {
  static ConfigValue sEmptyValue;
  auto search = values_.find(key);
  if (search == values_.end()) {
    PLFLOG_CFG_E("%s: unknown key %s", __func__, key.c_str());
    sEmptyValue = ConfigValue();
    return sEmptyValue;
  }
  return search->second;
}

std::string ConfigFile::getString(const std::string& key) {
  return getValue(key).getString();
}

unsigned ConfigFile::getUnsigned(const std::string& key) {
  return getValue(key).getUnsigned();
}

std::vector<uint8_t> ConfigFile::getBytes(const std::string& key) {
  return getValue(key).getBytes();
}

bool ConfigFile::isEmpty() { return values_.empty(); }
void ConfigFile::clear() { values_.clear(); }
