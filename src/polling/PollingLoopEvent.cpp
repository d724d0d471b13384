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
#include "PollingLoopEvent.h"

#include <stdio.h>

PollingLoopEvent::PollingLoopEvent()
    : has_type(false),
      type(0),
      has_payload(false),
      has_gain(false),
      gain(0),
      has_timestamp(false),
      timestamp(0) {}

void PollingLoopEvent::setType(char loopType) {
  type = loopType;
  has_type = true;
}

void PollingLoopEvent::setPayload(const std::vector<uint8_t>& data) {
  payload = data;
  has_payload = true;
}

void PollingLoopEvent::setGain(int8_t value) {
  gain = value;
  has_gain = true;
}

void PollingLoopEvent::setTimestamp(uint32_t value) {
  timestamp = value;
  has_timestamp = true;
}

void PollingLoopEvent::clear() { *this = PollingLoopEvent(); }

bool PollingLoopEvent::isEmpty() const {
  return !has_type && !has_payload && !has_gain && !has_timestamp;
}

std::string PollingLoopEvent::toString() const {
  std::string str = "{";
  char tmp[32];
  if (has_type) {
    snprintf(tmp, sizeof(tmp), " type=%c", type);
    str += tmp;
  }
  if (has_gain) {
    snprintf(tmp, sizeof(tmp), " gain=%d", gain);
    str += tmp;
  }
  if (has_timestamp) {
    snprintf(tmp, sizeof(tmp), " timestamp=0x%08x", timestamp);
    str += tmp;
  }
  if (has_payload) {
    str += " payload=";
    for (size_t i = 0; i < payload.size(); i++) {
      snprintf(tmp, sizeof(tmp), "%02X", payload[i]);
      str += tmp;
    }
  }
  str += " }";
  return str;
}
