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

#include <stdint.h>

#include <string>
#include <vector>

/*****************************************************************************
**
**  Name:           PollingLoopEvent
**
**  Description:    One polling loop notification delivered upstream. Every
**                  field is optional; a field is valid only when its has_
**                  flag is set.
**
*****************************************************************************/
struct PollingLoopEvent {
  bool has_type;
  char type; /* PLF_POLLING_LOOP_TYPE_xxx */

  bool has_payload;
  std::vector<uint8_t> payload;

  bool has_gain;
  int8_t gain;

  bool has_timestamp;
  uint32_t timestamp;

  PollingLoopEvent();

  void setType(char loopType);
  void setPayload(const std::vector<uint8_t>& data);
  void setGain(int8_t value);
  void setTimestamp(uint32_t value);

  /* Drops every field */
  void clear();
  bool isEmpty() const;

  /* Human readable form used in traces */
  std::string toString() const;
};
