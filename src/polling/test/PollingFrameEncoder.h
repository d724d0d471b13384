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

#include <vector>

#include "PollingLoopEvent.h"
#include "plf_defs.h"

typedef std::vector<uint8_t> bytes_t;

/*****************************************************************************
**
**  Name:           PollingFrameEncoder
**
**  Description:    Test helper building polling loop frames in the layout
**                  read by PollingFrameDecoder. Every record takes
**                  len + PLF_TLV_HEADER_OVERHEAD bytes.
**
*****************************************************************************/
class PollingFrameEncoder {
 public:
  PollingFrameEncoder() : mFrame(PLF_POLLING_FRAME_HEADER_LEN, 0x00) {}

  PollingFrameEncoder& addRecord(uint8_t tag, int8_t gain, uint32_t timestamp,
                                 const bytes_t& data = bytes_t()) {
    uint8_t record[PLF_TLV_DATA_OFFSET + 0xFF];
    uint8_t* pp = record;
    uint8_t len = (uint8_t)(PLF_TLV_DATA_OFFSET - PLF_TLV_HEADER_OVERHEAD +
                            data.size());

    UINT8_TO_STREAM(pp, len);
    UINT8_TO_STREAM(pp, 0x00); /* flags */
    UINT8_TO_STREAM(pp, tag);
    UINT32_TO_STREAM(pp, timestamp);
    INT8_TO_STREAM(pp, gain);
    ARRAY_TO_STREAM(pp, data, (int)data.size());

    mFrame.insert(mFrame.end(), record, pp);
    return *this;
  }

  /* Record carrying every field set in |event| */
  PollingFrameEncoder& addEvent(const PollingLoopEvent& event) {
    uint8_t tag = PLF_TAG_NFC_UNKNOWN;
    bytes_t data;
    switch (event.type) {
      case PLF_POLLING_LOOP_TYPE_ON:
        tag = PLF_TAG_FIELD_CHANGE;
        data.push_back(0x01);
        break;
      case PLF_POLLING_LOOP_TYPE_OFF:
        tag = PLF_TAG_FIELD_CHANGE;
        data.push_back(0x00);
        break;
      case PLF_POLLING_LOOP_TYPE_A:
        tag = PLF_TAG_NFC_A;
        break;
      case PLF_POLLING_LOOP_TYPE_B:
        tag = PLF_TAG_NFC_B;
        break;
      case PLF_POLLING_LOOP_TYPE_F:
        tag = PLF_TAG_NFC_F;
        break;
      default:
        data = event.payload;
        break;
    }
    return addRecord(tag, event.gain, event.timestamp, data);
  }

  PollingFrameEncoder& addRaw(const bytes_t& raw) {
    mFrame.insert(mFrame.end(), raw.begin(), raw.end());
    return *this;
  }

  const bytes_t& frame() const { return mFrame; }
  uint16_t length() const { return (uint16_t)mFrame.size(); }

 private:
  bytes_t mFrame;
};
