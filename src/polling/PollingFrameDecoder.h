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

#include "PollingLoopEvent.h"

class PollingFrameReader;

/*****************************************************************************
**
**  Name:           PollingFrameDecoder
**
**  Description:    Decodes the polling loop frame reported by the NFCC.
**
**                  Frame:  | header (2) | TLV | TLV | ...
**                  TLV:    | len | flags | type | timestamp (4, LE) | gain |
**                          | data ... |
**
**                  Records write into fixed fields of one event, so a later
**                  record replaces the values set by an earlier one.
**                  The decoder keeps no state and can be used from several
**                  threads at once.
**
*****************************************************************************/
class PollingFrameDecoder {
 public:
  PollingFrameDecoder();

  /*******************************************************************************
  **
  ** Function:        decode
  **
  ** Description:     Decode one polling loop frame.
  **                  p_data: frame, only read during the call.
  **                  data_len: frame length.
  **                  event: receives the decoded fields, reset first.
  **
  ** Returns:         true if an event was produced. false for frames shorter
  **                  than PLF_MIN_POLLING_FRAME_TLV_SIZE. Malformed records
  **                  stop or skip decoding but still produce an event.
  **
  *******************************************************************************/
  bool decode(const uint8_t* p_data, uint16_t data_len,
              PollingLoopEvent& event) const;

 private:
  /* Returns false when the record runs past the frame and decoding stops */
  bool decodeRecord(PollingFrameReader& reader, PollingLoopEvent& event) const;
  void decodeType(uint8_t type, uint8_t length,
                  const PollingFrameReader& reader,
                  PollingLoopEvent& event) const;
};
