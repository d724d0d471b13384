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

/*****************************************************************************
**
**  Name:           PollingFrameReader
**
**  Description:    Bounds checked cursor over a polling loop frame.
**                  All reads are relative to the current position and fail
**                  without touching the output when the requested bytes are
**                  not inside [0, length). The frame is not owned and must
**                  outlive the reader.
**
*****************************************************************************/
class PollingFrameReader {
 public:
  PollingFrameReader(const uint8_t* p_data, uint16_t data_len);

  uint32_t getPosition() const { return mPosition; }
  uint16_t getLength() const { return mLength; }

  /* true while the position is inside the frame */
  bool hasRemaining() const;

  /* true if |count| bytes are available |offset| bytes after the position */
  bool isAvailable(uint32_t offset, uint32_t count) const;

  bool readUint8(uint32_t offset, uint8_t& value) const;
  bool readInt8(uint32_t offset, int8_t& value) const;
  /* little endian */
  bool readUint32Le(uint32_t offset, uint32_t& value) const;
  bool readBytes(uint32_t offset, uint32_t count,
                 std::vector<uint8_t>& out) const;

  void advance(uint32_t count);

 private:
  const uint8_t* mData;
  uint16_t mLength;
  uint32_t mPosition;
};
