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
#include "PollingFrameReader.h"

#include "plf_defs.h"

PollingFrameReader::PollingFrameReader(const uint8_t* p_data,
                                       uint16_t data_len)
    : mData(p_data), mLength(p_data == nullptr ? 0 : data_len), mPosition(0) {}

bool PollingFrameReader::hasRemaining() const { return mPosition < mLength; }

bool PollingFrameReader::isAvailable(uint32_t offset, uint32_t count) const {
  uint64_t end = (uint64_t)mPosition + offset + count;
  return end <= mLength;
}

bool PollingFrameReader::readUint8(uint32_t offset, uint8_t& value) const {
  if (!isAvailable(offset, 1)) return false;
  value = mData[mPosition + offset];
  return true;
}

bool PollingFrameReader::readInt8(uint32_t offset, int8_t& value) const {
  uint8_t raw;
  if (!readUint8(offset, raw)) return false;
  value = (int8_t)raw;
  return true;
}

bool PollingFrameReader::readUint32Le(uint32_t offset, uint32_t& value) const {
  if (!isAvailable(offset, 4)) return false;
  const uint8_t* p = mData + mPosition + offset;
  STREAM_TO_UINT32(value, p);
  return true;
}

bool PollingFrameReader::readBytes(uint32_t offset, uint32_t count,
                                   std::vector<uint8_t>& out) const {
  if (!isAvailable(offset, count)) return false;
  const uint8_t* p = mData + mPosition + offset;
  out.assign(p, p + count);
  return true;
}

void PollingFrameReader::advance(uint32_t count) {
  uint64_t next = (uint64_t)mPosition + count;
  /* Past the end only means "nothing remaining" */
  mPosition = (next > UINT32_MAX) ? UINT32_MAX : (uint32_t)next;
}
