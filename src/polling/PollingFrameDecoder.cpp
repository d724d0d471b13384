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
#include "PollingFrameDecoder.h"

#include "PollingFrameReader.h"
#include "phPlfLog.h"
#include "plf_defs.h"

PollingFrameDecoder::PollingFrameDecoder() {}

bool PollingFrameDecoder::decode(const uint8_t* p_data, uint16_t data_len,
                                 PollingLoopEvent& event) const {
  if (p_data == nullptr || data_len < PLF_MIN_POLLING_FRAME_TLV_SIZE) {
    PLFLOG_DEC_D("%s: frame too short (%u), dropped", __func__, data_len);
    return false;
  }

  event.clear();
  PollingFrameReader reader(p_data, data_len);
  reader.advance(PLF_POLLING_FRAME_HEADER_LEN);

  while (reader.hasRemaining()) {
    if (!decodeRecord(reader, event)) break;
  }

  PLFLOG_DEC_D("%s: len=%u event=%s", __func__, data_len,
               event.toString().c_str());
  return true;
}

bool PollingFrameDecoder::decodeRecord(PollingFrameReader& reader,
                                       PollingLoopEvent& event) const {
  uint8_t length = 0;
  uint8_t type = 0;

  if (!reader.readUint8(PLF_TLV_LEN_OFFSET, length) ||
      reader.getPosition() + length + 1 > reader.getLength()) {
    PLFLOG_DEC_E("%s: Polling frame data is longer than buffer data length",
                 __func__);
    return false;
  }
  if (!reader.readUint8(PLF_TLV_TYPE_OFFSET, type)) {
    PLFLOG_DEC_E("%s: Polling frame TLV type missing at %u", __func__,
                 reader.getPosition());
    return false;
  }

  decodeType(type, length, reader, event);

  int8_t gain;
  if (reader.readInt8(PLF_TLV_GAIN_OFFSET, gain)) {
    event.setGain(gain);
  }
  uint32_t timestamp;
  if (reader.readUint32Le(PLF_TLV_TIMESTAMP_OFFSET, timestamp)) {
    event.setTimestamp(timestamp);
  }

  reader.advance(length + PLF_TLV_HEADER_OVERHEAD);
  return true;
}

void PollingFrameDecoder::decodeType(uint8_t type, uint8_t length,
                                     const PollingFrameReader& reader,
                                     PollingLoopEvent& event) const {
  switch (type) {
    case PLF_TAG_FIELD_CHANGE: {
      uint8_t field;
      if (!reader.readUint8(PLF_TLV_DATA_OFFSET, field)) {
        PLFLOG_DEC_W("%s: field change TLV without field state", __func__);
        break;
      }
      event.setType(field != 0x00 ? PLF_POLLING_LOOP_TYPE_ON
                                  : PLF_POLLING_LOOP_TYPE_OFF);
    } break;
    case PLF_TAG_NFC_A:
      event.setType(PLF_POLLING_LOOP_TYPE_A);
      break;
    case PLF_TAG_NFC_B:
      event.setType(PLF_POLLING_LOOP_TYPE_B);
      break;
    case PLF_TAG_NFC_F:
      event.setType(PLF_POLLING_LOOP_TYPE_F);
      break;
    case PLF_TAG_NFC_UNKNOWN: {
      event.setType(PLF_POLLING_LOOP_TYPE_UNKNOWN);
      // Data runs up to TIMESTAMP_OFFSET + length, clamped to the frame
      uint32_t end = PLF_TLV_TIMESTAMP_OFFSET + length;
      uint32_t available = reader.getLength() - reader.getPosition();
      if (end > available) end = available;
      std::vector<uint8_t> data;
      if (end <= PLF_TLV_DATA_OFFSET ||
          !reader.readBytes(PLF_TLV_DATA_OFFSET, end - PLF_TLV_DATA_OFFSET,
                            data)) {
        PLFLOG_DEC_D("%s: unknown frame without data", __func__);
      }
      event.setPayload(data);
    } break;
    default:
      PLFLOG_DEC_W("%s: Unknown polling loop tag type 0x%02x", __func__, type);
      break;
  }
}
