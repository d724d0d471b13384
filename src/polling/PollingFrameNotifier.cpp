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
#include "PollingFrameNotifier.h"

#include "phPlfLog.h"
#include "plf_defs.h"

PollingFrameNotifier::PollingFrameNotifier(IPollingLoopListener& listener)
    : mListener(listener) {}

bool PollingFrameNotifier::notifyPollingLoopFrame(uint16_t data_len,
                                                  const uint8_t* p_data) {
  PollingLoopEvent event;
  if (!mDecoder.decode(p_data, data_len, event)) {
    return false;
  }
  mListener.onPollingLoopDetected(event);
  return true;
}

bool PollingFrameNotifier::onVendorSpecificNtf(uint8_t event,
                                               uint16_t param_len,
                                               const uint8_t* p_param) {
  if ((event & NCI_OID_MASK) != NCI_MSG_PROP_ANDROID) {
    PLFLOG_API_D("%s: not an Android notification, oid=0x%02x", __func__,
                 event & NCI_OID_MASK);
    return false;
  }
  if (p_param == nullptr || param_len <= NCI_ANDROID_SUB_OPCODE_OFFSET) {
    PLFLOG_API_E("%s: Android notification too short (%u)", __func__,
                 param_len);
    return false;
  }

  uint8_t android_sub_opcode = p_param[NCI_ANDROID_SUB_OPCODE_OFFSET];
  switch (android_sub_opcode) {
    case NCI_ANDROID_POLLING_FRAME_NTF:
      if (!notifyPollingLoopFrame(param_len, p_param)) {
        PLFLOG_API_D("%s: polling frame dropped", __func__);
      }
      return true;
    default:
      PLFLOG_API_D("%s: Unknown Android sub opcode %x", __func__,
                   android_sub_opcode);
      break;
  }
  return false;
}
