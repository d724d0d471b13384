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

#include "IPollingLoopListener.h"
#include "PollingFrameDecoder.h"

/*****************************************************************************
**
**  Name:           PollingFrameNotifier
**
**  Description:    Turns the polling loop frames received from the native
**                  stack into onPollingLoopDetected() calls on the listener.
**                  At most one call is made per frame.
**
*****************************************************************************/
class PollingFrameNotifier {
 public:
  explicit PollingFrameNotifier(IPollingLoopListener& listener);

  /*******************************************************************************
  **
  ** Function:        notifyPollingLoopFrame
  **
  ** Description:     Decode a polling loop frame and notify the listener.
  **                  data_len: frame length.
  **                  p_data: frame.
  **
  ** Returns:         true if the listener was notified.
  **
  *******************************************************************************/
  bool notifyPollingLoopFrame(uint16_t data_len, const uint8_t* p_data);

  /*******************************************************************************
  **
  ** Function:        onVendorSpecificNtf
  **
  ** Description:     Vendor specific notification received from the NFCC.
  **                  Android polling frame notifications are forwarded
  **                  unchanged to notifyPollingLoopFrame().
  **                  event: NCI OID.
  **                  param_len: length of the notification.
  **                  p_param: notification.
  **
  ** Returns:         true if the notification was a polling loop frame.
  **
  *******************************************************************************/
  bool onVendorSpecificNtf(uint8_t event, uint16_t param_len,
                           const uint8_t* p_param);

 private:
  PollingFrameDecoder mDecoder;
  IPollingLoopListener& mListener;
};
