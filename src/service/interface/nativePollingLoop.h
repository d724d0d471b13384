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

#ifndef __NATIVE_POLLING_LOOP__H__
#define __NATIVE_POLLING_LOOP__H__

#include <stdint.h>

#include "linux_nfc_plf_api.h"

/*******************************************************************************
**
** Function:        nativePollingLoop_doInitialize
**
** Description:     Load the configuration and the log levels.
**
** Returns:         0 if ok.
**
*******************************************************************************/
int nativePollingLoop_doInitialize();

/*******************************************************************************
**
** Function:        nativePollingLoop_doDeinitialize
**
** Description:     Drop the callback and the loaded configuration.
**
** Returns:         0 if ok.
**
*******************************************************************************/
int nativePollingLoop_doDeinitialize();

void nativePollingLoop_registerCallback(nfcPollingLoopCallback_t* callback);
void nativePollingLoop_deregisterCallback();

/*******************************************************************************
**
** Function:        nativePollingLoop_notifyFrame
**
** Description:     Decode a polling loop frame and notify the callback.
**
** Returns:         1 if notified, 0 if dropped, -1 on invalid parameters.
**
*******************************************************************************/
int nativePollingLoop_notifyFrame(const uint8_t* p_data, uint32_t data_len);

/*******************************************************************************
**
** Function:        nativePollingLoop_onVendorSpecificNtf
**
** Description:     Route a vendor specific notification.
**
** Returns:         1 if it was a polling loop frame, 0 otherwise,
**                  -1 on invalid parameters.
**
*******************************************************************************/
int nativePollingLoop_onVendorSpecificNtf(uint8_t event, const uint8_t* p_param,
                                          uint32_t param_len);

#endif /* __NATIVE_POLLING_LOOP__H__ */
