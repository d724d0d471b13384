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

#include "linux_nfc_plf_api.h"
#include "nativePollingLoop.h"

int nfcPlf_initialize()
{
    return nativePollingLoop_doInitialize();
}

int nfcPlf_deinitialize()
{
    return nativePollingLoop_doDeinitialize();
}

void nfcPlf_registerPollingLoopCallback(nfcPollingLoopCallback_t *callback)
{
    nativePollingLoop_registerCallback(callback);
}

void nfcPlf_deregisterPollingLoopCallback()
{
    nativePollingLoop_deregisterCallback();
}

int nfcPlf_notifyPollingLoopFrame(const unsigned char *data, unsigned int data_length)
{
    return nativePollingLoop_notifyFrame(data, data_length);
}

int nfcPlf_onVendorSpecificNtf(unsigned char event, const unsigned char *param, unsigned int param_length)
{
    return nativePollingLoop_onVendorSpecificNtf(event, param, param_length);
}
