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

#include "nativePollingLoop.h"

#include <pthread.h>

#include "IPollingLoopListener.h"
#include "PollingFrameNotifier.h"
#include "phPlfLog.h"
#include "plf_config.h"

/*****************************************************************************
**
** private variables and functions
**
*****************************************************************************/
typedef void (*pollingLoopDetected_t)(nfc_polling_loop_event_t* pEvent);

static pthread_mutex_t sCallbackMutex = PTHREAD_MUTEX_INITIALIZER;
static nfcPollingLoopCallback_t* gPollingLoopCallback = NULL;

/* The callback struct is only read under the lock */
static pollingLoopDetected_t getCallback() {
  pollingLoopDetected_t onDetected = NULL;
  pthread_mutex_lock(&sCallbackMutex);
  if (gPollingLoopCallback != NULL) {
    onDetected = gPollingLoopCallback->onPollingLoopDetected;
  }
  pthread_mutex_unlock(&sCallbackMutex);
  return onDetected;
}

static void setCallback(nfcPollingLoopCallback_t* callback) {
  pthread_mutex_lock(&sCallbackMutex);
  gPollingLoopCallback = callback;
  pthread_mutex_unlock(&sCallbackMutex);
}

namespace {

// Forwards decoded events to the callback captured when the frame arrived.
class CallbackPollingLoopListener : public IPollingLoopListener {
 public:
  explicit CallbackPollingLoopListener(pollingLoopDetected_t onDetected)
      : mOnDetected(onDetected) {}

  void onPollingLoopDetected(const PollingLoopEvent& event) override {
    if (mOnDetected == NULL) {
      PLFLOG_API_D("%s: no callback registered", __func__);
      return;
    }

    nfc_polling_loop_event_t loopEvent;
    loopEvent.has_type = event.has_type;
    loopEvent.type = event.type;
    loopEvent.has_gain = event.has_gain;
    loopEvent.gain = event.gain;
    loopEvent.has_timestamp = event.has_timestamp;
    loopEvent.timestamp = event.timestamp;
    loopEvent.has_payload = event.has_payload;
    loopEvent.payload = event.payload.empty() ? NULL : event.payload.data();
    loopEvent.payload_length = event.payload.size();

    mOnDetected(&loopEvent);
  }

 private:
  pollingLoopDetected_t mOnDetected;
};

}  // namespace

int nativePollingLoop_doInitialize() {
  phPlfLog_InitializeLogLevel();
  PLFLOG_API_D("%s: enter", __func__);
  return 0;
}

int nativePollingLoop_doDeinitialize() {
  PLFLOG_API_D("%s: enter", __func__);
  setCallback(NULL);
  PlfConfig::clear();
  return 0;
}

void nativePollingLoop_registerCallback(nfcPollingLoopCallback_t* callback) {
  setCallback(callback);
}

void nativePollingLoop_deregisterCallback() { setCallback(NULL); }

int nativePollingLoop_notifyFrame(const uint8_t* p_data, uint32_t data_len) {
  if ((p_data == NULL && data_len != 0) || data_len > UINT16_MAX) {
    PLFLOG_API_E("%s: invalid frame, len=%u", __func__, data_len);
    return -1;
  }
  pollingLoopDetected_t onDetected = getCallback();
  if (onDetected == NULL) {
    PLFLOG_API_D("%s: no callback registered, frame dropped", __func__);
    return 0;
  }
  CallbackPollingLoopListener listener(onDetected);
  PollingFrameNotifier notifier(listener);
  return notifier.notifyPollingLoopFrame((uint16_t)data_len, p_data) ? 1 : 0;
}

int nativePollingLoop_onVendorSpecificNtf(uint8_t event, const uint8_t* p_param,
                                          uint32_t param_len) {
  if ((p_param == NULL && param_len != 0) || param_len > UINT16_MAX) {
    PLFLOG_API_E("%s: invalid notification, len=%u", __func__, param_len);
    return -1;
  }
  CallbackPollingLoopListener listener(getCallback());
  PollingFrameNotifier notifier(listener);
  return notifier.onVendorSpecificNtf(event, (uint16_t)param_len, p_param) ? 1
                                                                          : 0;
}
