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

#ifndef __LINUX_NFC_PLF_API__H__
#define __LINUX_NFC_PLF_API__H__

#ifdef __cplusplus
extern "C" {
#endif

/* Polling loop types */
/** Field turned on */
#define POLLING_LOOP_TYPE_ON            'O'
/** Field turned off */
#define POLLING_LOOP_TYPE_OFF           'X'
/** NFC-A polling */
#define POLLING_LOOP_TYPE_A             'A'
/** NFC-B polling */
#define POLLING_LOOP_TYPE_B             'B'
/** NFC-F polling */
#define POLLING_LOOP_TYPE_F             'F'
/** Unrecognized polling frame, raw data in payload */
#define POLLING_LOOP_TYPE_UNKNOWN       'U'

/**
 * \brief Polling loop event structure definition.
 *        A field is valid only when its has_xxx flag is set.
 */
typedef struct
{
    /**
     *  \brief indicates type is valid
     */
    int has_type;
    /**
     *  \brief polling loop type, one of POLLING_LOOP_TYPE_xxx
     */
    char type;
    /**
     *  \brief indicates gain is valid
     */
    int has_gain;
    /**
     *  \brief RF gain measured by the controller
     */
    signed char gain;
    /**
     *  \brief indicates timestamp is valid
     */
    int has_timestamp;
    /**
     *  \brief controller timestamp of the event
     */
    unsigned int timestamp;
    /**
     *  \brief indicates payload is valid
     */
    int has_payload;
    /**
     *  \brief raw frame data, only valid during the callback
     */
    const unsigned char *payload;
    /**
     *  \brief payload length
     */
    unsigned int payload_length;
}nfc_polling_loop_event_t;

/**
 * \brief Polling loop callback functions.
 */
typedef struct
{
    /**
     * \brief NFCC reported polling loop activity.
     * \param pEvent: decoded polling loop event, only valid during the call
     * \return None
     */
    void (*onPollingLoopDetected) (nfc_polling_loop_event_t *pEvent);
}nfcPollingLoopCallback_t;

/**
* \brief Load libnfc-plf.conf and apply the log levels it defines.
* \return 0 if successful.
*/
extern int nfcPlf_initialize();

/**
* \brief Deregister the callback and drop the loaded configuration.
* \return 0 if successful.
*/
extern int nfcPlf_deinitialize();

/**
* \brief Register polling loop callback functions.
*        The function pointer is read when a frame arrives; the struct must
*        stay valid until nfcPlf_deregisterPollingLoopCallback() returns.
* \param callback:  polling loop callback functions.
* \return None
*/
extern void nfcPlf_registerPollingLoopCallback(nfcPollingLoopCallback_t *callback);

/**
* \brief Deregister polling loop callback functions.
* \return None
*/
extern void nfcPlf_deregisterPollingLoopCallback();

/**
* \brief Decode a polling loop frame and notify the registered callback.
* \param data:         polling loop frame, only read during the call.
* \param data_length:  frame length.
* \return 1 if the callback was notified, 0 if the frame was dropped,
*         -1 on invalid parameters.
*/
extern int nfcPlf_notifyPollingLoopFrame(const unsigned char *data, unsigned int data_length);

/**
* \brief Vendor specific notification received from the NFCC. Android
*        polling frame notifications are decoded and notified.
* \param event:         NCI OID of the notification.
* \param param:         notification parameters.
* \param param_length:  parameters length.
* \return 1 if the notification was a polling loop frame, 0 otherwise,
*         -1 on invalid parameters.
*/
extern int nfcPlf_onVendorSpecificNtf(unsigned char event, const unsigned char *param, unsigned int param_length);

#ifdef __cplusplus
}
#endif

#endif //__LINUX_NFC_PLF_API__H__
