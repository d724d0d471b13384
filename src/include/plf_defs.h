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

/******************************************************************************
 *
 *  This file contains the definitions of the polling loop frame reported by
 *  the NFCC through the Android proprietary notification.
 *
 ******************************************************************************/

#ifndef PLF_DEFS_H
#define PLF_DEFS_H

#include <stdint.h>

/**********************************************
 * NCI proprietary Android notification
 **********************************************/
#define NCI_OID_MASK 0x3F
#define NCI_MSG_PROP_ANDROID 0x0C
/* offset of the Android sub opcode in the vendor specific parameter */
#define NCI_ANDROID_SUB_OPCODE_OFFSET 3

#define NCI_ANDROID_GET_CAPS 0x00
#define NCI_ANDROID_POLLING_FRAME_NTF 0x03

/**********************************************
 * Polling loop frame
 **********************************************/
/* Frames shorter than this carry no TLV and are dropped */
#define PLF_MIN_POLLING_FRAME_TLV_SIZE 5
/* Frame header, never interpreted */
#define PLF_POLLING_FRAME_HEADER_LEN 2

/* TLV field offsets, relative to the start of the TLV.
 * Offset 1 holds the TLV flags which are not interpreted. */
#define PLF_TLV_LEN_OFFSET 0
#define PLF_TLV_TYPE_OFFSET 2
#define PLF_TLV_TIMESTAMP_OFFSET 3
#define PLF_TLV_GAIN_OFFSET 7
#define PLF_TLV_DATA_OFFSET 8

/* Bytes of a TLV not accounted for by its length field */
#define PLF_TLV_HEADER_OVERHEAD 2

/* TLV tags */
#define PLF_TAG_FIELD_CHANGE 0x00
#define PLF_TAG_NFC_A 0x01
#define PLF_TAG_NFC_B 0x02
#define PLF_TAG_NFC_F 0x03
#define PLF_TAG_NFC_UNKNOWN 0x07

/**********************************************
 * Polling loop types reported upstream
 **********************************************/
#define PLF_POLLING_LOOP_TYPE_A 'A'
#define PLF_POLLING_LOOP_TYPE_B 'B'
#define PLF_POLLING_LOOP_TYPE_F 'F'
#define PLF_POLLING_LOOP_TYPE_ON 'O'
#define PLF_POLLING_LOOP_TYPE_OFF 'X'
#define PLF_POLLING_LOOP_TYPE_UNKNOWN 'U'

/**********************************************
 * Little endian stream access
 **********************************************/
#define UINT32_TO_STREAM(p, u32)     \
  {                                  \
    *(p)++ = (uint8_t)(u32);         \
    *(p)++ = (uint8_t)((u32) >> 8);  \
    *(p)++ = (uint8_t)((u32) >> 16); \
    *(p)++ = (uint8_t)((u32) >> 24); \
  }
#define UINT8_TO_STREAM(p, u8) \
  { *(p)++ = (uint8_t)(u8); }
#define INT8_TO_STREAM(p, u8) \
  { *(p)++ = (int8_t)(u8); }
#define ARRAY_TO_STREAM(p, a, len)                                \
  {                                                               \
    int ijk;                                                      \
    for (ijk = 0; ijk < (len); ijk++) *(p)++ = (uint8_t)(a)[ijk]; \
  }
#define STREAM_TO_UINT32(u32, p)                                      \
  {                                                                   \
    (u32) = (((uint32_t)(*(p))) + ((((uint32_t)(*((p) + 1)))) << 8) + \
             ((((uint32_t)(*((p) + 2)))) << 16) +                     \
             ((((uint32_t)(*((p) + 3)))) << 24));                     \
    (p) += 4;                                                         \
  }

#endif /* PLF_DEFS_H */
