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

#if !defined(PLFLOG__H_INCLUDED)
#define PLFLOG__H_INCLUDED

#include <stdint.h>

typedef struct plf_log_level {
  uint8_t global_log_level;
  uint8_t decoder_log_level;
  uint8_t api_log_level;
  uint8_t config_log_level;
} plf_log_level_t;

/* global log level Ref */
extern plf_log_level_t gPlfLog_level;

/* Module names printed in front of every trace */
extern const char* PLFLOG_ITEM_DECODER;
extern const char* PLFLOG_ITEM_API;
extern const char* PLFLOG_ITEM_CONFIG;

/* Set the log level for all modules to DEBUG */
extern bool plf_debug_enabled;

/* ######################################## Defines used for Logging data
 * ######################################### */
#define PLFLOG_LOG_SILENT_LOGLEVEL 0x00
#define PLFLOG_LOG_ERROR_LOGLEVEL 0x01
#define PLFLOG_LOG_WARN_LOGLEVEL 0x02
#define PLFLOG_LOG_DEBUG_LOGLEVEL 0x03

/* Default level used until phPlfLog_InitializeLogLevel() is called */
#define PLFLOG_DEFAULT_LOGLEVEL PLFLOG_LOG_WARN_LOGLEVEL

/* Configuration keys read from libnfc-plf.conf */
#define NAME_PLFLOG_GLOBAL_LOGLEVEL "PLFLOG_GLOBAL_LOGLEVEL"
#define NAME_PLFLOG_DECODER_LOGLEVEL "PLFLOG_DECODER_LOGLEVEL"
#define NAME_PLFLOG_API_LOGLEVEL "PLFLOG_API_LOGLEVEL"
#define NAME_PLFLOG_CONFIG_LOGLEVEL "PLFLOG_CONFIG_LOGLEVEL"
#define NAME_NFC_DEBUG_ENABLED "NFC_DEBUG_ENABLED"

/* ####################### Set the logging level for EVERY COMPONENT here
 * ######################## :START: */

/* Logging APIs used by the polling frame decoder */
#define PLFLOG_DEC_D(...)                                              \
  {                                                                    \
    if (gPlfLog_level.decoder_log_level >= PLFLOG_LOG_DEBUG_LOGLEVEL)  \
      phPlfLog_LogMsg(PLFLOG_LOG_DEBUG_LOGLEVEL, PLFLOG_ITEM_DECODER,  \
                      __VA_ARGS__);                                    \
  }
#define PLFLOG_DEC_W(...)                                              \
  {                                                                    \
    if (gPlfLog_level.decoder_log_level >= PLFLOG_LOG_WARN_LOGLEVEL)   \
      phPlfLog_LogMsg(PLFLOG_LOG_WARN_LOGLEVEL, PLFLOG_ITEM_DECODER,   \
                      __VA_ARGS__);                                    \
  }
#define PLFLOG_DEC_E(...)                                              \
  {                                                                    \
    if (gPlfLog_level.decoder_log_level >= PLFLOG_LOG_ERROR_LOGLEVEL)  \
      phPlfLog_LogMsg(PLFLOG_LOG_ERROR_LOGLEVEL, PLFLOG_ITEM_DECODER,  \
                      __VA_ARGS__);                                    \
  }

/* Logging APIs used by the service API and the notifier */
#define PLFLOG_API_D(...)                                          \
  {                                                                \
    if (gPlfLog_level.api_log_level >= PLFLOG_LOG_DEBUG_LOGLEVEL)  \
      phPlfLog_LogMsg(PLFLOG_LOG_DEBUG_LOGLEVEL, PLFLOG_ITEM_API,  \
                      __VA_ARGS__);                                \
  }
#define PLFLOG_API_W(...)                                          \
  {                                                                \
    if (gPlfLog_level.api_log_level >= PLFLOG_LOG_WARN_LOGLEVEL)   \
      phPlfLog_LogMsg(PLFLOG_LOG_WARN_LOGLEVEL, PLFLOG_ITEM_API,   \
                      __VA_ARGS__);                                \
  }
#define PLFLOG_API_E(...)                                          \
  {                                                                \
    if (gPlfLog_level.api_log_level >= PLFLOG_LOG_ERROR_LOGLEVEL)  \
      phPlfLog_LogMsg(PLFLOG_LOG_ERROR_LOGLEVEL, PLFLOG_ITEM_API,  \
                      __VA_ARGS__);                                \
  }

/* Logging APIs used by the configuration parser */
#define PLFLOG_CFG_D(...)                                             \
  {                                                                   \
    if (gPlfLog_level.config_log_level >= PLFLOG_LOG_DEBUG_LOGLEVEL)  \
      phPlfLog_LogMsg(PLFLOG_LOG_DEBUG_LOGLEVEL, PLFLOG_ITEM_CONFIG,  \
                      __VA_ARGS__);                                   \
  }
#define PLFLOG_CFG_W(...)                                             \
  {                                                                   \
    if (gPlfLog_level.config_log_level >= PLFLOG_LOG_WARN_LOGLEVEL)   \
      phPlfLog_LogMsg(PLFLOG_LOG_WARN_LOGLEVEL, PLFLOG_ITEM_CONFIG,   \
                      __VA_ARGS__);                                   \
  }
#define PLFLOG_CFG_E(...)                                             \
  {                                                                   \
    if (gPlfLog_level.config_log_level >= PLFLOG_LOG_ERROR_LOGLEVEL)  \
      phPlfLog_LogMsg(PLFLOG_LOG_ERROR_LOGLEVEL, PLFLOG_ITEM_CONFIG,  \
                      __VA_ARGS__);                                   \
  }

/* ####################### Set the logging level for EVERY COMPONENT here
 * ######################## :END: */

void phPlfLog_InitializeLogLevel(void);
void phPlfLog_LogMsg(uint32_t trace_set_mask, const char* item,
                     const char* fmt_str, ...)
    __attribute__((format(printf, 3, 4)));

#endif /* PLFLOG__H_INCLUDED */
