/*
 * Copyright (C) 2010-2014 NXP Semiconductors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <math.h>
#include <pthread.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

#include "phPlfLog.h"
#include "plf_config.h"

#define PLF_LOG_BUF_SIZE 1024

static pthread_mutex_t cs_mutex = PTHREAD_MUTEX_INITIALIZER;

const char* PLFLOG_ITEM_DECODER = "PlfDecoder ";
const char* PLFLOG_ITEM_API = "PlfApi ";
const char* PLFLOG_ITEM_CONFIG = "PlfConfig ";

/* global log level structure */
plf_log_level_t gPlfLog_level = {
    PLFLOG_DEFAULT_LOGLEVEL, PLFLOG_DEFAULT_LOGLEVEL, PLFLOG_DEFAULT_LOGLEVEL,
    PLFLOG_DEFAULT_LOGLEVEL};

bool plf_debug_enabled = false;

/*******************************************************************************
 *
 * Function         phPlfLog_SetGlobalLogLevel
 *
 * Description      Sets the global log level for all modules.
 *                  This value is set by PLFLOG_GLOBAL_LOGLEVEL and can be
 *                  overridden by the module log level.
 *                  NFC_DEBUG_ENABLED raises it to DEBUG.
 *
 * Returns          The value of global log level
 *
 ******************************************************************************/
static uint8_t phPlfLog_SetGlobalLogLevel(void) {
  uint8_t level = PLFLOG_DEFAULT_LOGLEVEL;

  plf_debug_enabled = PlfConfig::getUnsigned(NAME_NFC_DEBUG_ENABLED, 0) != 0;

  if (PlfConfig::hasKey(NAME_PLFLOG_GLOBAL_LOGLEVEL)) {
    unsigned num = PlfConfig::getUnsigned(NAME_PLFLOG_GLOBAL_LOGLEVEL);
    level = (level > num) ? level : (uint8_t)num;
  }
  if (plf_debug_enabled) {
    level = PLFLOG_LOG_DEBUG_LOGLEVEL;
  }
  if (level > PLFLOG_LOG_DEBUG_LOGLEVEL) level = PLFLOG_LOG_DEBUG_LOGLEVEL;

  gPlfLog_level.global_log_level = level;
  return level;
}

/*******************************************************************************
 *
 * Function         phPlfLog_GetModuleLogLevel
 *
 * Description      Returns the log level of one module: the configured module
 *                  value when it is higher than the global level.
 *
 * Returns          module log level
 *
 ******************************************************************************/
static uint8_t phPlfLog_GetModuleLogLevel(const char* name, uint8_t level) {
  if (PlfConfig::hasKey(name)) {
    unsigned num = PlfConfig::getUnsigned(name);
    if (num > PLFLOG_LOG_DEBUG_LOGLEVEL) num = PLFLOG_LOG_DEBUG_LOGLEVEL;
    return (level > num) ? level : (uint8_t)num;
  }
  return level;
}

/******************************************************************************
 * Function         phPlfLog_InitializeLogLevel
 *
 * Description      Initialize and get log level of module from
 *                  libnfc-plf.conf.
 *                  PLFLOG_GLOBAL_LOGLEVEL defines the log level for all
 *                  modules, module log levels override it upward.
 *
 *                  Log Level values:
 *                      PLFLOG_LOG_SILENT_LOGLEVEL  0   * No trace to show
 *                      PLFLOG_LOG_ERROR_LOGLEVEL   1   * Show Error trace only
 *                      PLFLOG_LOG_WARN_LOGLEVEL    2   * Show Warning and
 *                                                        Error trace
 *                      PLFLOG_LOG_DEBUG_LOGLEVEL   3   * Show all traces
 *
 * Returns          void
 *
 ******************************************************************************/
void phPlfLog_InitializeLogLevel(void) {
  uint8_t level = phPlfLog_SetGlobalLogLevel();

  gPlfLog_level.decoder_log_level =
      phPlfLog_GetModuleLogLevel(NAME_PLFLOG_DECODER_LOGLEVEL, level);
  gPlfLog_level.api_log_level =
      phPlfLog_GetModuleLogLevel(NAME_PLFLOG_API_LOGLEVEL, level);
  gPlfLog_level.config_log_level =
      phPlfLog_GetModuleLogLevel(NAME_PLFLOG_CONFIG_LOGLEVEL, level);

  PLFLOG_API_D("%s: global =%u, decoder =%u, api =%u, config =%u", __func__,
               gPlfLog_level.global_log_level, gPlfLog_level.decoder_log_level,
               gPlfLog_level.api_log_level, gPlfLog_level.config_log_level);
}

void phPlfLog_LogMsg(uint32_t trace_set_mask, const char* item,
                     const char* fmt_str, ...) {
  char buffer[PLF_LOG_BUF_SIZE];
  va_list ap;
  char buf[26];
  int millisec;
  struct tm tm_info;
  struct timeval tv;
  int i;
  const char* severity = "D";

  switch (trace_set_mask & 0x07) {
    case PLFLOG_LOG_ERROR_LOGLEVEL:
      severity = "E";
      break;
    case PLFLOG_LOG_WARN_LOGLEVEL:
      severity = "W";
      break;
    default:
      break;
  }

  va_start(ap, fmt_str);
  i = vsnprintf(buffer, PLF_LOG_BUF_SIZE, fmt_str, ap);
  va_end(ap);
  if (i <= 0) return;
  if (i >= PLF_LOG_BUF_SIZE) i = PLF_LOG_BUF_SIZE - 1;
  if (buffer[i - 1] == '\n') buffer[i - 1] = '\0';

  gettimeofday(&tv, NULL);
  millisec = lrint(tv.tv_usec / 1000.0);  // Round to nearest millisec
  if (millisec >= 1000) {  // Allow for rounding up to nearest second
    millisec -= 1000;
    tv.tv_sec++;
  }
  localtime_r(&tv.tv_sec, &tm_info);
  strftime(buf, sizeof(buf), "%Y:%m:%d-%H:%M:%S", &tm_info);

  pthread_mutex_lock(&cs_mutex);
  fprintf(stderr, "%s.%03d\t%s/%s%s\n", buf, millisec, severity, item, buffer);
  pthread_mutex_unlock(&cs_mutex);
}
