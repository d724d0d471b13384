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
#include <gtest/gtest.h>

#include <linux_nfc_plf_api.h>
#include <phPlfLog.h>
#include <plf_config.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

namespace {
const char TEST_CONFIG_DIR[] = "/tmp/plf_api_test";
const char TEST_CONFIG_FILE[] = "/tmp/plf_api_test/libnfc-plf.conf";
const char TEST_CONFIG[] =
    "PLFLOG_DECODER_LOGLEVEL=3\n\
PLFLOG_API_LOGLEVEL=1\n";

// Field on, gain 4, timestamp 0x03020100
const unsigned char FIELD_ON_FRAME[] = {0x00, 0x00, 0x07, 0x00, 0x00, 0x00,
                                        0x01, 0x02, 0x03, 0x04, 0x01};

// Unknown frame, payload clamped to the end of the frame
const unsigned char UNKNOWN_FRAME[] = {0x00, 0x00, 0x08, 0x00, 0x07, 0x11,
                                       0x00, 0x00, 0x00, 0xFE, 0xCA, 0xFE};

struct ReceivedEvent {
  nfc_polling_loop_event_t event;
  std::vector<unsigned char> payload;
};

std::vector<ReceivedEvent> sReceived;

void onPollingLoopDetected(nfc_polling_loop_event_t* pEvent) {
  ReceivedEvent received;
  received.event = *pEvent;
  if (pEvent->payload != NULL) {
    received.payload.assign(pEvent->payload,
                            pEvent->payload + pEvent->payload_length);
  }
  sReceived.push_back(received);
}

nfcPollingLoopCallback_t sCallback = {onPollingLoopDetected};
}  // namespace

class LinuxNfcPlfApiTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sReceived.clear();
    EXPECT_EQ(0, nfcPlf_initialize());
    nfcPlf_registerPollingLoopCallback(&sCallback);
  }
  void TearDown() override { EXPECT_EQ(0, nfcPlf_deinitialize()); }
};

TEST_F(LinuxNfcPlfApiTest, test_notify_field_on) {
  EXPECT_EQ(1, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME,
                                             sizeof(FIELD_ON_FRAME)));
  ASSERT_EQ(1u, sReceived.size());
  const nfc_polling_loop_event_t& event = sReceived[0].event;
  EXPECT_TRUE(event.has_type);
  EXPECT_EQ(POLLING_LOOP_TYPE_ON, event.type);
  EXPECT_TRUE(event.has_gain);
  EXPECT_EQ(4, event.gain);
  EXPECT_TRUE(event.has_timestamp);
  EXPECT_EQ(0x03020100u, event.timestamp);
  EXPECT_FALSE(event.has_payload);
  EXPECT_EQ(0u, event.payload_length);
}

TEST_F(LinuxNfcPlfApiTest, test_notify_unknown_payload) {
  EXPECT_EQ(1, nfcPlf_notifyPollingLoopFrame(UNKNOWN_FRAME,
                                             sizeof(UNKNOWN_FRAME)));
  ASSERT_EQ(1u, sReceived.size());
  const ReceivedEvent& received = sReceived[0];
  EXPECT_EQ(POLLING_LOOP_TYPE_UNKNOWN, received.event.type);
  EXPECT_TRUE(received.event.has_payload);
  EXPECT_EQ(-2, received.event.gain);
  EXPECT_EQ(0x11u, received.event.timestamp);
  ASSERT_EQ(2u, received.payload.size());
  EXPECT_EQ(0xCA, received.payload[0]);
  EXPECT_EQ(0xFE, received.payload[1]);
}

TEST_F(LinuxNfcPlfApiTest, test_notify_short_frame) {
  EXPECT_EQ(0, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME, 4));
  EXPECT_EQ(0, nfcPlf_notifyPollingLoopFrame(NULL, 0));
  EXPECT_TRUE(sReceived.empty());
}

TEST_F(LinuxNfcPlfApiTest, test_notify_invalid_parameters) {
  EXPECT_EQ(-1, nfcPlf_notifyPollingLoopFrame(NULL, 10));
  EXPECT_EQ(-1, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME, 0x10000));
  EXPECT_EQ(-1, nfcPlf_onVendorSpecificNtf(0x0C, NULL, 4));
  EXPECT_TRUE(sReceived.empty());
}

TEST_F(LinuxNfcPlfApiTest, test_deregistered_callback) {
  nfcPlf_deregisterPollingLoopCallback();
  EXPECT_EQ(0, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME,
                                             sizeof(FIELD_ON_FRAME)));
  EXPECT_TRUE(sReceived.empty());

  nfcPlf_registerPollingLoopCallback(&sCallback);
  EXPECT_EQ(1, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME,
                                             sizeof(FIELD_ON_FRAME)));
  EXPECT_EQ(1u, sReceived.size());
}

TEST_F(LinuxNfcPlfApiTest, test_callback_without_function) {
  nfcPollingLoopCallback_t empty = {NULL};
  nfcPlf_registerPollingLoopCallback(&empty);
  EXPECT_EQ(0, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME,
                                             sizeof(FIELD_ON_FRAME)));
  nfcPlf_deregisterPollingLoopCallback();
  EXPECT_TRUE(sReceived.empty());
}

TEST_F(LinuxNfcPlfApiTest, test_callback_function_read_per_frame) {
  nfcPollingLoopCallback_t callback = {NULL};
  nfcPlf_registerPollingLoopCallback(&callback);
  EXPECT_EQ(0, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME,
                                             sizeof(FIELD_ON_FRAME)));
  callback.onPollingLoopDetected = onPollingLoopDetected;
  EXPECT_EQ(1, nfcPlf_notifyPollingLoopFrame(FIELD_ON_FRAME,
                                             sizeof(FIELD_ON_FRAME)));
  nfcPlf_deregisterPollingLoopCallback();
  EXPECT_EQ(1u, sReceived.size());
}

TEST_F(LinuxNfcPlfApiTest, test_vendor_specific_ntf) {
  // Sub opcode byte doubles as the flags of the first TLV
  const unsigned char ntf[] = {0x6F, 0x0C, 0x06, 0x03, 0x02,
                               0x20, 0x00, 0x00, 0x00, 0x01};
  EXPECT_EQ(1, nfcPlf_onVendorSpecificNtf(0x0C, ntf, sizeof(ntf)));
  ASSERT_EQ(1u, sReceived.size());
  EXPECT_EQ(POLLING_LOOP_TYPE_B, sReceived[0].event.type);
  EXPECT_EQ(0x20u, sReceived[0].event.timestamp);

  EXPECT_EQ(0, nfcPlf_onVendorSpecificNtf(0x0B, ntf, sizeof(ntf)));
  EXPECT_EQ(0, nfcPlf_onVendorSpecificNtf(0x0C, ntf, 3));
  EXPECT_EQ(1u, sReceived.size());
}

class LinuxNfcPlfApiConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mkdir(TEST_CONFIG_DIR, 0755);
    writeConfig(TEST_CONFIG);
    setenv("PLF_CONFIG_DIR", TEST_CONFIG_DIR, 1);
    mSavedLevel = gPlfLog_level;
    mSavedDebug = plf_debug_enabled;
    // Drop anything loaded by a previous test
    EXPECT_EQ(0, nfcPlf_deinitialize());
  }
  void TearDown() override {
    unsetenv("PLF_CONFIG_DIR");
    unlink(TEST_CONFIG_FILE);
    rmdir(TEST_CONFIG_DIR);
    nfcPlf_deinitialize();
    gPlfLog_level = mSavedLevel;
    plf_debug_enabled = mSavedDebug;
  }

  void writeConfig(const char* config) {
    FILE* fp = fopen(TEST_CONFIG_FILE, "wt");
    ASSERT_NE(nullptr, fp);
    fwrite(config, 1, strlen(config), fp);
    fclose(fp);
  }

  plf_log_level_t mSavedLevel;
  bool mSavedDebug;
};

TEST_F(LinuxNfcPlfApiConfigTest, test_initialize_reads_log_levels) {
  EXPECT_EQ(0, nfcPlf_initialize());
  EXPECT_EQ(PLFLOG_LOG_DEBUG_LOGLEVEL, gPlfLog_level.decoder_log_level);
  // Module levels never go below the global level
  EXPECT_EQ(PLFLOG_DEFAULT_LOGLEVEL, gPlfLog_level.api_log_level);
  EXPECT_EQ(PLFLOG_DEFAULT_LOGLEVEL, gPlfLog_level.global_log_level);
}

TEST_F(LinuxNfcPlfApiConfigTest, test_debug_enabled_cleared_on_reinitialize) {
  writeConfig("NFC_DEBUG_ENABLED=1\n");
  EXPECT_EQ(0, nfcPlf_initialize());
  EXPECT_TRUE(plf_debug_enabled);
  EXPECT_EQ(PLFLOG_LOG_DEBUG_LOGLEVEL, gPlfLog_level.api_log_level);

  writeConfig("NFC_DEBUG_ENABLED=0\n");
  EXPECT_EQ(0, nfcPlf_deinitialize());
  EXPECT_EQ(0, nfcPlf_initialize());
  EXPECT_FALSE(plf_debug_enabled);
  EXPECT_EQ(PLFLOG_DEFAULT_LOGLEVEL, gPlfLog_level.global_log_level);
  EXPECT_EQ(PLFLOG_DEFAULT_LOGLEVEL, gPlfLog_level.api_log_level);
}

TEST_F(LinuxNfcPlfApiConfigTest, test_missing_file_loaded_once) {
  unlink(TEST_CONFIG_FILE);
  EXPECT_EQ(0, nfcPlf_initialize());
  EXPECT_FALSE(PlfConfig::hasKey(NAME_PLFLOG_DECODER_LOGLEVEL));

  // Not read again until the configuration is cleared
  writeConfig(TEST_CONFIG);
  EXPECT_FALSE(PlfConfig::hasKey(NAME_PLFLOG_DECODER_LOGLEVEL));
  EXPECT_EQ(0, nfcPlf_initialize());
  EXPECT_EQ(PLFLOG_DEFAULT_LOGLEVEL, gPlfLog_level.decoder_log_level);

  EXPECT_EQ(0, nfcPlf_deinitialize());
  EXPECT_EQ(3u, PlfConfig::getUnsigned(NAME_PLFLOG_DECODER_LOGLEVEL, 0));
  EXPECT_EQ(0, nfcPlf_initialize());
  EXPECT_EQ(PLFLOG_LOG_DEBUG_LOGLEVEL, gPlfLog_level.decoder_log_level);
}
