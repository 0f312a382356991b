// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_test_p.h>
#if defined(TG_TEST)

#include <ttglyph/core/runtime.h>
#include <ttglyph-testing/tests/tg_test_fontsource.h>

// tg::Runtime - Tests
// ===================

namespace tg {
namespace Tests {

UNIT(runtime_build_info, TG_TEST_GROUP_CORE_RUNTIME) {
  TGRuntimeBuildInfo info;
  EXPECT_SUCCESS(TGRuntime::query_build_info(&info));

  EXPECT_EQ(info.major_version, uint32_t(TG_VERSION >> 16));
  EXPECT_EQ(info.minor_version, uint32_t((TG_VERSION >> 8) & 0xFF));
  EXPECT_EQ(info.patch_version, uint32_t(TG_VERSION & 0xFF));
  EXPECT_NE(info.compiler_info[0], '\0');

  EXPECT_EQ(tg_runtime_query_build_info(nullptr), TG_ERROR_INVALID_VALUE);
}

UNIT(runtime_log_level, TG_TEST_GROUP_CORE_RUNTIME) {
  TestMessageCapture capture(TG_LOG_LEVEL_WARNING);
  EXPECT_EQ(TGRuntime::log_level(), TG_LOG_LEVEL_WARNING);

  INFO("Messages below the threshold are dropped");
  {
    EXPECT_SUCCESS(tg_runtime_log(TG_LOG_LEVEL_DEBUG, "dropped %d\n", 1));
    EXPECT_SUCCESS(tg_runtime_log(TG_LOG_LEVEL_INFO, "dropped %d\n", 2));
    EXPECT_EQ(capture.count(TG_LOG_LEVEL_DEBUG), 0u);
    EXPECT_EQ(capture.count(TG_LOG_LEVEL_INFO), 0u);

    EXPECT_SUCCESS(tg_runtime_log(TG_LOG_LEVEL_ERROR, "kept %d\n", 3));
    EXPECT_EQ(capture.count(TG_LOG_LEVEL_ERROR), 1u);
    EXPECT_EQ(strcmp(capture.last_message(), "[TTGlyph] ERROR: kept 3\n"), 0);
  }

  INFO("Debug level enables everything");
  {
    EXPECT_SUCCESS(TGRuntime::set_log_level(TG_LOG_LEVEL_DEBUG));
    EXPECT_SUCCESS(tg_runtime_log(TG_LOG_LEVEL_DEBUG, "glyph %u\n", 7u));
    EXPECT_EQ(capture.count(TG_LOG_LEVEL_DEBUG), 1u);
    EXPECT_EQ(strcmp(capture.last_message(), "[TTGlyph] DEBUG: glyph 7\n"), 0);
  }

  INFO("None level disables everything");
  {
    EXPECT_SUCCESS(TGRuntime::set_log_level(TG_LOG_LEVEL_NONE));
    EXPECT_SUCCESS(tg_runtime_log(TG_LOG_LEVEL_ERROR, "dropped\n"));
    EXPECT_EQ(capture.count(TG_LOG_LEVEL_ERROR), 1u);

    // Plain messages are not filtered.
    EXPECT_SUCCESS(TGRuntime::message("plain %s\n", "message"));
    EXPECT_EQ(capture.count(TG_LOG_LEVEL_INFO), 1u);
    EXPECT_EQ(strcmp(capture.last_message(), "plain message\n"), 0);
  }

  INFO("Invalid arguments");
  {
    EXPECT_EQ(TGRuntime::set_log_level(TGLogLevel(TG_LOG_LEVEL_MAX_VALUE + 1)), TG_ERROR_INVALID_VALUE);
    EXPECT_EQ(TGRuntime::log_level(), TG_LOG_LEVEL_NONE);

    EXPECT_EQ(tg_runtime_log(TG_LOG_LEVEL_NONE, "message\n"), TG_ERROR_INVALID_VALUE);
    EXPECT_EQ(tg_runtime_message_out(nullptr), TG_ERROR_INVALID_VALUE);
  }
}

static void TG_CDECL count_messages(uint32_t level, const char* message, void* user_data) {
  (void)level;
  (void)message;
  (*static_cast<uint32_t*>(user_data))++;
}

UNIT(runtime_message_handler, TG_TEST_GROUP_CORE_RUNTIME) {
  uint32_t count = 0;

  EXPECT_SUCCESS(TGRuntime::set_message_handler(count_messages, &count));
  EXPECT_SUCCESS(TGRuntime::message("routed to handler\n"));
  EXPECT_EQ(count, 1u);

  // Restoring the default sink drops the handler together with its data.
  EXPECT_SUCCESS(TGRuntime::reset_message_handler());
  EXPECT_SUCCESS(TGRuntime::message("routed to the default sink\n"));
  EXPECT_EQ(count, 1u);
}

} // {Tests}
} // {tg}

#endif // TG_TEST
