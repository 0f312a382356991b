// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_test_p.h>
#if defined(TG_TEST)

#include <ttglyph/unicode/unicode_p.h>

// tg::Unicode - Tests
// ===================

namespace tg {
namespace Tests {

UNIT(unicode_utf8_reader, TG_TEST_GROUP_UNICODE) {
  INFO("tg::Unicode::Utf8Reader");
  {
    const uint8_t data[] = {
      0x41,                  // U+000041
      0xC3, 0xA9,            // U+0000E9
      0xE2, 0x82, 0xAC,      // U+0020AC
      0xF0, 0x90, 0x8D, 0x88 // U+010348
    };

    Unicode::Utf8Reader it(data, TG_ARRAY_SIZE(data));
    uint32_t uc;

    EXPECT_SUCCESS(it.next(uc));
    EXPECT_EQ(uc, 0x000041u);

    EXPECT_SUCCESS(it.next(uc));
    EXPECT_EQ(uc, 0x0000E9u);

    EXPECT_SUCCESS(it.next(uc));
    EXPECT_EQ(uc, 0x0020ACu);

    EXPECT_TRUE(it.has_next());
    EXPECT_SUCCESS(it.next(uc));
    EXPECT_EQ(uc, 0x010348u);

    EXPECT_FALSE(it.has_next());
    EXPECT_EQ(it.byte_index(data), 10u);
  }

  INFO("tg::Unicode::Utf8Reader - invalid input");
  {
    const uint8_t truncated_data[] = { 0xE2, 0x82 };
    Unicode::Utf8Reader it(truncated_data, TG_ARRAY_SIZE(truncated_data));
    uint32_t uc;

    EXPECT_EQ(it.next(uc), TG_ERROR_INVALID_DATA);
    // After error the reader should not move.
    EXPECT_EQ(it.byte_index(truncated_data), 0u);

    const uint8_t overlong_data[] = { 0xE0, 0x80, 0xAF };
    it.reset(overlong_data, TG_ARRAY_SIZE(overlong_data));
    EXPECT_EQ(it.next(uc), TG_ERROR_INVALID_CHARACTER);

    const uint8_t continuation_data[] = { 0x80 };
    it.reset(continuation_data, TG_ARRAY_SIZE(continuation_data));
    EXPECT_EQ(it.next(uc), TG_ERROR_INVALID_CHARACTER);
  }
}

UNIT(unicode_first_code_point, TG_TEST_GROUP_UNICODE) {
  uint32_t uc;

  EXPECT_SUCCESS(Unicode::first_code_point("A", &uc));
  EXPECT_EQ(uc, 0x41u);

  EXPECT_SUCCESS(Unicode::first_code_point("\xE4\xB8\xADtail", &uc));
  EXPECT_EQ(uc, 0x4E2Du);

  EXPECT_SUCCESS(Unicode::first_code_point("\xF0\x9F\x98\x80", &uc));
  EXPECT_EQ(uc, 0x1F600u);

  EXPECT_EQ(Unicode::first_code_point("", &uc), TG_ERROR_INVALID_VALUE);
  EXPECT_EQ(uc, 0u);

  EXPECT_EQ(Unicode::first_code_point(nullptr, &uc), TG_ERROR_INVALID_VALUE);

  // Truncated by the terminator.
  EXPECT_EQ(Unicode::first_code_point("\xE4\xB8", &uc), TG_ERROR_INVALID_DATA);
  EXPECT_EQ(uc, 0u);
}

} // {Tests}
} // {tg}

#endif // TG_TEST
