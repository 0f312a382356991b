// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_test_p.h>
#if defined(TG_TEST)

#include <ttglyph/truetype/ttcmap_p.h>
#include <ttglyph-testing/tests/tg_test_fontsource.h>

// tg::TrueType::CMapImpl - Tests
// ==============================

namespace tg {
namespace Tests {

UNIT(tt_cmap_role, TG_TEST_GROUP_TEXT_TRUETYPE) {
  using TrueType::CMapImpl::TableRole;
  using TrueType::CMapImpl::role_of;

  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_UCS2) == TableRole::kWinUnicode);
  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_SYMBOL) == TableRole::kWinSymbol);
  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_MAC, TG_FONT_MAC_ENCODING_ID_ROMAN) == TableRole::kMacSymbol);

  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_UCS4) == TableRole::kNone);
  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_UNICODE, 3) == TableRole::kNone);
  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_MAC, 1) == TableRole::kNone);
  EXPECT_TRUE(role_of(TG_FONT_PLATFORM_ID_ISO, 0) == TableRole::kNone);
}

UNIT(tt_cmap_select, TG_TEST_GROUP_TEXT_TRUETYPE) {
  TestGlyphTable glyphs(4);

  INFO("No tables");
  {
    TestFontSource font(1000, &glyphs);
    TrueType::CMapSelection selection;

    TrueType::CMapImpl::select(&font, selection);
    EXPECT_TRUE(selection.is_empty());

    TrueType::CMapImpl::select(nullptr, selection);
    EXPECT_TRUE(selection.is_empty());
  }

  INFO("Each recognized table is assigned to its role");
  {
    TestCodeTable unicode_full(TG_FONT_PLATFORM_ID_UNICODE, 4);
    TestCodeTable win_unicode(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_UCS2);
    TestCodeTable win_symbol(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_SYMBOL);
    TestCodeTable mac_roman(TG_FONT_PLATFORM_ID_MAC, TG_FONT_MAC_ENCODING_ID_ROMAN);

    TestFontSource font(1000, &glyphs);
    font.add_table(&unicode_full)
        .add_table(&mac_roman)
        .add_table(&win_symbol)
        .add_table(&win_unicode);

    TrueType::CMapSelection selection;
    TrueType::CMapImpl::select(&font, selection);

    EXPECT_TRUE(selection.win_unicode == &win_unicode);
    EXPECT_TRUE(selection.win_symbol == &win_symbol);
    EXPECT_TRUE(selection.mac_symbol == &mac_roman);
  }

  INFO("The last table of the same role wins");
  {
    TestCodeTable first(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_UCS2);
    TestCodeTable second(TG_FONT_PLATFORM_ID_WINDOWS, TG_FONT_WINDOWS_ENCODING_ID_UCS2);

    TestFontSource font(1000, &glyphs);
    font.add_table(&first).add_table(&second);

    TrueType::CMapSelection selection;
    TrueType::CMapImpl::select(&font, selection);

    EXPECT_TRUE(selection.win_unicode == &second);
    EXPECT_NULL(selection.win_symbol);
    EXPECT_NULL(selection.mac_symbol);
  }
}

} // {Tests}
} // {tg}

#endif // TG_TEST
