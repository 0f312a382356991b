// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each TTGlyph test file.

#ifndef TTGLYPH_API_BUILD_TEST_P_H_INCLUDED
#define TTGLYPH_API_BUILD_TEST_P_H_INCLUDED

#include <ttglyph/core/api-build_p.h>

// tg::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(TG_TEST) && defined(__INTELLISENSE__)
  #define TG_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `ttglyph_test_runner` build.
#if defined(TG_TEST)

#include <ttglyph-testing/tests/broken.h>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_SUCCESS(" #__VA_ARGS__ ")", (__VA_ARGS__) == TG_SUCCESS)

//! TTGlyph test group.
enum TGTestGroup : int {
  TG_TEST_GROUP_CORE_UTILITIES = 1,
  TG_TEST_GROUP_CORE_RUNTIME,
  TG_TEST_GROUP_GEOMETRY_CONTAINERS,
  TG_TEST_GROUP_UNICODE,
  TG_TEST_GROUP_TEXT_TRUETYPE,
  TG_TEST_GROUP_TEXT_COMBINED
};
//! \endcond

#endif // TG_TEST

#endif // TTGLYPH_API_BUILD_TEST_P_H_INCLUDED
