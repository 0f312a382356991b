// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/unicode/unicode_p.h>

namespace tg {
namespace Unicode {

// tg::Unicode - Utilities
// =======================

TGResult first_code_point(const char* str, uint32_t* uc_out) noexcept {
  *uc_out = 0;

  if (TG_UNLIKELY(!str || !str[0]))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  // A code point never spans more than 4 bytes, the terminator stops shorter strings.
  size_t size = strnlen(str, 4);
  Utf8Reader reader(str, size);

  uint32_t uc;
  TG_PROPAGATE(reader.next(uc));

  *uc_out = uc;
  return TG_SUCCESS;
}

} // {Unicode}
} // {tg}
