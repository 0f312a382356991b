// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_UNICODE_UNICODE_P_H_INCLUDED
#define TTGLYPH_UNICODE_UNICODE_P_H_INCLUDED

#include <ttglyph/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup tg_internal
//! \{

namespace tg {
namespace Unicode {

// tg::Unicode - Constants
// =======================

enum CharCode : uint32_t {
  kCharMax = 0x10FFFFu      //!< Last code-point.
};

// tg::Unicode - UTF8 Reader
// =========================

//! UTF-8 reader.
//!
//! Decodes one code point at a time and refuses overlong sequences, truncated sequences, and code points above
//! \ref kCharMax. After an error the reader doesn't advance.
class Utf8Reader {
public:
  //! Current pointer.
  const char* _ptr;
  //! End of input.
  const char* _end;

  TG_INLINE Utf8Reader(const void* data, size_t byte_size) noexcept {
    reset(data, byte_size);
  }

  TG_INLINE void reset(const void* data, size_t byte_size) noexcept {
    _ptr = static_cast<const char*>(data);
    _end = static_cast<const char*>(data) + byte_size;
  }

  [[nodiscard]]
  TG_INLINE bool has_next() const noexcept { return _ptr != _end; }

  [[nodiscard]]
  TG_INLINE size_t byte_index(const void* start) const noexcept { return (size_t)(_ptr - static_cast<const char*>(start)); }

  TG_INLINE TGResult next(uint32_t& uc) noexcept {
    size_t uc_size_in_bytes;
    return next(uc, uc_size_in_bytes);
  }

  TG_INLINE TGResult next(uint32_t& uc, size_t& uc_size_in_bytes) noexcept {
    TG_ASSERT(has_next());

    uc = uint8_t(_ptr[0]);
    uc_size_in_bytes = 1;

    _ptr++;
    if (uc < 0x80u) {
      // 1-Byte UTF-8 Sequence -> [0x00..0x7F].
    }
    else {
      // Start of MultiByte.
      const uint32_t kMultiByte = 0xC2u;

      uc -= kMultiByte;
      if (uc < 0xE0u - kMultiByte) {
        // 2-Byte UTF-8 Sequence -> [0x80-0x7FF].
        _ptr++;
        uc_size_in_bytes = 2;

        if (TG_UNLIKELY(_ptr > _end))
          goto TruncatedString;

        uint32_t b1 = uint32_t(uint8_t(_ptr[-1])) ^ 0x80u;
        uc = ((uc + kMultiByte - 0xC0u) << 6) + b1;

        if (TG_UNLIKELY(b1 > 0x3Fu))
          goto InvalidString;
      }
      else if (uc < 0xF0u - kMultiByte) {
        // 3-Byte UTF-8 Sequence -> [0x800-0xFFFF].
        _ptr += 2;
        uc_size_in_bytes = 3;

        if (TG_UNLIKELY(_ptr > _end))
          goto TruncatedString;

        uint32_t b1 = uint32_t(uint8_t(_ptr[-2])) ^ 0x80u;
        uint32_t b2 = uint32_t(uint8_t(_ptr[-1])) ^ 0x80u;
        uc = ((uc + kMultiByte - 0xE0u) << 12) + (b1 << 6) + b2;

        // Consecutive bytes must be '10xxxxxx' and overlong forms are refused.
        if (TG_UNLIKELY((b1 | b2) > 0x3Fu || uc < 0x800u))
          goto InvalidString;
      }
      else {
        // 4-Byte UTF-8 Sequence -> [0x010000-0x10FFFF].
        _ptr += 3;
        uc_size_in_bytes = 4;

        if (TG_UNLIKELY(_ptr > _end)) {
          // Bytes 0xF5 and above are always invalid.
          if (uc >= 0xF5u - kMultiByte)
            goto InvalidString;
          else
            goto TruncatedString;
        }

        uint32_t b1 = uint32_t(uint8_t(_ptr[-3])) ^ 0x80u;
        uint32_t b2 = uint32_t(uint8_t(_ptr[-2])) ^ 0x80u;
        uint32_t b3 = uint32_t(uint8_t(_ptr[-1])) ^ 0x80u;
        uc = ((uc + kMultiByte - 0xF0u) << 18) + (b1 << 12) + (b2 << 6) + b3;

        if (TG_UNLIKELY((b1 | b2 | b3) > 0x3Fu || uc < 0x010000u || uc > kCharMax))
          goto InvalidString;
      }
    }
    return TG_SUCCESS;

InvalidString:
    _ptr -= uc_size_in_bytes;
    return tg_make_error(TG_ERROR_INVALID_CHARACTER);

TruncatedString:
    _ptr -= uc_size_in_bytes;
    return tg_make_error(TG_ERROR_INVALID_DATA);
  }
};

// tg::Unicode - Utilities
// =======================

//! Decodes the first code point of a null terminated UTF-8 string `str`.
//!
//! Returns \ref TG_ERROR_INVALID_VALUE if the string is empty.
TG_HIDDEN TGResult first_code_point(const char* str, uint32_t* uc_out) noexcept;

} // {Unicode}
} // {tg}

//! \}
//! \endcond

#endif // TTGLYPH_UNICODE_UNICODE_P_H_INCLUDED
