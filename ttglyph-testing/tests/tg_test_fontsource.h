// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// In-memory implementations of font source interfaces used by TTGlyph unit tests.

#ifndef TTGLYPH_TESTING_TG_TEST_FONTSOURCE_H_INCLUDED
#define TTGLYPH_TESTING_TG_TEST_FONTSOURCE_H_INCLUDED

#include <ttglyph/core/fontsource.h>
#include <ttglyph/core/runtime.h>

#include <string.h>

namespace tg {
namespace Tests {

// tg::Tests - Code Table
// ======================

class TestCodeTable : public TGCodeTable {
public:
  enum : uint32_t { kMaxEntries = 32, kMaxQueries = 32 };

  struct Entry {
    uint32_t code;
    TGGlyphId glyph_id;
  };

  uint32_t _platform_id;
  uint32_t _encoding_id;

  Entry _entries[kMaxEntries];
  uint32_t _entry_count = 0;

  //! Codes queried by `glyph_id_for_code()`, used to verify probing order.
  mutable uint32_t _queries[kMaxQueries];
  mutable uint32_t _query_count = 0;

  TestCodeTable(uint32_t platform_id, uint32_t encoding_id) noexcept
    : _platform_id(platform_id),
      _encoding_id(encoding_id) {}

  TestCodeTable& add(uint32_t code, TGGlyphId glyph_id) noexcept {
    if (_entry_count < kMaxEntries)
      _entries[_entry_count++] = Entry{code, glyph_id};
    return *this;
  }

  void reset_queries() const noexcept { _query_count = 0; }

  uint32_t platform_id() const noexcept override { return _platform_id; }
  uint32_t encoding_id() const noexcept override { return _encoding_id; }

  TGGlyphId glyph_id_for_code(uint32_t code) const noexcept override {
    if (_query_count < kMaxQueries)
      _queries[_query_count++] = code;

    for (uint32_t i = 0; i < _entry_count; i++)
      if (_entries[i].code == code)
        return _entries[i].glyph_id;
    return 0;
  }
};

// tg::Tests - Glyph Description & Table
// =====================================

//! Raw outline point as stored in a font (y axis pointing up).
struct TestRawPoint {
  int x;
  int y;
  uint32_t flags;
  bool end_of_contour;
};

static constexpr uint32_t kOn = TG_GLYPH_POINT_FLAG_ON_CURVE;
static constexpr uint32_t kOff = 0;

class TestGlyphDescription : public TGGlyphDescription {
public:
  const TestRawPoint* _points;
  uint32_t _point_count;

  TestGlyphDescription(const TestRawPoint* points, uint32_t point_count) noexcept
    : _points(points),
      _point_count(point_count) {}

  uint32_t point_count() const noexcept override { return _point_count; }
  int x_coordinate(uint32_t index) const noexcept override { return _points[index].x; }
  int y_coordinate(uint32_t index) const noexcept override { return _points[index].y; }
  uint32_t flags(uint32_t index) const noexcept override { return _points[index].flags; }
  bool is_end_of_contour(uint32_t index) const noexcept override { return _points[index].end_of_contour; }
};

class TestGlyphTable : public TGGlyphTable {
public:
  enum : uint32_t { kMaxGlyphs = 16 };

  const TGGlyphDescription* _glyphs[kMaxGlyphs] {};
  uint32_t _glyph_count = 0;

  //! Number of `glyph_at()` calls, used to verify caching.
  mutable uint32_t _access_count = 0;

  explicit TestGlyphTable(uint32_t glyph_count) noexcept
    : _glyph_count(glyph_count < kMaxGlyphs ? glyph_count : uint32_t(kMaxGlyphs)) {}

  TestGlyphTable& set(TGGlyphId glyph_id, const TGGlyphDescription* gd) noexcept {
    if (glyph_id < _glyph_count)
      _glyphs[glyph_id] = gd;
    return *this;
  }

  uint32_t glyph_count() const noexcept override { return _glyph_count; }

  const TGGlyphDescription* glyph_at(TGGlyphId glyph_id) const noexcept override {
    _access_count++;
    return glyph_id < _glyph_count ? _glyphs[glyph_id] : nullptr;
  }
};

// tg::Tests - Font Source
// =======================

class TestFontSource : public TGFontSource {
public:
  enum : uint32_t { kMaxTables = 8 };

  uint32_t _units_per_em;
  const TGCodeTable* _tables[kMaxTables] {};
  uint32_t _table_count = 0;
  const TGGlyphTable* _glyph_table;

  TestFontSource(uint32_t units_per_em, const TGGlyphTable* glyph_table) noexcept
    : _units_per_em(units_per_em),
      _glyph_table(glyph_table) {}

  TestFontSource& add_table(const TGCodeTable* table) noexcept {
    if (_table_count < kMaxTables)
      _tables[_table_count++] = table;
    return *this;
  }

  uint32_t units_per_em() const noexcept override { return _units_per_em; }
  uint32_t code_table_count() const noexcept override { return _table_count; }
  const TGCodeTable* code_table_at(uint32_t index) const noexcept override { return index < _table_count ? _tables[index] : nullptr; }
  const TGGlyphTable* glyph_table() const noexcept override { return _glyph_table; }
};

// tg::Tests - Encoding & Names
// ============================

class TestFontEncoding : public TGFontEncoding {
public:
  enum : uint32_t { kMaxEntries = 16 };

  struct Entry {
    uint32_t code;
    const char* name;
  };

  Entry _entries[kMaxEntries];
  uint32_t _entry_count = 0;

  //! Code for which `glyph_name_for_code()` fails.
  uint32_t _failing_code = 0xFFFFFFFFu;

  TestFontEncoding& add(uint32_t code, const char* name) noexcept {
    if (_entry_count < kMaxEntries)
      _entries[_entry_count++] = Entry{code, name};
    return *this;
  }

  TGResult glyph_name_for_code(uint32_t code, const char** name_out) const noexcept override {
    *name_out = nullptr;
    if (code == _failing_code)
      return TG_ERROR_INVALID_DATA;

    for (uint32_t i = 0; i < _entry_count; i++) {
      if (_entries[i].code == code) {
        *name_out = _entries[i].name;
        break;
      }
    }
    return TG_SUCCESS;
  }
};

class TestGlyphNameMapper : public TGGlyphNameMapper {
public:
  enum : uint32_t { kMaxEntries = 16 };

  struct Entry {
    const char* name;
    uint32_t unicode;
    uint32_t mac_code;
  };

  Entry _entries[kMaxEntries];
  uint32_t _entry_count = 0;

  //! Name for which `unicode_for_name()` fails with a generic error.
  const char* _failing_name = nullptr;

  //! Adds a name, pass 0xFFFFFFFF as `unicode` or `mac_code` to make the name unmapped.
  TestGlyphNameMapper& add(const char* name, uint32_t unicode, uint32_t mac_code) noexcept {
    if (_entry_count < kMaxEntries)
      _entries[_entry_count++] = Entry{name, unicode, mac_code};
    return *this;
  }

  const Entry* find(const char* name) const noexcept {
    for (uint32_t i = 0; i < _entry_count; i++)
      if (strcmp(_entries[i].name, name) == 0)
        return &_entries[i];
    return nullptr;
  }

  TGResult unicode_for_name(const char* name, uint32_t* uc_out) const noexcept override {
    *uc_out = 0;
    if (_failing_name && strcmp(_failing_name, name) == 0)
      return TG_ERROR_INVALID_DATA;

    const Entry* entry = find(name);
    if (!entry || entry->unicode == 0xFFFFFFFFu)
      return TG_ERROR_INVALID_CHARACTER;

    *uc_out = entry->unicode;
    return TG_SUCCESS;
  }

  TGResult mac_roman_code_for_name(const char* name, uint32_t* code_out) const noexcept override {
    *code_out = 0;

    const Entry* entry = find(name);
    if (!entry || entry->mac_code == 0xFFFFFFFFu)
      return TG_ERROR_INVALID_CHARACTER;

    *code_out = entry->mac_code;
    return TG_SUCCESS;
  }
};

// tg::Tests - CID
// ===============

class TestCidCMap : public TGCidCMap {
public:
  enum : uint32_t { kMaxEntries = 16 };

  struct Entry {
    uint32_t code;
    const char* str;
  };

  Entry _entries[kMaxEntries];
  uint32_t _entry_count = 0;
  bool _two_byte_mappings;

  mutable uint32_t _last_byte_width = 0;

  explicit TestCidCMap(bool two_byte_mappings) noexcept
    : _two_byte_mappings(two_byte_mappings) {}

  TestCidCMap& add(uint32_t code, const char* str) noexcept {
    if (_entry_count < kMaxEntries)
      _entries[_entry_count++] = Entry{code, str};
    return *this;
  }

  const char* lookup(uint32_t code, uint32_t byte_width) const noexcept override {
    _last_byte_width = byte_width;
    for (uint32_t i = 0; i < _entry_count; i++)
      if (_entries[i].code == code)
        return _entries[i].str;
    return nullptr;
  }

  bool has_two_byte_mappings() const noexcept override { return _two_byte_mappings; }
};

class TestCidFont : public TGCidFont {
public:
  bool _identity;
  bool _explicit_map;
  //! Explicit CID to GID map adds this offset to a CID.
  uint32_t _gid_offset;

  TestCidFont(bool identity, bool explicit_map, uint32_t gid_offset = 0) noexcept
    : _identity(identity),
      _explicit_map(explicit_map),
      _gid_offset(gid_offset) {}

  bool has_identity_cid_to_gid_map() const noexcept override { return _identity; }
  bool has_cid_to_gid_map() const noexcept override { return _explicit_map; }
  TGGlyphId map_cid_to_gid(uint32_t cid) const noexcept override { return cid + _gid_offset; }
};

// tg::Tests - Font Descriptor
// ===========================

class TestFontDescriptor : public TGFontDescriptor {
public:
  bool _symbolic;
  const char* _name;
  const TGFontEncoding* _encoding;
  const TGCidCMap* _cid_cmap;

  TestFontDescriptor(bool symbolic, const char* name, const TGFontEncoding* encoding = nullptr, const TGCidCMap* cid_cmap = nullptr) noexcept
    : _symbolic(symbolic),
      _name(name),
      _encoding(encoding),
      _cid_cmap(cid_cmap) {}

  bool is_symbolic() const noexcept override { return _symbolic; }
  const char* base_font_name() const noexcept override { return _name; }
  const TGFontEncoding* encoding() const noexcept override { return _encoding; }
  const TGCidCMap* cid_cmap() const noexcept override { return _cid_cmap; }
};

// tg::Tests - Message Capture
// ===========================

//! Captures runtime messages while alive and restores the default handler and log level afterwards.
class TestMessageCapture {
public:
  uint32_t _counts[TG_LOG_LEVEL_MAX_VALUE + 1] {};
  char _last_message[1024] {};
  TGLogLevel _saved_level;

  explicit TestMessageCapture(TGLogLevel level = TG_LOG_LEVEL_DEBUG) noexcept
    : _saved_level(TGRuntime::log_level()) {
    TGRuntime::set_message_handler(on_message, this);
    TGRuntime::set_log_level(level);
  }

  ~TestMessageCapture() noexcept {
    TGRuntime::reset_message_handler();
    TGRuntime::set_log_level(_saved_level);
  }

  uint32_t count(TGLogLevel level) const noexcept { return _counts[level]; }
  const char* last_message() const noexcept { return _last_message; }

  static void TG_CDECL on_message(uint32_t level, const char* message, void* user_data) {
    TestMessageCapture* self = static_cast<TestMessageCapture*>(user_data);
    if (level <= TG_LOG_LEVEL_MAX_VALUE)
      self->_counts[level]++;

    size_t size = strlen(message);
    if (size >= sizeof(self->_last_message))
      size = sizeof(self->_last_message) - 1;
    memcpy(self->_last_message, message, size);
    self->_last_message[size] = '\0';
  }
};

} // {Tests}
} // {tg}

#endif // TTGLYPH_TESTING_TG_TEST_FONTSOURCE_H_INCLUDED
