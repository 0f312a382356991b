// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_FONTSOURCE_H_INCLUDED
#define TTGLYPH_FONTSOURCE_H_INCLUDED

#include <ttglyph/core/fontdefs.h>

//! \addtogroup tg_text
//! \{

//! \name Font Source Interfaces
//!
//! Interfaces implemented by the embedding application. TTGlyph never parses font files: the application decodes
//! the font program and the document's font dictionaries and exposes them through these interfaces. All objects
//! are borrowed - they must outlive every `TGGlyphOutlines` instance that uses them, or at least until its
//! `dispose()` is called.
//!
//! \{

//! Character to glyph mapping table of a TrueType font ('cmap' subtable).
class TGCodeTable {
public:
  virtual ~TGCodeTable() noexcept = default;

  //! Returns the platform ID of the table, see \ref TGFontPlatformId.
  [[nodiscard]]
  virtual uint32_t platform_id() const noexcept = 0;

  //! Returns the platform specific encoding ID of the table.
  [[nodiscard]]
  virtual uint32_t encoding_id() const noexcept = 0;

  //! Maps `code` to a glyph index, returns zero if `code` is not mapped.
  [[nodiscard]]
  virtual TGGlyphId glyph_id_for_code(uint32_t code) const noexcept = 0;
};

//! Raw outline of a single TrueType glyph (composite glyphs already flattened).
class TGGlyphDescription {
public:
  virtual ~TGGlyphDescription() noexcept = default;

  [[nodiscard]]
  virtual uint32_t point_count() const noexcept = 0;

  [[nodiscard]]
  virtual int x_coordinate(uint32_t index) const noexcept = 0;

  [[nodiscard]]
  virtual int y_coordinate(uint32_t index) const noexcept = 0;

  //! Returns point flags, only \ref TG_GLYPH_POINT_FLAG_ON_CURVE is used.
  [[nodiscard]]
  virtual uint32_t flags(uint32_t index) const noexcept = 0;

  //! Tests whether the point at `index` is the last point of a contour.
  [[nodiscard]]
  virtual bool is_end_of_contour(uint32_t index) const noexcept = 0;
};

//! Glyph outline table of a TrueType font ('glyf' table).
class TGGlyphTable {
public:
  virtual ~TGGlyphTable() noexcept = default;

  [[nodiscard]]
  virtual uint32_t glyph_count() const noexcept = 0;

  //! Returns the outline of glyph `glyph_id` or null if the glyph has no outline data.
  [[nodiscard]]
  virtual const TGGlyphDescription* glyph_at(TGGlyphId glyph_id) const noexcept = 0;
};

//! Embedded TrueType font program.
class TGFontSource {
public:
  virtual ~TGFontSource() noexcept = default;

  //! Returns units per em from the 'head' table or zero if the font has no 'head' table.
  [[nodiscard]]
  virtual uint32_t units_per_em() const noexcept = 0;

  [[nodiscard]]
  virtual uint32_t code_table_count() const noexcept = 0;

  [[nodiscard]]
  virtual const TGCodeTable* code_table_at(uint32_t index) const noexcept = 0;

  //! Returns the glyph table or null if the font has no glyph outlines.
  [[nodiscard]]
  virtual const TGGlyphTable* glyph_table() const noexcept = 0;
};

//! Simple font encoding - maps a character code to a glyph name.
class TGFontEncoding {
public:
  virtual ~TGFontEncoding() noexcept = default;

  //! Stores the glyph name of `code` to `name_out`, which stays valid as long as the encoding is alive. A code
  //! without a name is not an error - `name_out` is set to null in that case.
  virtual TGResult glyph_name_for_code(uint32_t code, const char** name_out) const noexcept = 0;
};

//! Converts glyph names to character codes (Adobe Glyph List and Mac Roman encoding).
class TGGlyphNameMapper {
public:
  virtual ~TGGlyphNameMapper() noexcept = default;

  //! Converts glyph `name` to a Unicode code point. Returns \ref TG_ERROR_INVALID_CHARACTER if the name has no
  //! Unicode value.
  virtual TGResult unicode_for_name(const char* name, uint32_t* uc_out) const noexcept = 0;

  //! Converts glyph `name` to a Mac Roman character code. Returns \ref TG_ERROR_INVALID_CHARACTER if the name is
  //! not part of Mac Roman encoding.
  virtual TGResult mac_roman_code_for_name(const char* name, uint32_t* code_out) const noexcept = 0;
};

//! Character code to CID / Unicode map of a composite font.
class TGCidCMap {
public:
  virtual ~TGCidCMap() noexcept = default;

  //! Looks up `code` encoded in `byte_width` bytes and returns a null terminated UTF-8 string or null if the code
  //! is not mapped.
  [[nodiscard]]
  virtual const char* lookup(uint32_t code, uint32_t byte_width) const noexcept = 0;

  //! Tests whether the map contains two-byte mappings.
  [[nodiscard]]
  virtual bool has_two_byte_mappings() const noexcept = 0;
};

//! Descendant font of a composite (CID-keyed) font.
class TGCidFont {
public:
  virtual ~TGCidFont() noexcept = default;

  //! Tests whether the font uses the /Identity CID to GID map.
  [[nodiscard]]
  virtual bool has_identity_cid_to_gid_map() const noexcept = 0;

  //! Tests whether the font has an explicit CID to GID map stream.
  [[nodiscard]]
  virtual bool has_cid_to_gid_map() const noexcept = 0;

  [[nodiscard]]
  virtual TGGlyphId map_cid_to_gid(uint32_t cid) const noexcept = 0;
};

//! Font dictionary of the document that embeds the font program.
class TGFontDescriptor {
public:
  virtual ~TGFontDescriptor() noexcept = default;

  //! Tests whether the font is flagged as symbolic.
  [[nodiscard]]
  virtual bool is_symbolic() const noexcept = 0;

  //! Returns the base font name or null.
  [[nodiscard]]
  virtual const char* base_font_name() const noexcept = 0;

  //! Returns the encoding of a simple font or null.
  [[nodiscard]]
  virtual const TGFontEncoding* encoding() const noexcept = 0;

  //! Returns the CMap of a composite font or null.
  [[nodiscard]]
  virtual const TGCidCMap* cid_cmap() const noexcept = 0;
};

//! \}

//! \}

#endif // TTGLYPH_FONTSOURCE_H_INCLUDED
