// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_RUNTIME_P_H_INCLUDED
#define TTGLYPH_RUNTIME_P_H_INCLUDED

#include <ttglyph/core/api-internal_p.h>
#include <ttglyph/core/runtime.h>

//! \cond INTERNAL
//! \addtogroup tg_internal
//! \{

//! Tests whether a message of the given `level` would be emitted with the current runtime settings.
[[nodiscard]]
TG_HIDDEN bool tg_runtime_is_log_level_enabled(uint32_t level) noexcept;

//! Sends a message of the given `level` to the message handler or to the default sink without filtering.
TG_HIDDEN void tg_runtime_emit_message(uint32_t level, const char* msg) noexcept;

//! \}
//! \endcond

#endif // TTGLYPH_RUNTIME_P_H_INCLUDED
