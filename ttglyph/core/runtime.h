// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_RUNTIME_H_INCLUDED
#define TTGLYPH_RUNTIME_H_INCLUDED

#include <ttglyph/core/api.h>

//! \addtogroup tg_runtime
//! \{

//! \name Runtime - Constants
//! \{

//! Severity of a diagnostic message.
//!
//! Messages having a lower severity than the level set by \ref tg_runtime_set_log_level() are dropped.
TG_DEFINE_ENUM(TGLogLevel) {
  //! Debug messages (for example a glyph that was requested, but is not in the font).
  TG_LOG_LEVEL_DEBUG = 0,
  //! Informative messages.
  TG_LOG_LEVEL_INFO = 1,
  //! Warnings [default level].
  TG_LOG_LEVEL_WARNING = 2,
  //! Errors (malformed outlines, failed name lookups).
  TG_LOG_LEVEL_ERROR = 3,
  //! Disables all diagnostic messages.
  TG_LOG_LEVEL_NONE = 4,

  //! Maximum value of `TGLogLevel`.
  TG_LOG_LEVEL_MAX_VALUE = 4
};

//! TTGlyph runtime build type.
TG_DEFINE_ENUM(TGRuntimeBuildType) {
  //! Describes a TTGlyph debug build.
  TG_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a TTGlyph release build.
  TG_RUNTIME_BUILD_TYPE_RELEASE = 1
};

//! \}

//! \name Runtime - Structs
//! \{

//! TTGlyph build information.
struct TGRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! TTGlyph build type, see \ref TGRuntimeBuildType.
  uint32_t build_type;

  //! Reserved for future use, always zero.
  uint32_t reserved[4];

  //! Identification of the C++ compiler used to build TTGlyph.
  char compiler_info[32];

  TG_INLINE_NODEBUG void reset() noexcept { *this = TGRuntimeBuildInfo{}; }
};

//! \}

//! \name Runtime - Message Handler
//! \{

//! A function that receives all diagnostic messages that pass the log level filter.
//!
//! The `message` is always null terminated and usually ends with a new line.
typedef void (TG_CDECL* TGMessageHandlerFunc)(uint32_t level, const char* message, void* user_data);

//! \}

//! \name Runtime - C API
//! \{

TG_BEGIN_C_DECLS

TG_API TGResult TG_CDECL tg_runtime_query_build_info(TGRuntimeBuildInfo* out) noexcept;

TG_API TGResult TG_CDECL tg_runtime_set_log_level(TGLogLevel level) noexcept;
TG_API TGLogLevel TG_CDECL tg_runtime_get_log_level() noexcept;
TG_API TGResult TG_CDECL tg_runtime_set_message_handler(TGMessageHandlerFunc handler, void* user_data) noexcept;

TG_API TGResult TG_CDECL tg_runtime_message_out(const char* msg) noexcept;
TG_API TGResult TG_CDECL tg_runtime_message_fmt(const char* fmt, ...) noexcept;
TG_API TGResult TG_CDECL tg_runtime_message_vfmt(const char* fmt, va_list ap) noexcept;

TG_API TGResult TG_CDECL tg_runtime_log(TGLogLevel level, const char* fmt, ...) noexcept;
TG_API TGResult TG_CDECL tg_runtime_log_v(TGLogLevel level, const char* fmt, va_list ap) noexcept;

TG_END_C_DECLS

//! \}

//! \name Runtime - C++ API
//! \{

//! Interface to access TTGlyph runtime (wraps C API).
//!
//! \note Runtime settings are process-wide. They are meant to be configured once before glyph outlines are used.
namespace TGRuntime {

static TG_INLINE_NODEBUG TGResult query_build_info(TGRuntimeBuildInfo* out) noexcept {
  return tg_runtime_query_build_info(out);
}

static TG_INLINE_NODEBUG TGResult set_log_level(TGLogLevel level) noexcept {
  return tg_runtime_set_log_level(level);
}

[[nodiscard]]
static TG_INLINE_NODEBUG TGLogLevel log_level() noexcept {
  return tg_runtime_get_log_level();
}

//! Replaces the message handler, null `handler` restores the default sink.
//!
//! \note Unlike the log level, the handler is not synchronized. Set it during application setup, before other
//! threads use TTGlyph, and never change it while messages can be emitted.
static TG_INLINE_NODEBUG TGResult set_message_handler(TGMessageHandlerFunc handler, void* user_data = nullptr) noexcept {
  return tg_runtime_set_message_handler(handler, user_data);
}

static TG_INLINE_NODEBUG TGResult reset_message_handler() noexcept {
  return tg_runtime_set_message_handler(nullptr, nullptr);
}

static TG_INLINE_NODEBUG TGResult message(const char* msg) noexcept {
  return tg_runtime_message_out(msg);
}

template<typename... Args>
static TG_INLINE_NODEBUG TGResult message(const char* fmt, Args&&... args) noexcept {
  return tg_runtime_message_fmt(fmt, static_cast<Args&&>(args)...);
}

} // {TGRuntime}

//! \}

//! \}

#endif // TTGLYPH_RUNTIME_H_INCLUDED
