// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/runtime_p.h>

#include <atomic>

// TGRuntime - Build Information
// =============================

static const TGRuntimeBuildInfo tg_runtime_build_info = {
  // TTGlyph major version.
  (TG_VERSION >> 16),
  // TTGlyph minor version.
  (TG_VERSION >> 8) & 0xFF,
  // TTGlyph patch version.
  (TG_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef TG_BUILD_DEBUG
  TG_RUNTIME_BUILD_TYPE_DEBUG,
#else
  TG_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Reserved
  { 0 },

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " TG_STRINGIFY(__clang_major__) "." TG_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  TG_STRINGIFY(__GNUC__) "." TG_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

// TGRuntime - Message Context
// ===========================

namespace {

struct TGRuntimeMessageContext {
  std::atomic<uint32_t> log_level;
  // Handler and its data are only written during setup (see `TGRuntime::set_message_handler()`).
  TGMessageHandlerFunc handler;
  void* handler_data;
};

static TGRuntimeMessageContext tg_runtime_message_context = {
  { uint32_t(TG_LOG_LEVEL_WARNING) },
  nullptr,
  nullptr
};

static const char* tg_runtime_level_prefix(uint32_t level) noexcept {
  switch (level) {
    case TG_LOG_LEVEL_DEBUG  : return "[TTGlyph] DEBUG: ";
    case TG_LOG_LEVEL_WARNING: return "[TTGlyph] WARNING: ";
    case TG_LOG_LEVEL_ERROR  : return "[TTGlyph] ERROR: ";
    default:
      return "[TTGlyph] ";
  }
}

} // {anonymous}

bool tg_runtime_is_log_level_enabled(uint32_t level) noexcept {
  uint32_t threshold = tg_runtime_message_context.log_level.load(std::memory_order_relaxed);
  return threshold != TG_LOG_LEVEL_NONE && level >= threshold;
}

void tg_runtime_emit_message(uint32_t level, const char* msg) noexcept {
  TGRuntimeMessageContext& ctx = tg_runtime_message_context;
  if (ctx.handler) {
    ctx.handler(level, msg, ctx.handler_data);
    return;
  }

#if defined(_WIN32)
  // Support both Console and GUI applications on Windows.
  OutputDebugStringA(msg);
#endif

  fputs(msg, stderr);
}

// TGRuntime - API - Build Information
// ===================================

TG_API_IMPL TGResult tg_runtime_query_build_info(TGRuntimeBuildInfo* out) noexcept {
  if (TG_UNLIKELY(!out))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  memcpy(out, &tg_runtime_build_info, sizeof(TGRuntimeBuildInfo));
  return TG_SUCCESS;
}

// TGRuntime - API - Log Level & Handler
// =====================================

TG_API_IMPL TGResult tg_runtime_set_log_level(TGLogLevel level) noexcept {
  if (TG_UNLIKELY(uint32_t(level) > TG_LOG_LEVEL_MAX_VALUE))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  tg_runtime_message_context.log_level.store(uint32_t(level), std::memory_order_relaxed);
  return TG_SUCCESS;
}

TG_API_IMPL TGLogLevel tg_runtime_get_log_level() noexcept {
  return TGLogLevel(tg_runtime_message_context.log_level.load(std::memory_order_relaxed));
}

TG_API_IMPL TGResult tg_runtime_set_message_handler(TGMessageHandlerFunc handler, void* user_data) noexcept {
  tg_runtime_message_context.handler = handler;
  tg_runtime_message_context.handler_data = handler ? user_data : nullptr;
  return TG_SUCCESS;
}

// TGRuntime - API - Message
// =========================

TG_API_IMPL TGResult tg_runtime_message_out(const char* msg) noexcept {
  if (TG_UNLIKELY(!msg))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  tg_runtime_emit_message(TG_LOG_LEVEL_INFO, msg);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  TGResult result = tg_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

TG_API_IMPL TGResult tg_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, TG_ARRAY_SIZE(buf), fmt, ap);
  return tg_runtime_message_out(buf);
}

// TGRuntime - API - Log
// =====================

TG_API_IMPL TGResult tg_runtime_log(TGLogLevel level, const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  TGResult result = tg_runtime_log_v(level, fmt, ap);
  va_end(ap);

  return result;
}

TG_API_IMPL TGResult tg_runtime_log_v(TGLogLevel level, const char* fmt, va_list ap) noexcept {
  if (TG_UNLIKELY(uint32_t(level) >= TG_LOG_LEVEL_NONE || !fmt))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  if (!tg_runtime_is_log_level_enabled(level))
    return TG_SUCCESS;

  char buf[1024];
  const char* prefix = tg_runtime_level_prefix(level);
  size_t prefix_size = strlen(prefix);

  memcpy(buf, prefix, prefix_size);
  vsnprintf(buf + prefix_size, TG_ARRAY_SIZE(buf) - prefix_size, fmt, ap);

  tg_runtime_emit_message(level, buf);
  return TG_SUCCESS;
}

// TGRuntime - Failure
// ===================

TG_API_IMPL void tg_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  char buf[1024];
  snprintf(buf, TG_ARRAY_SIZE(buf), "[TTGlyph] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  tg_runtime_emit_message(TG_LOG_LEVEL_ERROR, buf);
  abort();
}
