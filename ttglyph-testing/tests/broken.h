// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// Broken - A minimal unit testing framework used by TTGlyph unit tests.
//
// Units are registered statically by `UNIT(name, priority)` and executed by `BrokenAPI::run()` ordered by their
// priority (which TTGlyph uses as a test group) and name. The first failed expectation terminates the process.

#ifndef TTGLYPH_TESTING_BROKEN_H_INCLUDED
#define TTGLYPH_TESTING_BROKEN_H_INCLUDED

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <utility>

namespace BrokenAPI {

//! Entry point of a unit.
typedef void (*Entry)(void);

//! Test unit.
struct Unit {
  Entry entry;
  const char* name;
  int priority;
  Unit* next;
};

//! Automatic unit registration by using static initialization.
class AutoUnit : public Unit {
public:
  AutoUnit(Entry unit_entry, const char* unit_name, int unit_priority = 0, int dummy = 0) noexcept;
};

//! Registers a unit (done automatically by `UNIT()`).
void add(Unit* unit) noexcept;

//! Tests whether the command line contains an argument `name`.
bool has_arg(const char* name) noexcept;

//! Sets output file, `stdout` by default.
void set_output_file(FILE* file) noexcept;

//! Runs all units selected by the command line and returns the process exit code.
int run(int argc, const char* argv[], Entry on_before_run = nullptr, Entry on_after_run = nullptr) noexcept;

//! Prints an informative message to the output file.
void info(const char* fmt, ...) noexcept;

//! Reports a failed expectation and terminates the process.
[[noreturn]] void fail(const char* file, int line, const char* expression, const char* fmt, ...) noexcept;

//! Result of an expectation, which can be extended by `message()` to describe the failure.
class Result {
public:
  const char* _file;
  int _line;
  const char* _expression;
  bool _passed;
  bool _handled;

  inline Result(const char* file, int line, const char* expression, bool passed) noexcept
    : _file(file),
      _line(line),
      _expression(expression),
      _passed(passed),
      _handled(false) {}

  inline ~Result() noexcept {
    if (!_passed && !_handled)
      fail(_file, _line, _expression, nullptr);
  }

  template<typename... Args>
  inline void message(const char* fmt, Args&&... args) noexcept {
    if (!_passed) {
      _handled = true;
      fail(_file, _line, _expression, fmt, std::forward<Args>(args)...);
    }
  }
};

template<typename T> static inline bool check(const T& x) noexcept { return !!x; }
template<typename T, typename U> static inline bool check_eq(const T& a, const U& b) noexcept { return a == b; }
template<typename T, typename U> static inline bool check_ne(const T& a, const U& b) noexcept { return a != b; }
template<typename T, typename U> static inline bool check_gt(const T& a, const U& b) noexcept { return a >  b; }
template<typename T, typename U> static inline bool check_ge(const T& a, const U& b) noexcept { return a >= b; }
template<typename T, typename U> static inline bool check_lt(const T& a, const U& b) noexcept { return a <  b; }
template<typename T, typename U> static inline bool check_le(const T& a, const U& b) noexcept { return a <= b; }

} // {BrokenAPI}

//! Internal macro used by all `EXPECT_...` macros.
#define BROKEN_EXPECT_INTERNAL(file, line, expression, result) \
  ::BrokenAPI::Result(file, line, expression, result)

//! Defines a unit test `NAME` that is executed with the given priority (test group).
#define UNIT(NAME, ...)                                                       \
  static void unit_##NAME##_entry(void);                                      \
  static ::BrokenAPI::AutoUnit unit_##NAME##_autoinit(unit_##NAME##_entry, #NAME, __VA_ARGS__); \
  static void unit_##NAME##_entry(void)

//! Informative message printed to the output file.
#define INFO(...) ::BrokenAPI::info(__VA_ARGS__)

#define EXPECT_TRUE(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_TRUE(" #__VA_ARGS__ ")", ::BrokenAPI::check(__VA_ARGS__))
#define EXPECT_FALSE(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_FALSE(" #__VA_ARGS__ ")", !::BrokenAPI::check(__VA_ARGS__))
#define EXPECT_NULL(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_NULL(" #__VA_ARGS__ ")", (__VA_ARGS__) == nullptr)
#define EXPECT_NOT_NULL(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_NOT_NULL(" #__VA_ARGS__ ")", (__VA_ARGS__) != nullptr)

#define EXPECT_EQ(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_EQ(" #__VA_ARGS__ ")", ::BrokenAPI::check_eq(__VA_ARGS__))
#define EXPECT_NE(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_NE(" #__VA_ARGS__ ")", ::BrokenAPI::check_ne(__VA_ARGS__))
#define EXPECT_GT(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_GT(" #__VA_ARGS__ ")", ::BrokenAPI::check_gt(__VA_ARGS__))
#define EXPECT_GE(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_GE(" #__VA_ARGS__ ")", ::BrokenAPI::check_ge(__VA_ARGS__))
#define EXPECT_LT(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_LT(" #__VA_ARGS__ ")", ::BrokenAPI::check_lt(__VA_ARGS__))
#define EXPECT_LE(...) BROKEN_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_LE(" #__VA_ARGS__ ")", ::BrokenAPI::check_le(__VA_ARGS__))

#endif // TTGLYPH_TESTING_BROKEN_H_INCLUDED
