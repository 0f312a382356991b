// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_SUPPORT_SCOPEDBUFFER_P_H_INCLUDED
#define TTGLYPH_SUPPORT_SCOPEDBUFFER_P_H_INCLUDED

#include <ttglyph/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup tg_internal
//! \{

namespace tg {

//! \name Scoped Buffer
//! \{

//! Scoped buffer of trivially copyable items of type `T`, which uses `N` items of embedded storage and falls back
//! to the heap when more items are requested. Heap memory is released by the destructor or `reset()`.
template<typename T, size_t N>
class ScopedBufferTmp {
public:
  TG_NONCOPYABLE(ScopedBufferTmp)

  static_assert(std::is_trivially_copyable<T>::value, "ScopedBufferTmp<T> requires a trivially copyable T");

  T* _data;
  size_t _capacity;
  T _storage[N];

  TG_INLINE ScopedBufferTmp() noexcept
    : _data(_storage),
      _capacity(N) {}

  TG_INLINE ~ScopedBufferTmp() noexcept { _release(); }

  [[nodiscard]]
  TG_INLINE T* data() const noexcept { return _data; }

  [[nodiscard]]
  TG_INLINE size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]]
  TG_INLINE bool is_embedded() const noexcept { return _data == _storage; }

  //! Makes room for `count` items and returns the buffer or null if the allocation failed. Content of the buffer
  //! is not preserved.
  [[nodiscard]]
  TG_INLINE T* alloc(size_t count) noexcept {
    if (count <= _capacity)
      return _data;

    if (TG_UNLIKELY(count > std::numeric_limits<size_t>::max() / sizeof(T)))
      return nullptr;

    T* data = static_cast<T*>(malloc(count * sizeof(T)));
    if (TG_UNLIKELY(!data))
      return nullptr;

    _release();
    _data = data;
    _capacity = count;
    return data;
  }

  TG_INLINE void reset() noexcept {
    _release();
    _data = _storage;
    _capacity = N;
  }

  TG_INLINE void _release() noexcept {
    if (_data != _storage)
      free(_data);
  }
};

//! \}

} // {tg}

//! \}
//! \endcond

#endif // TTGLYPH_SUPPORT_SCOPEDBUFFER_P_H_INCLUDED
