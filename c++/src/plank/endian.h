// Copyright (c) 2013-2014 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include "common.h"
#include <inttypes.h>
#include <string.h>  // memcpy

namespace plank {

// WireValue<T> stores a T in little-endian byte order, whatever the host order is.  Generated
// struct classes are built out of WireValues so that their in-memory image is exactly their
// wire image.
//
// On little-endian hosts this is a no-op wrapper.  On big-endian GCC/Clang targets we swap
// using the builtins.  Other targets are not supported.

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__ && \
    !PLANK_DISABLE_ENDIAN_DETECTION

template <typename T>
class DirectWireValue {
public:
  KJ_ALWAYS_INLINE(T get() const) { return value; }
  KJ_ALWAYS_INLINE(void set(T newValue)) { value = newValue; }

private:
  T value;
};

template <typename T>
using WireValue = DirectWireValue<T>;

#elif defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__ && defined(__GNUC__)

namespace _ {  // private

template <size_t size> struct SwapInt;
template <> struct SwapInt<1> {
  typedef uint8_t Type;
  static inline Type swap(Type value) { return value; }
};
template <> struct SwapInt<2> {
  typedef uint16_t Type;
  static inline Type swap(Type value) { return __builtin_bswap16(value); }
};
template <> struct SwapInt<4> {
  typedef uint32_t Type;
  static inline Type swap(Type value) { return __builtin_bswap32(value); }
};
template <> struct SwapInt<8> {
  typedef uint64_t Type;
  static inline Type swap(Type value) { return __builtin_bswap64(value); }
};

}  // namespace _ (private)

template <typename T>
class SwappingWireValue {
  typedef _::SwapInt<sizeof(T)> Swap;

public:
  KJ_ALWAYS_INLINE(T get() const) {
    typename Swap::Type swapped = Swap::swap(value);
    T result;
    memcpy(&result, &swapped, sizeof(T));
    return result;
  }
  KJ_ALWAYS_INLINE(void set(T newValue)) {
    typename Swap::Type raw;
    memcpy(&raw, &newValue, sizeof(T));
    value = Swap::swap(raw);
  }

private:
  typename Swap::Type value;
};

template <typename T>
using WireValue = SwappingWireValue<T>;

#else
#error "Couldn't detect the byte order of your platform."
#endif

template <typename T>
inline T loadWire(const byte* location) {
  // Reads a little-endian T from a location that may not be aligned.
  WireValue<T> wire;
  memcpy(&wire, location, sizeof(T));
  return wire.get();
}

template <typename T>
inline void storeWire(byte* location, T value) {
  WireValue<T> wire;
  wire.set(value);
  memcpy(location, &wire, sizeof(T));
}

}  // namespace plank
