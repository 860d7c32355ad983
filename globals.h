// -*- c++ -*-
//
// Copyright 1997-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#ifndef _GLOBALS_H
#define _GLOBALS_H

typedef unsigned long long W64;
typedef signed long long W64s;
typedef unsigned int W32;
typedef signed int W32s;
typedef unsigned short W16;
typedef signed short W16s;
typedef unsigned char byte;
typedef unsigned char W8;
typedef signed char W8s;
#define null NULL

#ifdef __cplusplus

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <limits.h>
#include <unistd.h>

template <typename T> struct limits { static const T min = 0; static const T max = 0; };
#define MakeLimits(T, __min, __max) template <> struct limits<T> { static const T min = (__min); static const T max = (__max); };
MakeLimits(W8, 0, 0xff);
MakeLimits(W16, 0, 0xffff);
MakeLimits(W32, 0, 0xffffffff);
MakeLimits(W64, 0, 0xffffffffffffffffULL);
MakeLimits(W64s, (W64s)0x8000000000000000ULL, 0x7fffffffffffffffLL);
#undef MakeLimits

#define unlikely(x) (__builtin_expect(!!(x), 0))
#define likely(x) (x)

#define foreach(i, n) for (size_t i = 0; i < (n); i++)

#define setzero(x) memset(&(x), 0, sizeof(x))
#define lengthof(x) (sizeof(x) / sizeof((x)[0]))

template <typename T> static inline T min(const T& a, const T& b) { return (a > b) ? b : a; }
template <typename T> static inline T max(const T& a, const T& b) { return (a > b) ? a : b; }
template <typename T> static inline bool inrange(const T& v, const T& minv, const T& maxv) { return ((v >= minv) & (v <= maxv)); }

static inline W64 bitmask64(int l) { return (l >= 64) ? (W64)(-1LL) : ((1ULL << l) - 1ULL); }

// Operand must be non-zero or result is undefined:
inline unsigned int lsbindex64(W64 n) { return __builtin_ctzll(n); }
inline unsigned int msbindex64(W64 n) { return 63 - __builtin_clzll(n); }
inline int popcount64(W64 x) { return __builtin_popcountll(x); }

inline bool strequal(const char* a, const char* b) {
  return (strcmp(a, b) == 0);
}

#define percent(x, total) (100.0 * ((float)(x)) / ((float)(total)))

inline int modulo_span(int lower, int upper, int modulus) {
  int result = (upper - lower);
  if (upper < lower) result += modulus;
  return result;
}

inline int add_index_modulo(int index, int increment, int bufsize) {
  index += increment;
  if (index < 0) index += bufsize;
  if (index >= bufsize) index -= bufsize;
  return index;
}

#define __stringify_1(x) #x
#define stringify(x) __stringify_1(x)

//
// Invariant checks are never compiled out: a violation means the
// surrounding pipeline has already corrupted scheduler state.
//
extern "C" void assert_fail(const char* __assertion, const char* __file, unsigned int __line, const char* __function) __attribute__ ((noreturn));

#define check_invariant(expr) \
  ((likely (expr)) ? (void)0 : assert_fail(#expr, __FILE__, __LINE__, __PRETTY_FUNCTION__))

#include <superstl.h>

using namespace superstl;

#endif // __cplusplus

#endif // _GLOBALS_H
