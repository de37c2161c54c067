/*=====================================================================
Platform.h
----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#if defined(_WIN32)
#define GRADNOISE_STRONG_INLINE __forceinline
#else
#define GRADNOISE_STRONG_INLINE inline
#endif


// To disallow copy-construction and assignment operators, put this in the private part of a class:
#define GRADNOISE_DISABLE_COPY(TypeName) \
	TypeName(const TypeName &); \
	TypeName &operator=(const TypeName &);


#define staticArrayNumElems(a) sizeof((a)) / sizeof((a[0]))


#include <stdint.h>

typedef int8_t int8;
typedef uint8_t uint8;
typedef int16_t int16;
typedef uint16_t uint16;
typedef int32_t int32;
typedef uint32_t uint32;
typedef int64_t int64;
typedef uint64_t uint64;
