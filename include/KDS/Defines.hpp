#pragma once

#if defined(_MSC_VER) && !defined(__clang__)
#define KDS_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define KDS_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define KDS_ALWAYS_INLINE inline
#endif

#ifndef KDS_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(KDS_SHARED_BUILD)
#define KDS_API __declspec(dllexport)
#elif defined(KDS_SHARED)
#define KDS_API __declspec(dllimport)
#else
#define KDS_API
#endif
#define KDS_LOCAL
#else
#if defined(KDS_SHARED_BUILD) || defined(KDS_SHARED)
#define KDS_API __attribute__((visibility("default")))
#else
#define KDS_API
#endif
#define KDS_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef KDS_LOCAL
#define KDS_LOCAL
#endif
