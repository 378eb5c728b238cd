#pragma once
#ifndef PVL_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define PVL_PLATFORM_WINDOWS 1
#else
#define PVL_PLATFORM_WINDOWS 0
#endif
#if PVL_PLATFORM_WINDOWS
#if defined(PVL_BUILD_SHARED)
#define PVL_API __declspec(dllexport)
#elif defined(PVL_SHARED)
#define PVL_API __declspec(dllimport)
#else
#define PVL_API
#endif
#else
#if defined(PVL_BUILD_SHARED) || defined(PVL_SHARED)
#if __GNUC__ >= 4
#define PVL_API __attribute__((visibility("default")))
#else
#define PVL_API
#endif // __GNUC__
#else
#define PVL_API
#endif // PVL_BUILD_SHARED || PVL_SHARED
#endif // PVL_PLATFORM_WINDOWS
#endif // PVL_API
