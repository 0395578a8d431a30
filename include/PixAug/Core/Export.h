#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PIXAUG_BUILD_SHARED: when building PixAug as shared library
 *   - PIXAUG_USE_SHARED: when using PixAug as shared library
 *   - neither: static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PIXAUG_BUILD_SHARED)
        #define PIXAUG_API __declspec(dllexport)
    #elif defined(PIXAUG_USE_SHARED)
        #define PIXAUG_API __declspec(dllimport)
    #else
        #define PIXAUG_API
    #endif
#else
    #if defined(PIXAUG_BUILD_SHARED)
        #define PIXAUG_API __attribute__((visibility("default")))
    #else
        #define PIXAUG_API
    #endif
#endif
