#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - MUNSELLSPACE_BUILD_SHARED: when building MunsellSpace as shared library
 *   - MUNSELLSPACE_USE_SHARED: when using MunsellSpace as shared library
 *   - neither: static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MUNSELLSPACE_BUILD_SHARED)
        #define MUNSELLSPACE_API __declspec(dllexport)
    #elif defined(MUNSELLSPACE_USE_SHARED)
        #define MUNSELLSPACE_API __declspec(dllimport)
    #else
        #define MUNSELLSPACE_API
    #endif
#else
    #if defined(MUNSELLSPACE_BUILD_SHARED)
        #define MUNSELLSPACE_API __attribute__((visibility("default")))
    #else
        #define MUNSELLSPACE_API
    #endif
#endif
