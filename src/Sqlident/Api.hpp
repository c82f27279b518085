// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(__GNUC__)
    #define SQLIDENT_NO_EXPORT    __attribute__((visibility("hidden")))
    #define SQLIDENT_EXPORT       __attribute__((visibility("default")))
    #define SQLIDENT_IMPORT       /*!*/
    #define SQLIDENT_FORCE_INLINE __attribute__((always_inline))
#elif defined(_MSC_VER)
    #define SQLIDENT_NO_EXPORT    /*!*/
    #define SQLIDENT_EXPORT       __declspec(dllexport)
    #define SQLIDENT_IMPORT       __declspec(dllimport)
    #define SQLIDENT_FORCE_INLINE __forceinline
#endif

#if defined(SQLIDENT_SHARED)
    #if defined(BUILD_SQLIDENT)
        #define SQLIDENT_API SQLIDENT_EXPORT
    #else
        #define SQLIDENT_API SQLIDENT_IMPORT
    #endif
#else
    #define SQLIDENT_API /*!*/
#endif
