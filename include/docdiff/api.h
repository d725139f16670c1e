// api.h - Symbol visibility macros for docdiff

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the docdiff library.
///
/// - Static build (default): DOCDIFF_API expands to nothing.
/// - Shared build: CMake defines DOCDIFF_SHARED (public) and
///   DOCDIFF_EXPORTS (private, only while building the library).

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DOCDIFF_SHARED
        #ifdef DOCDIFF_EXPORTS
            #define DOCDIFF_API __declspec(dllexport)
        #else
            #define DOCDIFF_API __declspec(dllimport)
        #endif
    #else
        #define DOCDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DOCDIFF_SHARED) && defined(DOCDIFF_EXPORTS)
        #define DOCDIFF_API __attribute__((visibility("default")))
    #else
        #define DOCDIFF_API
    #endif
#else
    #define DOCDIFF_API
#endif
