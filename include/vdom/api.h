// api.h - DLL export/import macros for vdom

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the vdom library.
///
/// Usage:
/// - When building vdom as a SHARED library:
///   - CMake defines VDOM_EXPORTS (private) and VDOM_SHARED (public)
///   - Functions/classes marked with VDOM_API will be exported
///
/// - When using vdom as a SHARED library:
///   - Link against the vdom target (CMake propagates VDOM_SHARED)
///
/// - When building/using as a STATIC library:
///   - No macros defined, VDOM_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef VDOM_SHARED
        #ifdef VDOM_EXPORTS
            #define VDOM_API __declspec(dllexport)
        #else
            #define VDOM_API __declspec(dllimport)
        #endif
    #else
        #define VDOM_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(VDOM_SHARED) && defined(VDOM_EXPORTS)
        #define VDOM_API __attribute__((visibility("default")))
    #else
        #define VDOM_API
    #endif
#else
    #define VDOM_API
#endif
