// api.h - DLL export/import macros for docdiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the docdiff library.
///
/// Usage:
/// - When building docdiff as a SHARED library:
///   - CMake defines DOCDIFF_EXPORTS (private) and DOCDIFF_SHARED (public)
///   - Functions/classes marked with DOCDIFF_API will be exported
///
/// - When using docdiff as a SHARED library:
///   - Link against the docdiff target (CMake propagates DOCDIFF_SHARED)
///   - Functions/classes marked with DOCDIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, DOCDIFF_API expands to nothing
///
/// Example:
/// @code
/// class DOCDIFF_API MyClass { ... };           // Export entire class
/// DOCDIFF_API void my_function();              // Export free function
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    // Windows platform (MSVC, MinGW, Clang-CL)
    #ifdef DOCDIFF_SHARED
        #ifdef DOCDIFF_EXPORTS
            // Building the DLL: export symbols
            #define DOCDIFF_API __declspec(dllexport)
        #else
            // Using the DLL: import symbols
            #define DOCDIFF_API __declspec(dllimport)
        #endif
    #else
        // Static library: no decoration needed
        #define DOCDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang on Unix-like platforms
    #if defined(DOCDIFF_SHARED) && defined(DOCDIFF_EXPORTS)
        // Building shared library: set default visibility
        #define DOCDIFF_API __attribute__((visibility("default")))
    #else
        // Static library or using shared library
        #define DOCDIFF_API
    #endif
#else
    // Unknown compiler: no decoration
    #define DOCDIFF_API
#endif

