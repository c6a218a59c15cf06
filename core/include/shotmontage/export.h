#pragma once

/// \file export.h
/// \brief Visibility/export macros for shared library builds.

#ifdef SHOTMONTAGE_STATIC
    #define SHOTMONTAGE_API
#elif defined(SHOTMONTAGE_BUILDING)
    #if defined(_MSC_VER)
        #define SHOTMONTAGE_API __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define SHOTMONTAGE_API __attribute__((visibility("default")))
    #else
        #define SHOTMONTAGE_API
    #endif
#else
    #if defined(_MSC_VER)
        #define SHOTMONTAGE_API __declspec(dllimport)
    #else
        #define SHOTMONTAGE_API
    #endif
#endif
