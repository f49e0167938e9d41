/**
 * @file export.hpp
 * @brief Symbol visibility macros for the guidkit_utils library.
 *
 * Provides GUIDKIT_UTILS_API for cross-platform shared library symbol
 * export/import. Define GUIDKIT_STATIC when linking the static archives.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#pragma once

#if defined(GUIDKIT_STATIC)
    #define GUIDKIT_UTILS_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(GUIDKIT_UTILS_BUILD)
        #define GUIDKIT_UTILS_API __declspec(dllexport)
    #else
        #define GUIDKIT_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(GUIDKIT_UTILS_BUILD)
        #define GUIDKIT_UTILS_API __attribute__((visibility("default")))
    #else
        #define GUIDKIT_UTILS_API
    #endif
#else
    #define GUIDKIT_UTILS_API
#endif
