/**
 * @file export.hpp
 * @brief Symbol visibility macros for nsqsub_utils shared library.
 *
 * This header provides the NSQSUB_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(NSQSUB_UTILS_BUILD)
        #define NSQSUB_UTILS_API __declspec(dllexport)
    #else
        #define NSQSUB_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(NSQSUB_UTILS_BUILD)
        #define NSQSUB_UTILS_API __attribute__((visibility("default")))
    #else
        #define NSQSUB_UTILS_API
    #endif
#else
    #define NSQSUB_UTILS_API
#endif
