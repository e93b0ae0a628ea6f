#pragma once

/**
 * @file platform.hpp
 * @brief Compiler, OS and language feature detection for configs
 *
 * This header provides:
 * - Compile-time compiler and OS detection
 * - Language feature detection (source_location, concepts)
 * - Branch hints and export macros
 * - A few runtime environment queries
 */

#include <cstdint>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define CONFIGS_COMPILER_CLANG 1
    #define CONFIGS_COMPILER_NAME "Clang"
#elif defined(__GNUC__) || defined(__GNUG__)
    #define CONFIGS_COMPILER_GCC 1
    #define CONFIGS_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define CONFIGS_COMPILER_MSVC 1
    #define CONFIGS_COMPILER_NAME "MSVC"
#else
    #define CONFIGS_COMPILER_UNKNOWN 1
    #define CONFIGS_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// OS DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define CONFIGS_OS_WINDOWS 1
    #define CONFIGS_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define CONFIGS_OS_MACOS 1
    #define CONFIGS_OS_NAME "macOS"
#elif defined(__linux__)
    #define CONFIGS_OS_LINUX 1
    #define CONFIGS_OS_NAME "Linux"
#elif defined(__unix__)
    #define CONFIGS_OS_UNIX 1
    #define CONFIGS_OS_NAME "Unix"
#else
    #define CONFIGS_OS_UNKNOWN 1
    #define CONFIGS_OS_NAME "Unknown"
#endif

#if defined(CONFIGS_OS_LINUX) || defined(CONFIGS_OS_MACOS) || defined(CONFIGS_OS_UNIX)
    #define CONFIGS_OS_POSIX 1
#endif

// ============================================================================
// BUILD TYPE DETECTION
// ============================================================================

#if defined(NDEBUG) || defined(CONFIGS_RELEASE)
    #define CONFIGS_BUILD_RELEASE 1
    #define CONFIGS_BUILD_TYPE "Release"
#else
    #define CONFIGS_BUILD_DEBUG 1
    #define CONFIGS_BUILD_TYPE "Debug"
#endif

// ============================================================================
// FEATURE DETECTION
// ============================================================================

#if __cplusplus >= 202002L
    #define CONFIGS_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define CONFIGS_CPP_VERSION 17
#else
    #define CONFIGS_CPP_VERSION 0
#endif

// Source location (C++20)
#if defined(__cpp_lib_source_location) || (CONFIGS_CPP_VERSION >= 20 && !defined(CONFIGS_COMPILER_MSVC))
    #define CONFIGS_HAS_SOURCE_LOCATION 1
#endif

// Concepts (C++20)
#if defined(__cpp_concepts) && __cpp_concepts >= 201907L
    #define CONFIGS_HAS_CONCEPTS 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES
// ============================================================================

#if defined(CONFIGS_COMPILER_GCC) || defined(CONFIGS_COMPILER_CLANG)
    #define CONFIGS_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define CONFIGS_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define CONFIGS_LIKELY(x)   (x)
    #define CONFIGS_UNLIKELY(x) (x)
#endif

#if defined(CONFIGS_COMPILER_GCC) || defined(CONFIGS_COMPILER_CLANG)
    #define CONFIGS_UNREACHABLE() __builtin_unreachable()
#elif defined(CONFIGS_COMPILER_MSVC)
    #define CONFIGS_UNREACHABLE() __assume(0)
#else
    #define CONFIGS_UNREACHABLE() ((void)0)
#endif

// Symbol visibility
#if defined(CONFIGS_OS_WINDOWS)
    #if defined(CONFIGS_BUILDING_SHARED)
        #define CONFIGS_API __declspec(dllexport)
    #elif defined(CONFIGS_USING_SHARED)
        #define CONFIGS_API __declspec(dllimport)
    #else
        #define CONFIGS_API
    #endif
#elif defined(CONFIGS_COMPILER_GCC) || defined(CONFIGS_COMPILER_CLANG)
    #if defined(CONFIGS_BUILDING_SHARED)
        #define CONFIGS_API __attribute__((visibility("default")))
    #else
        #define CONFIGS_API
    #endif
#else
    #define CONFIGS_API
#endif

namespace configs::common::platform {

/**
 * @brief Identifier of the calling thread (for log records)
 */
CONFIGS_API uint64_t get_thread_id() noexcept;

/**
 * @brief Read an environment variable, empty if unset
 */
CONFIGS_API std::string get_env(std::string_view name);

/**
 * @brief Whether stdout is attached to a terminal
 */
CONFIGS_API bool stdout_is_terminal() noexcept;

}  // namespace configs::common::platform
