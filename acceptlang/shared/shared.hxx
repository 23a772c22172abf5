/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for acceptlang.
 */

#ifndef ACCEPTLANG_SHARED_HXX
#define ACCEPTLANG_SHARED_HXX

#include <algorithm>
#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/unordered_map.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#ifdef __MSVC_COMPILER__
/** @brief Forces function inlining. */
#define ACCEPTLANG_INLINE __forceinline

/** @brief Prevents function inlining. */
#define ACCEPTLANG_NOINLINE __declspec(noinline)
#elif __CLANG_COMPILER__ || __GCC_COMPILER__ || __INTEL_COMPILER__
/** @brief Forces function inlining. */
#define ACCEPTLANG_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define ACCEPTLANG_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define ACCEPTLANG_INLINE inline

/** @brief Prevents function inlining. */
#define ACCEPTLANG_NOINLINE
#endif // ...

#ifdef ACCEPTLANG_USE_NLOHMANN_JSON
#include <nlohmann/json.hpp>
#endif // ACCEPTLANG_USE_NLOHMANN_JSON

#ifdef ACCEPTLANG_USE_GLAZE_JSON
#include <glaze/glaze.hpp>
#endif // ACCEPTLANG_USE_GLAZE_JSON

#ifdef ACCEPTLANG_USE_LOGGING_IMPL
#include "logging/logging.hxx"
#endif // ACCEPTLANG_USE_LOGGING_IMPL

#include "json_traits/json_traits.hxx"

/**
 * @namespace shared
 * @brief Contains shared types, utilities, and configuration used across acceptlang.
 *
 * Holds the components that do not depend on language negotiation itself,
 * such as logging, JSON traits, and platform-specific macros.
 */
namespace shared {
    // ...
}

#endif // ACCEPTLANG_SHARED_HXX
