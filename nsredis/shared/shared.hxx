/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for nsredis.
 */

#ifndef NSREDIS_SHARED_HXX
#define NSREDIS_SHARED_HXX

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/asio.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/this_coro.hpp>

#include <boost/system/result.hpp>
#include <boost/system/system_error.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <boost/url.hpp>

#include <boost/redis.hpp>

#if defined(_MSC_VER)
/** @brief Forces function inlining. */
#define NSREDIS_INLINE __forceinline

/** @brief Prevents function inlining. */
#define NSREDIS_NOINLINE __declspec(noinline)
#elif defined(__clang__) || defined(__GNUC__) || defined(__INTEL_COMPILER)
/** @brief Forces function inlining. */
#define NSREDIS_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define NSREDIS_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define NSREDIS_INLINE inline

/** @brief Prevents function inlining. */
#define NSREDIS_NOINLINE
#endif // ...

#include "logging/logging.hxx"

/**
 * @namespace nsredis::shared
 * @brief Contains shared types and utilities used across nsredis.
 *
 * This namespace is intended for common components that are reused by multiple modules,
 * such as logging and platform-specific macros.
 */
namespace nsredis::shared {
    // ...
}

#endif // NSREDIS_SHARED_HXX
