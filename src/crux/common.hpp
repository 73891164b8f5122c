/* Crux
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

/* These are used nearly everywhere (time stamps, timeouts, error reporting), so they are pulled in here for
 * everyone.  boost.chrono I/O is included explicitly: chrono.hpp alone does not bring in `ostream<<` for durations,
 * and we log durations all the time. */
#include <boost/chrono/chrono.hpp>
#include <boost/chrono/ceil.hpp>
#include <boost/chrono/io/duration_io.hpp>
#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <functional>
#include <string>
#include <iosfwd>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any crux/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `crux` namespace (hence the prefix for each macro).

#ifdef __linux__
/// Macro that is defined if and only if the compiling environment is Linux.
#  define CRUX_OS_LINUX
#else
#  error "Crux's reactor is built on POSIX descriptors and is only supported on Linux for now."
#endif

/**
 * Catch-all namespace for the Crux project: the dispatch core of a single-threaded, reactor-style event loop,
 * plus the small set of general-purpose facilities (logging, error reporting, utilities) it is built on.
 *
 * The modules, from lowest to highest level:
 *   - crux::util: aliases for boost.asio/boost.thread types used throughout; string/ostream helpers.
 *   - crux::log: the logging system (Logger interface, `CRUX_LOG_*()` macros, console and buffer loggers).
 *   - crux::error: the `Error_code* err_code = 0` reporting convention and its exception, error::Runtime_error.
 *   - crux::core: the dispatch core proper.  Identifier generation (core::Token, core::Context), the
 *     two-level core::Registry, the core::State interface, the call-once core::Closure, and core::Core which
 *     ties them together and routes events.
 *   - crux::reactor: reactor::Event_loop, a boost.asio-based reactor delivering descriptor readiness, timeouts
 *     and cross-thread messages into a core::Core.
 *
 * Each module has a `*_fwd.hpp` header with forward declarations of its types; include that when a declaration
 * suffices and the full header otherwise.
 */
namespace crux
{

// Types.  They're outside of `namespace ::crux::util` for brevity due to their frequent use.

// Time-related short-hands.

/**
 * Clock used for delicate time measurements and all reactor timers.  It is monotonic, high-resolution and
 * not affected by wall-clock adjustments.
 */
using Fine_clock = boost::chrono::high_resolution_clock;

/// A high-res time point as returned by `Fine_clock::now()` and suitable for precise time math in general.
using Fine_time_pt = Fine_clock::time_point;

/// A high-res time duration as computed from two `Fine_time_pt`s.
using Fine_duration = Fine_clock::duration;

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error
 * code and a pointer through which to obtain a statically stored message string); this is how Crux modules
 * report errors to the user; and we humbly recommend all C++ code use the same techniques.
 *
 * The basic convention, borrowed from boost.asio, is: an API that can fail takes a trailing
 * `Error_code* err_code = 0`.  If `err_code` is not null, `*err_code` is set to success or to the error; nothing
 * is thrown.  If it is null, an error is reported by throwing error::Runtime_error wrapping the code.  See
 * crux::error for the helpers that implement this in a couple of lines per API.
 */
using Error_code = boost::system::error_code;

// See just below.
template<typename Signature>
class Function;

/**
 * The polymorphic function wrapper used throughout Crux.  It *is* `std::function`, plus the `empty()` and `clear()`
 * of `boost::function`.  `std::function` rather than `boost::function` because the latter copies by-value lambda
 * captures on construction (several times) and does not accept move-only captures at all.
 *
 * @tparam Result
 *         See `std::function`.
 * @tparam Args
 *         See `std::function`.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  // Types.

  /// Short-hand for the base.  We add no data of our own in this subclass, just a handful of APIs.
  using Function_base = std::function<Result (Args...)>;

  // Ctors/destructor.

  /// Inherit all the constructors from #Function_base.  Add none of our own.
  using Function_base::Function_base;

  // Methods.

  /**
   * Returns `!bool(*this)`; i.e., `true` if and only if `*this` has no target.
   * @return See above.
   */
  bool empty() const noexcept;

  /// Makes `*this` lack any target, so that `empty() == true`.
  void clear() noexcept;
}; // class Function<Result (Args...)>

/**
 * The `enum` of log::Component payloads for all logging done by Crux itself.  An application using Crux would
 * typically define its own such `enum class` for its own logging and register both with its log::Config.
 *
 * The numeric values are stable: they may appear in logs in place of names if the names are not registered.
 */
enum class Crux_log_component : unsigned int
{
  /// Rarely used component corresponding to log call sites outside namespace `crux::X`, for all X in `crux`.
  S_UNCAT = 0,
  /// Logging from namespace crux::log.
  S_LOG,
  /// Logging from namespace crux::error.
  S_ERROR,
  /// Logging from namespace crux::util.
  S_UTIL,
  /// Logging from namespace crux::core.
  S_CORE,
  /// Logging from namespace crux::reactor.
  S_REACTOR,
  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
}; // enum class Crux_log_component

/**
 * The map generated by Crux to map each value of Crux_log_component to its name, sans the `S_` prefix.
 * Feed it to log::Config::init_component_names() to have Crux's own log lines tagged by component name.
 */
extern const boost::unordered_map<Crux_log_component, std::string> S_CRUX_LOG_COMPONENT_NAME_MAP;

// Free functions.

/**
 * Prints the name of the given Crux_log_component, as in S_CRUX_LOG_COMPONENT_NAME_MAP, to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Crux_log_component val);

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

template<typename Result, typename... Args>
void Function<Result (Args...)>::clear() noexcept
{
  *this = {};
}

} // namespace crux
