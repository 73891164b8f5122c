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

#include "crux/common.hpp"
#include <boost/asio.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/thread.hpp>
#include <cassert>
#include <iostream>
#include <string_view>

/**
 * Odds and ends used across crux: names for the boost.asio and boost.thread types everything else builds on,
 * a few `ostream`-to-string helpers, and the source-location macros behind log lines and exception messages.
 */
namespace crux::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Null_interface;
class String_ostream;

/// Thread.  boost.thread, for its naming and interruption support.
using Thread = boost::thread;

/**
 * @namespace crux::util::this_thread
 * @brief `boost::this_thread`, to go with util::Thread.
 */
namespace this_thread = boost::this_thread;

/// ID of a util::Thread.
using Thread_id = Thread::id;

/// The boost.asio executor; each reactor::Event_loop runs exactly one, in one thread.
using Task_engine = boost::asio::io_context;

/// boost.asio timer on the monotonic Fine_clock.
using Timer = boost::asio::basic_waitable_timer<Fine_clock>;

/// Plain exclusive mutex; locking it twice in one thread deadlocks.
using Mutex_non_recursive = boost::mutex;

/**
 * RAII lock of a mutex, with the `unique_lock` extras (deferred locking, early unlock, etc.).
 *
 * @tparam Mutex
 *         Usually Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

/// Non-owning view of characters.
using String_view = std::string_view;

// Free functions.

/**
 * Whether `key` is in the associative `container`.
 *
 * @tparam Container
 *         Has `find()`, `end()` and `key_type`.
 * @param container
 *        Container.
 * @param key
 *        Key.
 * @return See above.
 */
template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key);

/**
 * Appends to `*target_str` what `os << arg1 << arg2 << ...` would print.
 *
 * Overloaded or templated `<<` operands occasionally need explicit qualification to resolve here.
 *
 * @tparam ...T
 *         Types printable with `<<`.
 * @param target_str
 *        Appended to.
 * @param ostream_args
 *        Values to print.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * ostream_op_to_string() into a fresh string, handy in ctor init lists.
 *
 * @tparam ...T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return The string.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * `<<`s each argument into `*os`, left to right.
 *
 * @tparam T1
 *         Printable.
 * @tparam ...T_rest
 *         Printable.
 * @param os
 *        Target.
 * @param ostream_arg1
 *        First value.
 * @param remaining_ostream_args
 *        The rest.
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args);

/**
 * Single-argument feed_args_to_ostream().
 *
 * @tparam T
 *         Printable.
 * @param os
 *        Target.
 * @param only_ostream_arg
 *        Value.
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg);

/**
 * Reads an `enum class` value from `*is_ptr`: consumes the longest run of letters, digits and underscores, then
 * matches it case-insensitively against each value's `<<` output.  With `accept_num_encoding`, a token starting
 * with a digit is taken as the underlying integer instead.  No match (or an out-of-range number) yields
 * `enum_default`.
 *
 * @tparam Enum
 *         Contiguous over `[enum_lowest, enum_sentinel)`; no value prints starting with a digit.
 * @param is_ptr
 *        Source; left positioned at the first character not consumed.
 * @param enum_default
 *        Result on no match.
 * @param enum_sentinel
 *        One past the last candidate.
 * @param accept_num_encoding
 *        Whether numeric tokens are accepted.
 * @param enum_lowest
 *        First candidate.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, Enum enum_lowest = Enum(0));

/**
 * The part of `full_path` after its last `/`; all of it if there is none.  `constexpr`, so log call sites reduce
 * `__FILE__` at compile time.
 *
 * @param full_path
 *        Path.
 * @return View into `full_path`.
 */
constexpr String_view get_last_path_segment(String_view full_path);

/**
 * `file:function(line)` as a string; backs #CRUX_UTIL_WHERE_AM_I_STR().
 *
 * @param file
 *        File.
 * @param function
 *        Function.
 * @param line
 *        Line.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

} // namespace crux::util

// Macros.

/// `file:function(line)` of the invocation, as an `std::string`, with `file` reduced to its last path segment.
#define CRUX_UTIL_WHERE_AM_I_STR() \
  ::crux::util::get_where_am_i_str(::crux::util::get_last_path_segment \
                                     (::crux::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                   ::crux::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                   __LINE__)

/**
 * A compile-time string literal `file:function(line)`, with the full `__FILE__`.  `__FUNCTION__` is not a literal,
 * so the caller names the function.
 *
 * @param ARG_function
 *        Function name token.
 */
#define CRUX_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" BOOST_PP_STRINGIZE(__LINE__) ")"

/**
 * `ostream` fragment printing `file:function(line)` from the given pieces.
 *
 * @param ARG_file
 *        File, as `String_view`.
 * @param ARG_function
 *        Function, as `String_view`.
 * @param ARG_line
 *        Line.
 */
#define CRUX_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

/**
 * Wraps a multi-statement body so a function-like macro can be followed by `;` anywhere a statement can.
 *
 * @param ARG_func_macro_definition
 *        Body.
 */
#define CRUX_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)
