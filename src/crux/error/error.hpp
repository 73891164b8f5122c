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

#include "crux/error/error_fwd.hpp"
#include "crux/log/log.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace crux::error
{

// Types.

/**
 * Exception carrying an #Error_code, thrown by crux APIs invoked with a null `err_code`.  It is a
 * `boost::system::system_error`; the only difference is what() when the code is success: then what() is the bare
 * context string rather than a context followed by "Success".
 *
 * When thrown by #CRUX_ERROR_EXEC_AND_THROW_ON_ERROR() the context names the failing API's file, function and line.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code_or_success
   *        The error; or `Error_code()` if there is no applicable code.
   * @param context
   *        Where or how the error arose.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Same as `Runtime_error(Error_code(), context)`.
   *
   * @param context
   *        Where or how the error arose.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * The context alone if the code is success; otherwise `system_error::what()` (context, code and its message).
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// `context` from the ctor.
  const std::string m_context;
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  return exec_void_and_throw_on_error([&](Error_code* our_err_code) { *ret = func(our_err_code); },
                                      err_code, context);
}

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code our_err_code;
  func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  return true;
}

} // namespace crux::error

// Macros.

/**
 * Logs a WARNING about `ARG_val` and stores it in `*err_code`.  `Error_code* err_code`, not null, must be in scope.
 *
 * @param ARG_val
 *        Anything convertible to #Error_code, usually an `enum` value such as reactor::error::Code.
 */
#define CRUX_ERROR_EMIT_ERROR(ARG_val) \
  CRUX_UTIL_SEMICOLON_SAFE \
  ( \
    ::crux::Error_code CRUX_ERROR_EMIT_ERR_val(ARG_val); \
    CRUX_LOG_WARNING("Error code emitted: [" << CRUX_ERROR_EMIT_ERR_val << "] " \
                     "[" << CRUX_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = CRUX_ERROR_EMIT_ERR_val; \
  )

/**
 * CRUX_ERROR_EMIT_ERROR() logging at TRACE; for errors routine enough that a WARNING would be noise.
 *
 * @param ARG_val
 *        See CRUX_ERROR_EMIT_ERROR().
 */
#define CRUX_ERROR_EMIT_ERROR_LOG_TRACE(ARG_val) \
  CRUX_UTIL_SEMICOLON_SAFE \
  ( \
    ::crux::Error_code CRUX_ERROR_EMIT_ERR_LOG_val(ARG_val); \
    CRUX_LOG_TRACE("Error code emitted: [" << CRUX_ERROR_EMIT_ERR_LOG_val << "] " \
                   "[" << CRUX_ERROR_EMIT_ERR_LOG_val.message() << "]."); \
    *err_code = CRUX_ERROR_EMIT_ERR_LOG_val; \
  )

/// Logs a WARNING about the #Error_code `sys_err_code`, which must be in scope (typically from `errno`).
#define CRUX_ERROR_SYS_ERROR_LOG_WARNING() \
  CRUX_LOG_WARNING("System error occurred: [" << sys_err_code << "] [" << sys_err_code.message() << "].")

/**
 * First statement of a value-returning API taking a trailing `Error_code* err_code`: if `err_code` is null it
 * re-invokes the API with a local code and returns the result, or throws Runtime_error on failure.  Past this
 * line `err_code` is not null.
 *
 *   ~~~
 *   Timeout Event_loop::timeout(Token token, const Fine_duration& from_now, Error_code* err_code)
 *   {
 *     CRUX_ERROR_EXEC_AND_THROW_ON_ERROR(Timeout, timeout, token, from_now, _1);
 *     ...
 *   ~~~
 *
 * @param ARG_ret_type
 *        The API's return type; default-constructible.
 * @param ARG_function_name
 *        The API's name as it would be called from inside itself.
 * @param ...
 *        The API's arguments, with `_1` standing for the `Error_code*`.
 */
#define CRUX_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  CRUX_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type result; \
    if (::crux::error::exec_and_throw_on_error \
          ([&](::crux::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &result, err_code, CRUX_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return result; \
    } \
  )

/**
 * #CRUX_ERROR_EXEC_AND_THROW_ON_ERROR() for `void` APIs.
 *
 * @param ARG_function_name
 *        See #CRUX_ERROR_EXEC_AND_THROW_ON_ERROR().
 * @param ...
 *        See #CRUX_ERROR_EXEC_AND_THROW_ON_ERROR().
 */
#define CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(ARG_function_name, ...) \
  CRUX_UTIL_SEMICOLON_SAFE \
  ( \
    if (::crux::error::exec_void_and_throw_on_error \
          ([&](::crux::Error_code* _1) { ARG_function_name(__VA_ARGS__); }, \
           err_code, CRUX_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return; \
    } \
  )
