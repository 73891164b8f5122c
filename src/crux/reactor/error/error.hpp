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

/**
 * Namespace containing the reactor module's extension of boost.system error conventions, so that the
 * reactor::Event_loop API can return codes/messages from within its own set of error codes/messages.
 *
 * ### Synopsis ###
 *
 *   ~~~
 *   crux::Error_code code = crux::reactor::error::Code::S_NOTIFY_CHANNEL_FULL;
 *   std::cout << "Value = [" << code.value() << "]; msg = [" << code.message() << "].\n";
 *   throw crux::error::Runtime_error(code, "Additional context info here!");
 *   ~~~
 *
 * @internal
 *
 * ### Summary of implementation ###
 * The `enum` and make_error_code() are declared here; the `is_error_code_enum<>` specialization below lets a
 * Code be assigned directly to an #Error_code.  The category class, mapping each Code to its message, is private
 * to error.cpp.
 */
namespace crux::reactor::error
{

// Types.

/// All possible errors returned (via crux::Error_code arguments) by crux::reactor functions/methods.
enum class Code
{
  /// The reactor::Event_loop behind the channel has been destroyed; the message was not queued.
  S_EVENT_LOOP_SHUT_DOWN = 1,
  /// Event_loop::run() was called while the loop was already running.
  S_EVENT_LOOP_ALREADY_RUNNING,
  /// The channel already holds the maximum number of pending messages; the message was not queued.
  S_NOTIFY_CHANNEL_FULL,
  /// The maximum number of simultaneously pending timeouts has been reached; the timeout was not scheduled.
  S_TIMER_CAPACITY_EXCEEDED,
  /// A descriptor is already registered under the given token.
  S_TOKEN_ALREADY_REGISTERED,
  /// No descriptor is registered under the given token.
  S_TOKEN_NOT_REGISTERED,
  /// Descriptor (re)registration specified neither readable nor writable interest.
  S_EMPTY_INTEREST,
  /// At least one option's value violates a required condition on that option.
  S_OPTION_CHECK_FAILED
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight crux::Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * crux::Error_code to the (reactor-specific) error code set reactor::error::Code, so that one can
 * implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding crux::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace crux::reactor::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.
 */
template<>
struct is_error_code_enum<::crux::reactor::error::Code>
{
  /// Means `Code` `enum` values can be used for crux::Error_code.
  static const bool value = true;
};

} // namespace boost::system
