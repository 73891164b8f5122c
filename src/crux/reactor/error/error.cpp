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
#include "crux/reactor/error/error.hpp"
#include <cassert>

namespace crux::reactor::error
{

// Types.

/**
 * The boost.system category for errors returned by the crux::reactor module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `crux::Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * This class's declaration is not available outside this translation unit; its logic is reached only through
 * boost.system machinery (`Error_code::category().name()`, `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging crux::Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, an error::Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "crux_reactor";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_EVENT_LOOP_SHUT_DOWN:
    return "Event loop has been destroyed; message not queued.";
  case Code::S_EVENT_LOOP_ALREADY_RUNNING:
    return "Event loop is already running.";
  case Code::S_NOTIFY_CHANNEL_FULL:
    return "Notification channel is at capacity; message not queued.";
  case Code::S_TIMER_CAPACITY_EXCEEDED:
    return "Maximum number of pending timeouts reached; timeout not scheduled.";
  case Code::S_TOKEN_ALREADY_REGISTERED:
    return "A descriptor is already registered under this token.";
  case Code::S_TOKEN_NOT_REGISTERED:
    return "No descriptor is registered under this token.";
  case Code::S_EMPTY_INTEREST:
    return "Descriptor registration must specify readable and/or writable interest.";
  case Code::S_OPTION_CHECK_FAILED:
    return "When setting options, at least one option's value violates a required condition on that option.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace crux::reactor::error
