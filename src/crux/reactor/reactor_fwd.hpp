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

#include "crux/core/id.hpp"
#include "crux/common.hpp"
#include <ostream>

/**
 * Crux module containing reactor::Event_loop, a concrete single-threaded reactor built on boost.asio, which
 * feeds descriptor readiness, timeouts and cross-thread messages into a core::Core.
 *
 * The core (crux::core) does not depend on this module beyond these forward declarations: a core::State
 * receives an `Event_loop*` and an Event_set, and uses the former to (de)register resources.
 */
namespace crux::reactor
{

// Types.

// Find doc headers near the bodies of these compound types.

class Channel;
class Event_loop;
struct Event_loop_options;
class Event_set;

/// Tag for reactor::Timeout.
struct Timeout_tag
{
  /// Printed before the raw value.
  static constexpr const char* S_NAME = "tmo";
};

/**
 * Handle to one pending timeout, as returned by Event_loop::timeout() and accepted by Event_loop::clear_timeout().
 * Distinct from the core::Token the timeout fires with: one token may have several timeouts pending.
 */
using Timeout = core::Basic_id<Timeout_tag>;

// Free functions.

/**
 * Prints the set of events, e.g. "R|W" or "-" if empty.
 *
 * @relatesalso Event_set
 *
 * @param os
 *        Stream to which to write.
 * @param events
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Event_set& events);

/**
 * Prints the option values to the given `ostream`, in the same format as boost.program_options' help output.
 *
 * @relatesalso Event_loop_options
 *
 * @param os
 *        Stream to which to write.
 * @param opts
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Event_loop_options& opts);

} // namespace crux::reactor
