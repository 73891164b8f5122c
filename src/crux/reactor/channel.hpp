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

#include "crux/core/closure.hpp"
#include "crux/reactor/reactor_fwd.hpp"
#include <boost/shared_ptr.hpp>

namespace crux::reactor
{

// Types.

// Find doc header near the body of this compound type.
class Notify_queue;

/**
 * The way for threads other than the loop thread to get work done on the loop thread: send() a core::Closure,
 * and the Event_loop will invoke it (via core::Core::on_message()) soon, in its own thread.  Obtain one
 * from Event_loop::channel().
 *
 * Closures sent through a given Event_loop's channels run in the order they were sent (as observed by the
 * channel's internal mutex); in particular those sent by one thread run in that thread's send order.
 *
 * Channel is a small value type: copy it freely, and to any thread.  It shares ownership of the Event_loop's
 * queue, so it remains safe to use after the Event_loop is destroyed; send() then fails with
 * error::Code::S_EVENT_LOOP_SHUT_DOWN.
 *
 * ### Thread safety ###
 * send() may be called from any thread, concurrently, on the same or different Channel objects.
 */
class Channel
{
public:
  // Methods.

  /**
   * Queues the closure to run on the loop thread.
   *
   * @param closure
   *        The work.  Moved-from if and only if successful.  A lambda converts to core::Closure implicitly.
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_EVENT_LOOP_SHUT_DOWN (the Event_loop is gone),
   *        error::Code::S_NOTIFY_CHANNEL_FULL (see Event_loop_options::m_st_notify_capacity).
   */
  void send(core::Closure&& closure, Error_code* err_code = 0);

private:
  // Friends.

  // Friend of Channel: For access to our constructor.
  friend class Event_loop;

  // Constructors/destructor.

  /**
   * Constructs the channel.
   *
   * @param queue
   *        The queue.  Not null.
   */
  explicit Channel(const boost::shared_ptr<Notify_queue>& queue);

  // Data.

  /// The queue of the Event_loop that made us.
  boost::shared_ptr<Notify_queue> m_queue;
}; // class Channel

} // namespace crux::reactor
