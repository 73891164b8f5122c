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
#include "crux/log/log.hpp"
#include "crux/util/util_fwd.hpp"
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace crux::reactor
{

// Types.

/**
 * The bounded, mutex-protected queue behind Channel: other threads push core::Closure objects into it; the loop
 * thread drains it.  Each Event_loop owns one; each Channel shares ownership of it, so a Channel may outlive
 * its Event_loop.
 *
 * Draining is driven through the Event_loop's util::Task_engine: when a push makes the queue non-empty, a drain
 * task is posted (at most one is outstanding at a time).  A drain task pops at most `messages_per_tick`
 * closures, posts another drain task if any remain, and then hands the popped ones, in order, to the
 * message handler.  So a flood of messages cannot starve I/O: other ready handlers get to run between drains.
 *
 * close() is called by the Event_loop destructor.  From then on send() fails with S_EVENT_LOOP_SHUT_DOWN, and no
 * task is ever posted to the (soon to be destroyed) Task_engine again.
 *
 * ### Thread safety ###
 * send() and close() are safe to call concurrently with anything.  The drain task, and therefore the message
 * handler, runs only in the thread running the Task_engine.
 */
class Notify_queue :
  public log::Log_context,
  public boost::enable_shared_from_this<Notify_queue>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the function receiving each message in the loop thread.
  using Message_handler = Function<void (core::Closure&& closure)>;

  // Constructors/destructor.

  /**
   * Constructs the queue, open and empty.
   *
   * @param logger_ptr
   *        Logger to use subsequently.
   * @param task_engine
   *        Where drain tasks are posted.  Must exist until close() returns.
   * @param capacity
   *        Maximum number of pending closures.  Positive.
   * @param messages_per_tick
   *        Maximum number of closures handed to `message_handler` per drain task.  Positive.
   * @param message_handler
   *        Invoked, from a drain task, with each closure in send order.
   */
  explicit Notify_queue(log::Logger* logger_ptr, util::Task_engine* task_engine,
                        size_t capacity, size_t messages_per_tick, Message_handler&& message_handler);

  // Methods.

  /**
   * Enqueues the closure, unless closed or full.
   *
   * @param closure
   *        The work.  Moved-from if and only if successful.
   * @param err_code
   *        Not null.  Set to success or error::Code::S_EVENT_LOOP_SHUT_DOWN or error::Code::S_NOTIFY_CHANNEL_FULL.
   */
  void send(core::Closure&& closure, Error_code* err_code);

  /// Refuses all future send() calls and drops (destroys, without invoking) all pending closures.  Idempotent.
  void close();

  /**
   * Number of closures pending.
   * @return See above.
   */
  size_t size() const;

private:
  // Methods.

  /// Posts drain() onto #m_task_engine.  #m_mutex must be locked.
  void post_drain();

  /// The drain task.  See class doc header.
  void drain();

  // Data.

  /// See constructor.
  util::Task_engine* const m_task_engine;

  /// See constructor.
  const size_t m_capacity;

  /// See constructor.
  const size_t m_messages_per_tick;

  /// See constructor.
  const Message_handler m_message_handler;

  /// Protects the data below it.
  mutable util::Mutex_non_recursive m_mutex;

  /// Pending closures, oldest first.
  std::deque<core::Closure> m_queue;

  /// Whether a drain task is posted and not yet past its pop step.
  bool m_drain_posted;

  /// Whether close() has been called.
  bool m_closed;
}; // class Notify_queue

} // namespace crux::reactor
