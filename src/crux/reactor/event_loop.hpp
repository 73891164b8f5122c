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

#include "crux/reactor/event_loop_options.hpp"
#include "crux/reactor/event_set.hpp"
#include "crux/reactor/channel.hpp"
#include "crux/reactor/reactor_fwd.hpp"
#include "crux/core/core_fwd.hpp"
#include "crux/log/log.hpp"
#include "crux/util/util_fwd.hpp"
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <atomic>

namespace crux::reactor
{

// Types.

/**
 * A single-threaded reactor: watches descriptors, runs timeouts, and accepts work from other threads, delivering
 * all of it to a core::Core in the one thread that calls run().  Built on one boost.asio util::Task_engine.
 *
 * ### Descriptors ###
 * register_descriptor() watches a descriptor, under a caller-chosen core::Token, for readability and/or
 * writability.  When the descriptor is ready, core::Core::on_ready() is called with that token and the event.
 * Delivery is level-triggered: after on_ready() returns, if the descriptor is still ready for that event, it is
 * delivered again (after other pending work has had its turn).  So a handler need not read or write until
 * `EAGAIN`; but it also must not assume the condition still holds when it is called (it usually does), so the
 * descriptor must be non-blocking.  Readable and writable readiness are delivered in separate calls.
 *
 * The descriptor remains owned by the caller: deregister_descriptor() stops watching it but does not close it, and
 * the caller should deregister before closing.  Readiness already detected for a token that is then deregistered
 * (or reregistered) is dropped, even if the handler for it had already been queued.
 *
 * If waiting on a descriptor fails, Event_set::S_ERROR is delivered once for that direction, which is then no
 * longer watched.  The state should deregister the descriptor.
 *
 * ### Timeouts ###
 * timeout() schedules a one-shot core::Core::on_timeout() call with a given token.  clear_timeout() cancels it;
 * once clear_timeout() returns `true`, the call will not happen.
 *
 * ### Messages ###
 * channel() returns a Channel, through which any thread can send a core::Closure to be run here.
 *
 * ### Life cycle ###
 * run() runs the loop in the calling thread until shutdown() (or, optionally, SIGINT/SIGTERM).  run() may then be
 * called again, e.g., with a different Core; registrations, timeouts and pending messages carry over.  The
 * Event_loop must not be destroyed while run() is executing.  Destroying it releases (without closing) all
 * descriptors, cancels all timeouts and drops all pending messages; Channel::send() fails from then on.
 *
 * ### Thread safety ###
 * channel(), Channel::send(), shutdown() and running() may be called from any thread.  Everything else is for the
 * loop thread: from within a handler while run() is executing, or while it is not executing at all.
 */
class Event_loop :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the loop, not running, with nothing registered.
   *
   * @param logger_ptr
   *        The Logger implementation to use subsequently.
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_OPTION_CHECK_FAILED; or a system error code if signal capture could not be set up.
   *        On error `*this` is unusable: run() fails with the same error.
   * @param opts
   *        The options.
   */
  explicit Event_loop(log::Logger* logger_ptr, Error_code* err_code = 0,
                      const Event_loop_options& opts = Event_loop_options());

  /// See class doc header.
  ~Event_loop();

  // Methods.

  /**
   * Starts watching a descriptor.  See class doc header.
   *
   * @param native_descriptor
   *        Open, non-blocking descriptor, owned by the caller.
   * @param token
   *        Token that readiness is reported with.  Must not be registered already.
   * @param interest
   *        Event_set::S_READABLE and/or Event_set::S_WRITABLE; other events are ignored.
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_EMPTY_INTEREST, error::Code::S_TOKEN_ALREADY_REGISTERED; or the system error from
   *        adding the descriptor to the OS polling set (e.g., it is already registered under another token).
   */
  void register_descriptor(int native_descriptor, core::Token token, Event_set interest, Error_code* err_code = 0);

  /**
   * Changes the events watched for a registered descriptor.  Readiness already detected under the old interest is
   * dropped.
   *
   * @param token
   *        Token of the descriptor.
   * @param interest
   *        See register_descriptor().
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_TOKEN_NOT_REGISTERED, error::Code::S_EMPTY_INTEREST; or a system error as in
   *        register_descriptor().
   */
  void reregister_descriptor(core::Token token, Event_set interest, Error_code* err_code = 0);

  /**
   * Stops watching a descriptor.  It is not closed.
   *
   * @param token
   *        Token of the descriptor.
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_TOKEN_NOT_REGISTERED.
   */
  void deregister_descriptor(core::Token token, Error_code* err_code = 0);

  /**
   * Schedules core::Core::on_timeout() with `token`, once, after the given time.
   *
   * @param token
   *        Token to report.  It need not be registered, or unique among pending timeouts.
   * @param from_now
   *        Delay.  Non-positive means "as soon as possible."
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_TIMER_CAPACITY_EXCEEDED.
   * @return Handle for clear_timeout(); meaningless on error.
   */
  Timeout timeout(core::Token token, const Fine_duration& from_now, Error_code* err_code = 0);

  /**
   * Cancels a pending timeout.
   *
   * @param timeout
   *        Handle from timeout().
   * @return `true` if it was pending, and now will not fire; `false` if it already fired or was cleared.
   */
  bool clear_timeout(Timeout timeout);

  /**
   * Returns a Channel through which any thread can send work to this loop.
   * @return See above.
   */
  Channel channel() const;

  /**
   * Runs the loop in the calling thread, dispatching to `*core`, until shutdown() is called.
   *
   * @param core
   *        The core to dispatch to.  Must exist until this returns.
   * @param err_code
   *        See crux::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_EVENT_LOOP_ALREADY_RUNNING, error::Code::S_OPTION_CHECK_FAILED (see constructor).
   *        An exception thrown by a handler propagates out of this method; the loop is then not running.
   */
  void run(core::Core* core, Error_code* err_code = 0);

  /**
   * Makes run() return as soon as the handler executing now, if any, returns.  Work that was pending
   * stays pending for the next run().  No effect if not running.
   */
  void shutdown();

  /**
   * Whether run() is executing.  Once this returns `true`, a shutdown() from any thread stops that run().
   * @return See above.
   */
  bool running() const;

  /**
   * Number of registered descriptors.
   * @return See above.
   */
  size_t n_descriptors() const;

  /**
   * Number of pending timeouts.
   * @return See above.
   */
  size_t n_timeouts() const;

  /**
   * The options in effect.
   * @return See above.
   */
  const Event_loop_options& options() const;

private:
  // Types.

  /// A registered descriptor.  Owned by #m_registrations; replaced on reregistration.
  struct Registration;

  /// Short-hand for ref-counted pointer to Registration.
  using Registration_ptr = boost::shared_ptr<Registration>;

  /// What the wait handlers hold: a Registration gone or replaced means the readiness is stale.
  using Registration_weak_ptr = boost::weak_ptr<Registration>;

  /// Short-hand for ref-counted pointer to a timer.
  using Timer_ptr = boost::shared_ptr<util::Timer>;

  // Methods.

  /**
   * Validates options and sets up signal capture.  Called from constructor.
   *
   * @param err_code
   *        See constructor.
   * @return `true` on success.
   */
  bool init(Error_code* err_code);

  /**
   * Creates a Registration for the descriptor.
   *
   * @param native_descriptor
   *        See register_descriptor().
   * @param token
   *        See register_descriptor().
   * @param interest
   *        Validated interest.
   * @param err_code
   *        Not null.  Set to the system error on failure; untouched on success.
   * @return Null on failure.
   */
  Registration_ptr make_registration(int native_descriptor, core::Token token, Event_set interest,
                                     Error_code* err_code);

  /**
   * Keeps only the readable and writable bits; emits error::Code::S_EMPTY_INTEREST if none is set.
   *
   * @param interest
   *        Interest.
   * @param err_code
   *        Not null.
   * @return The masked interest; empty on error.
   */
  Event_set validated_interest(Event_set interest, Error_code* err_code);

  /**
   * Returns `true` if `reg` is the Registration #m_registrations has for its token.
   *
   * @param reg
   *        Not null.
   * @return See above.
   */
  bool registration_current(const Registration_ptr& reg) const;

  /**
   * Arms the watch for each direction in `reg`'s interest.
   *
   * @param reg
   *        Not null.
   */
  void arm_all(const Registration_ptr& reg);

  /**
   * Arms the watch for one direction: on_descriptor_wait() will be called once the descriptor is ready for it
   * (right away, if it already is).
   *
   * @param reg
   *        Not null.
   * @param direction
   *        Event_set::S_READABLE or Event_set::S_WRITABLE.
   */
  void arm(const Registration_ptr& reg, Event_set direction);

  /**
   * Handler of a completed wait: dispatches, then re-arms.
   *
   * @param reg_weak
   *        The Registration waited on.
   * @param direction
   *        See arm().
   * @param sys_err_code
   *        Result of the wait.
   */
  void on_descriptor_wait(const Registration_weak_ptr& reg_weak, Event_set direction,
                          const Error_code& sys_err_code);

  /**
   * Handler of a timer.
   *
   * @param timeout
   *        Handle.
   * @param token
   *        Token to report.
   * @param sys_err_code
   *        Result of the wait.
   */
  void on_timer_fired(Timeout timeout, core::Token token, const Error_code& sys_err_code);

  /**
   * Handler of each message drained from #m_notify_queue.
   *
   * @param closure
   *        The message.
   */
  void on_message(core::Closure&& closure);

  /**
   * Handler of SIGINT/SIGTERM, if #m_opts asks for it.
   *
   * @param sys_err_code
   *        Result of the wait.
   * @param sig_number
   *        Signal.
   */
  void on_interrupt_signal(const Error_code& sys_err_code, int sig_number);

  /// Resets run()-scoped state as run() exits, normally or by exception.
  void finish_run();

  // Data.

  /// See constructor.
  const Event_loop_options m_opts;

  /// The boost.asio engine everything runs on.
  util::Task_engine m_task_engine;

  /// SIGINT/SIGTERM capture; empty unless Event_loop_options::m_st_capture_interrupt_signals_internally.
  boost::asio::signal_set m_signal_set;

  /// The queue shared with every Channel.
  boost::shared_ptr<Notify_queue> m_notify_queue;

  /// Registered descriptors.
  boost::unordered_map<core::Token, Registration_ptr> m_registrations;

  /// Pending timeouts.  A timer is removed on firing or clearing.
  boost::unordered_map<Timeout, Timer_ptr> m_timers;

  /// Raw value of the next Timeout handed out.  Starts at 1, so `Timeout()` is never a valid handle.
  Timeout::raw_t m_next_timeout_raw;

  /// The Core run() dispatches to; null when not running.
  core::Core* m_core;

  /// Whether a run() call has claimed the loop.  Set before #m_running, cleared after it.
  std::atomic<bool> m_run_claimed;

  /// Whether run() is executing, with #m_task_engine already restarted; so a shutdown() seeing this will stop it.
  std::atomic<bool> m_running;

  /// Whether construction succeeded.
  bool m_usable;
}; // class Event_loop

} // namespace crux::reactor
