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
#include "crux/reactor/event_loop.hpp"
#include "crux/reactor/detail/notify_queue.hpp"
#include "crux/reactor/error/error.hpp"
#include "crux/core/core.hpp"
#include "crux/error/error.hpp"
#include "crux/util/util.hpp"
#include <boost/make_shared.hpp>
#include <poll.h>
#include <csignal>
#include <cerrno>

namespace crux::reactor
{

// Types.

struct Event_loop::Registration :
  private boost::noncopyable
{
  // Constructors/destructor.

  /**
   * Constructs registration with a not-yet-assigned descriptor.
   *
   * @param task_engine
   *        The engine.
   * @param token
   *        See #m_token.
   * @param interest
   *        See #m_interest.
   */
  explicit Registration(util::Task_engine* task_engine, core::Token token, Event_set interest);

  /// Releases (does not close) the descriptor.
  ~Registration();

  // Data.

  /// The descriptor.  Never closed by us: always release()d.
  boost::asio::posix::stream_descriptor m_descriptor;

  /// Token.
  const core::Token m_token;

  /// Readable and/or writable.
  const Event_set m_interest;
}; // struct Event_loop::Registration

// Implementations.

Event_loop::Registration::Registration(util::Task_engine* task_engine, core::Token token, Event_set interest) :
  m_descriptor(*task_engine),
  m_token(token),
  m_interest(interest)
{
  // Nothing else.
}

Event_loop::Registration::~Registration()
{
  // No-op if never assigned or already released.  Pending waits complete with operation_aborted.
  m_descriptor.release();
}

Event_loop::Event_loop(log::Logger* logger_ptr, Error_code* err_code, const Event_loop_options& opts) :
  log::Log_context(logger_ptr, Crux_log_component::S_REACTOR),
  m_opts(opts),
  m_signal_set(m_task_engine),
  m_notify_queue(boost::make_shared<Notify_queue>(get_logger(), &m_task_engine,
                                                  m_opts.m_st_notify_capacity, m_opts.m_st_messages_per_tick,
                                                  [this](core::Closure&& closure)
                                                    { on_message(std::move(closure)); })),
  m_next_timeout_raw(1),
  m_core(0),
  m_run_claimed(false),
  m_running(false),
  m_usable(false)
{
  CRUX_LOG_INFO("Event_loop [" << this << "] created with options:\n" << m_opts);

  m_usable = init(err_code); // May throw.
}

bool Event_loop::init(Error_code* err_code)
{
  CRUX_ERROR_EXEC_AND_THROW_ON_ERROR(bool, init, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((m_opts.m_st_notify_capacity == 0) || (m_opts.m_st_messages_per_tick == 0) || (m_opts.m_st_timer_capacity == 0))
  {
    CRUX_LOG_WARNING("Option check failed: notify-capacity [" << m_opts.m_st_notify_capacity << "], "
                     "messages-per-tick [" << m_opts.m_st_messages_per_tick << "], "
                     "timer-capacity [" << m_opts.m_st_timer_capacity << "] must all be positive.");
    CRUX_ERROR_EMIT_ERROR(error::Code::S_OPTION_CHECK_FAILED);
    return false;
  }
  // else

  if (m_opts.m_st_capture_interrupt_signals_internally)
  {
    CRUX_LOG_INFO("Setting up internal SIGINT/SIGTERM handling; they will shut down the loop while it runs.");

    Error_code sys_err_code;
    m_signal_set.add(SIGINT, sys_err_code);
    if (!sys_err_code)
    {
      m_signal_set.add(SIGTERM, sys_err_code);
    }
    if (sys_err_code)
    {
      CRUX_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return false;
    }
  }

  err_code->clear();
  return true;
} // Event_loop::init()

Event_loop::~Event_loop()
{
  CRUX_LOG_INFO("Event_loop [" << this << "] shutting down: releasing [" << m_registrations.size() << "] "
                "descriptors, cancelling [" << m_timers.size() << "] timeouts.");

  assert(!m_run_claimed);

  // Channels may outlive us; from now on they fail, and nothing is posted to m_task_engine.
  m_notify_queue->close();

  m_timers.clear(); // Cancels each timer.
  m_registrations.clear(); // Releases each descriptor.

  Error_code sys_err_code;
  m_signal_set.cancel(sys_err_code); // Ignore error; we are going away.
  // m_task_engine dtor destroys, without invoking, every handler still queued.
}

Event_set Event_loop::validated_interest(Event_set interest, Error_code* err_code)
{
  const auto masked = interest & (Event_set::S_READABLE | Event_set::S_WRITABLE);
  if (masked.empty())
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_EMPTY_INTEREST);
  }
  return masked;
}

Event_loop::Registration_ptr Event_loop::make_registration(int native_descriptor, core::Token token,
                                                           Event_set interest, Error_code* err_code)
{
  auto reg = boost::make_shared<Registration>(&m_task_engine, token, interest);

  Error_code sys_err_code;
  reg->m_descriptor.assign(native_descriptor, sys_err_code);
  if (sys_err_code)
  {
    CRUX_LOG_WARNING("Could not watch descriptor [" << native_descriptor << "] for [" << token << "].");
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return Registration_ptr();
  }
  // else
  return reg;
}

void Event_loop::register_descriptor(int native_descriptor, core::Token token, Event_set interest,
                                     Error_code* err_code)
{
  CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(register_descriptor, native_descriptor, token, interest, _1);

  const auto masked_interest = validated_interest(interest, err_code);
  if (masked_interest.empty())
  {
    return;
  }
  // else
  if (util::key_exists(m_registrations, token))
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_TOKEN_ALREADY_REGISTERED);
    return;
  }
  // else

  const auto reg = make_registration(native_descriptor, token, masked_interest, err_code);
  if (!reg)
  {
    return;
  }
  // else

  m_registrations.emplace(token, reg);
  CRUX_LOG_TRACE("Registered descriptor [" << native_descriptor << "] as [" << token << "] "
                 "with interest [" << masked_interest << "].");
  arm_all(reg);
  err_code->clear();
} // Event_loop::register_descriptor()

void Event_loop::reregister_descriptor(core::Token token, Event_set interest, Error_code* err_code)
{
  CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(reregister_descriptor, token, interest, _1);

  const auto it = m_registrations.find(token);
  if (it == m_registrations.end())
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_TOKEN_NOT_REGISTERED);
    return;
  }
  // else

  const auto masked_interest = validated_interest(interest, err_code);
  if (masked_interest.empty())
  {
    return;
  }
  // else

  /* Replace the Registration.  Release the old descriptor object first: the OS polling set must not have the
   * descriptor when the new one is assigned.  Any wait on the old one completes with operation_aborted, or finds
   * its Registration no longer current; either way it is dropped. */
  const int native_descriptor = it->second->m_descriptor.release();
  m_registrations.erase(it);

  const auto reg = make_registration(native_descriptor, token, masked_interest, err_code);
  if (!reg)
  {
    // Descriptor is no longer watched at all.  The caller may register it again.
    return;
  }
  // else

  m_registrations.emplace(token, reg);
  CRUX_LOG_TRACE("Reregistered [" << token << "] with interest [" << masked_interest << "].");
  arm_all(reg);
  err_code->clear();
} // Event_loop::reregister_descriptor()

void Event_loop::deregister_descriptor(core::Token token, Error_code* err_code)
{
  CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(deregister_descriptor, token, _1);

  const auto it = m_registrations.find(token);
  if (it == m_registrations.end())
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_TOKEN_NOT_REGISTERED);
    return;
  }
  // else

  /* A handler may be executing for this very Registration (e.g., a state deregistering itself from on_ready()),
   * holding a ref to it; so release explicitly rather than rely on the destructor. */
  it->second->m_descriptor.release();
  m_registrations.erase(it);

  CRUX_LOG_TRACE("Deregistered [" << token << "].");
  err_code->clear();
}

bool Event_loop::registration_current(const Registration_ptr& reg) const
{
  const auto it = m_registrations.find(reg->m_token);
  return (it != m_registrations.end()) && (it->second == reg);
}

void Event_loop::arm_all(const Registration_ptr& reg)
{
  if (reg->m_interest.contains(Event_set::S_READABLE))
  {
    arm(reg, Event_set::S_READABLE);
  }
  if (reg->m_interest.contains(Event_set::S_WRITABLE))
  {
    arm(reg, Event_set::S_WRITABLE);
  }
}

void Event_loop::arm(const Registration_ptr& reg, Event_set direction)
{
  using boost::asio::posix::stream_descriptor;

  const bool read_dir = (direction == Event_set::S_READABLE);
  const Registration_weak_ptr reg_weak(reg);

  /* boost.asio's descriptor wait is edge-triggered underneath (epoll with EPOLLET): a wait started while the
   * descriptor is already ready does not complete until the next edge.  So check the level first; if ready now,
   * complete via post() instead.  No edge can be lost in between: edges are only collected by this same thread. */
  pollfd poll_fd{reg->m_descriptor.native_handle(), short(read_dir ? POLLIN : POLLOUT), 0};
  const int n_ready = ::poll(&poll_fd, 1, 0);
  const int poll_errno = errno;

  if ((n_ready > 0) || ((n_ready < 0) && (poll_errno != EINTR)))
  {
    Error_code sys_err_code;
    if (n_ready < 0)
    {
      sys_err_code = Error_code(poll_errno, boost::system::system_category());
    }
    else if ((poll_fd.revents & POLLNVAL) != 0)
    {
      sys_err_code = boost::asio::error::bad_descriptor;
    }
    // else: POLLIN/POLLOUT, or POLLHUP/POLLERR, which a read or write will reveal.

    boost::asio::post(m_task_engine, [this, reg_weak, direction, sys_err_code]()
    {
      on_descriptor_wait(reg_weak, direction, sys_err_code);
    });
    return;
  }
  // else: Not ready (or poll() interrupted; just wait then).

  reg->m_descriptor.async_wait(read_dir ? stream_descriptor::wait_read : stream_descriptor::wait_write,
                               [this, reg_weak, direction](const Error_code& sys_err_code)
  {
    on_descriptor_wait(reg_weak, direction, sys_err_code);
  });
} // Event_loop::arm()

void Event_loop::on_descriptor_wait(const Registration_weak_ptr& reg_weak, Event_set direction,
                                    const Error_code& sys_err_code)
{
  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return; // Released: deregistered, reregistered or going away.
  }
  // else

  const auto reg = reg_weak.lock(); // Holding it keeps it alive even if the handler deregisters it.
  if ((!reg) || (!registration_current(reg)))
  {
    CRUX_LOG_TRACE("Dropping stale readiness [" << direction << "].");
    return;
  }
  // else

  assert(m_core);

  if (sys_err_code)
  {
    CRUX_LOG_WARNING("Wait for [" << direction << "] on [" << reg->m_token << "] failed; delivering error; "
                     "no longer watching that direction.");
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    m_core->on_ready(this, reg->m_token, Event_set::S_ERROR);
    return;
  }
  // else

  m_core->on_ready(this, reg->m_token, direction);

  if (registration_current(reg))
  {
    arm(reg, direction); // Level-triggered: it comes right back if still ready.
  }
  // else: The handler deregistered or reregistered it.
} // Event_loop::on_descriptor_wait()

Timeout Event_loop::timeout(core::Token token, const Fine_duration& from_now, Error_code* err_code)
{
  CRUX_ERROR_EXEC_AND_THROW_ON_ERROR(Timeout, timeout, token, from_now, _1);

  if (m_timers.size() >= m_opts.m_st_timer_capacity)
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_TIMER_CAPACITY_EXCEEDED);
    return Timeout();
  }
  // else

  const Timeout timeout_id(m_next_timeout_raw++);
  auto timer = boost::make_shared<util::Timer>(m_task_engine);
  timer->expires_after(from_now);
  timer->async_wait([this, timeout_id, token](const Error_code& sys_err_code)
  {
    on_timer_fired(timeout_id, token, sys_err_code);
  });
  m_timers.emplace(timeout_id, std::move(timer));

  CRUX_LOG_TRACE("Scheduled [" << timeout_id << "] for [" << token << "] in "
                 "[" << boost::chrono::ceil<boost::chrono::microseconds>(from_now) << "].");
  err_code->clear();
  return timeout_id;
}

bool Event_loop::clear_timeout(Timeout timeout)
{
  const auto it = m_timers.find(timeout);
  if (it == m_timers.end())
  {
    return false;
  }
  // else

  /* The timer may already have expired with its handler queued; cancel() cannot stop that, but the handler will not
   * find it in m_timers and will do nothing. */
  it->second->cancel();
  m_timers.erase(it);

  CRUX_LOG_TRACE("Cleared [" << timeout << "].");
  return true;
}

void Event_loop::on_timer_fired(Timeout timeout, core::Token token, const Error_code& sys_err_code)
{
  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return;
  }
  // else

  const auto it = m_timers.find(timeout);
  if (it == m_timers.end())
  {
    CRUX_LOG_TRACE("[" << timeout << "] fired after being cleared; ignoring.");
    return;
  }
  // else

  m_timers.erase(it);
  if (sys_err_code)
  {
    // Not known to happen with timers, but let's not deliver a timeout that did not happen.
    CRUX_LOG_WARNING("[" << timeout << "] for [" << token << "] failed; dropping it.");
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else

  assert(m_core);
  m_core->on_timeout(this, token);
}

Channel Event_loop::channel() const
{
  return Channel(m_notify_queue);
}

void Event_loop::on_message(core::Closure&& closure)
{
  assert(m_core);
  m_core->on_message(this, std::move(closure));
}

void Event_loop::run(core::Core* core, Error_code* err_code)
{
  CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(run, core, _1);

  assert(core);

  if (!m_usable)
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_OPTION_CHECK_FAILED);
    return;
  }
  // else
  if (m_run_claimed.exchange(true))
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_EVENT_LOOP_ALREADY_RUNNING);
    return;
  }
  // else

  log::Logger::this_thread_set_logged_nickname(m_opts.m_st_thread_nickname, get_logger()); // INFO-logs.

  m_core = core;
  if (m_opts.m_st_capture_interrupt_signals_internally)
  {
    m_signal_set.async_wait([this](const Error_code& sys_err_code, int sig_number)
    {
      on_interrupt_signal(sys_err_code, sig_number);
    });
  }

  CRUX_LOG_INFO("Event_loop [" << this << "] running: [" << m_registrations.size() << "] descriptors, "
                "[" << m_timers.size() << "] timeouts, [" << m_notify_queue->size() << "] messages pending.");

  // A previous run() ended in stop(); undo that.  The work guard keeps run() from returning when idle.
  m_task_engine.restart();
  const auto work_guard = boost::asio::make_work_guard(m_task_engine);
  // Published only after restart(), which would undo a shutdown() issued before it.
  m_running = true;

  try
  {
    m_task_engine.run();
  }
  catch (...)
  {
    finish_run();
    throw;
  }
  finish_run();

  err_code->clear();
} // Event_loop::run()

void Event_loop::finish_run()
{
  Error_code sys_err_code;
  m_signal_set.cancel(sys_err_code);
  if (sys_err_code)
  {
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
  }

  m_running = false;
  m_core = 0;
  m_run_claimed = false;

  CRUX_LOG_INFO("Event_loop [" << this << "] stopped.");
}

void Event_loop::shutdown()
{
  CRUX_LOG_INFO("Event_loop [" << this << "] shutdown requested.");
  m_task_engine.stop();
}

void Event_loop::on_interrupt_signal(const Error_code& sys_err_code, int sig_number)
{
  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return;
  }
  // else

  if (sys_err_code)
  {
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else

  CRUX_LOG_INFO("Caught signal [" << sig_number << "]; shutting down.");
  shutdown();
}

bool Event_loop::running() const
{
  return m_running;
}

size_t Event_loop::n_descriptors() const
{
  return m_registrations.size();
}

size_t Event_loop::n_timeouts() const
{
  return m_timers.size();
}

const Event_loop_options& Event_loop::options() const
{
  return m_opts;
}

} // namespace crux::reactor
