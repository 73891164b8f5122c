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
#include "crux/reactor/detail/notify_queue.hpp"
#include "crux/reactor/error/error.hpp"
#include "crux/error/error.hpp"
#include <vector>

namespace crux::reactor
{

// Implementations.

Notify_queue::Notify_queue(log::Logger* logger_ptr, util::Task_engine* task_engine,
                           size_t capacity, size_t messages_per_tick, Message_handler&& message_handler) :
  log::Log_context(logger_ptr, Crux_log_component::S_REACTOR),
  m_task_engine(task_engine),
  m_capacity(capacity),
  m_messages_per_tick(messages_per_tick),
  m_message_handler(std::move(message_handler)),
  m_drain_posted(false),
  m_closed(false)
{
  // Nothing else.
}

void Notify_queue::send(core::Closure&& closure, Error_code* err_code)
{
  assert(err_code);

  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);

  if (m_closed)
  {
    CRUX_ERROR_EMIT_ERROR_LOG_TRACE(error::Code::S_EVENT_LOOP_SHUT_DOWN);
    return;
  }
  // else
  if (m_queue.size() >= m_capacity)
  {
    CRUX_ERROR_EMIT_ERROR(error::Code::S_NOTIFY_CHANNEL_FULL);
    return;
  }
  // else

  m_queue.emplace_back(std::move(closure));
  if (!m_drain_posted)
  {
    post_drain();
  }
  err_code->clear();
}

void Notify_queue::close()
{
  std::deque<core::Closure> dropped;
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    m_closed = true;
    dropped.swap(m_queue);
  }
  // Destroy them outside the lock: a closure's captures may do anything in their destructors.

  if (!dropped.empty())
  {
    CRUX_LOG_INFO("Notification queue closed with [" << dropped.size() << "] messages still pending; "
                  "they will not run.");
  }
}

size_t Notify_queue::size() const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return m_queue.size();
}

void Notify_queue::post_drain()
{
  m_drain_posted = true;
  boost::asio::post(*m_task_engine, [this_ptr = shared_from_this()]()
  {
    this_ptr->drain();
  });
}

void Notify_queue::drain()
{
  std::vector<core::Closure> batch;
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);

    const size_t n_to_pop = std::min(m_queue.size(), m_messages_per_tick);
    batch.reserve(n_to_pop);
    for (size_t idx = 0; idx != n_to_pop; ++idx)
    {
      batch.emplace_back(std::move(m_queue.front()));
      m_queue.pop_front();
    }

    if (m_queue.empty() || m_closed)
    {
      m_drain_posted = false;
    }
    else
    {
      // More to do, but let other handlers run first.  Anything sent meanwhile goes behind `batch`: order holds.
      post_drain();
    }
  } // Unlock: senders may proceed while we run the batch.

  CRUX_LOG_TRACE("Draining [" << batch.size() << "] messages.");
  for (auto& closure : batch)
  {
    m_message_handler(std::move(closure));
  }
}

} // namespace crux::reactor
