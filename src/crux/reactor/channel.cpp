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
#include "crux/reactor/channel.hpp"
#include "crux/reactor/detail/notify_queue.hpp"
#include "crux/error/error.hpp"

namespace crux::reactor
{

// Implementations.

Channel::Channel(const boost::shared_ptr<Notify_queue>& queue) :
  m_queue(queue)
{
  assert(m_queue);
}

void Channel::send(core::Closure&& closure, Error_code* err_code)
{
  CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(send, std::move(closure), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  m_queue->send(std::move(closure), err_code);
}

} // namespace crux::reactor
