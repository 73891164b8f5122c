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
#include "crux/core/closure.hpp"

namespace crux::core
{

// Implementations.

Closure::Closure() = default;

Closure::Closure(Closure&& src) = default;

Closure::~Closure() = default;

Closure& Closure::operator=(Closure&& src) = default;

Closure::Payload_base::~Payload_base() = default;

void Closure::operator()(Core* core, reactor::Event_loop* event_loop)
{
  if (!m_payload)
  {
    return;
  }
  // else

  /* Take the payload out first: from here on empty() is true, so if the callable invokes us again (or moves us
   * somewhere and that gets invoked), nothing happens.  `payload` is destroyed once the call returns. */
  const auto payload = std::move(m_payload);
  payload->run(core, event_loop);
}

bool Closure::empty() const
{
  return !m_payload;
}

} // namespace crux::core
