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
#include "crux/reactor/event_set.hpp"
#include <ostream>

namespace crux::reactor
{

// Static initializations.

const Event_set Event_set::S_NONE(0);
const Event_set Event_set::S_READABLE(1 << 0);
const Event_set Event_set::S_WRITABLE(1 << 1);
const Event_set Event_set::S_ERROR(1 << 2);

// Implementations.

Event_set::Event_set() :
  m_bits(0)
{
  // Nothing else.
}

Event_set::Event_set(bits_t bits) :
  m_bits(bits)
{
  // Nothing else.
}

bool Event_set::contains(Event_set other) const
{
  return (m_bits & other.m_bits) == other.m_bits;
}

bool Event_set::empty() const
{
  return m_bits == 0;
}

Event_set::bits_t Event_set::bits() const
{
  return m_bits;
}

Event_set& Event_set::operator|=(Event_set other)
{
  m_bits |= other.m_bits;
  return *this;
}

Event_set operator|(Event_set events1, Event_set events2)
{
  return Event_set(events1.m_bits | events2.m_bits);
}

Event_set operator&(Event_set events1, Event_set events2)
{
  return Event_set(events1.m_bits & events2.m_bits);
}

bool operator==(Event_set events1, Event_set events2)
{
  return events1.bits() == events2.bits();
}

bool operator!=(Event_set events1, Event_set events2)
{
  return !(events1 == events2);
}

std::ostream& operator<<(std::ostream& os, const Event_set& events)
{
  if (events.empty())
  {
    return os << '-';
  }
  // else

  bool first = true;
  const auto print_one = [&](Event_set event, char name)
  {
    if (events.contains(event))
    {
      if (!first)
      {
        os << '|';
      }
      os << name;
      first = false;
    }
  };
  print_one(Event_set::S_READABLE, 'R');
  print_one(Event_set::S_WRITABLE, 'W');
  print_one(Event_set::S_ERROR, 'E');
  return os;
}

} // namespace crux::reactor
