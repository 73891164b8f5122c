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

#include "crux/reactor/reactor_fwd.hpp"

namespace crux::reactor
{

// Types.

/**
 * A set of descriptor events: readable, writable, error.  Used both for the interest given when registering a
 * descriptor with Event_loop (only #S_READABLE and #S_WRITABLE are meaningful there) and for the events delivered
 * to core::State::on_ready().
 *
 * A value type, cheap to copy.  Build one by `|`-ing the constants.
 */
class Event_set
{
public:
  // Types.

  /// Raw bit-mask type.
  using bits_t = unsigned int;

  // Constants.

  /// No events.
  static const Event_set S_NONE;
  /// Descriptor is readable (or, for a listening socket, has a connection to accept; or has reached EOF).
  static const Event_set S_READABLE;
  /// Descriptor is writable.
  static const Event_set S_WRITABLE;
  /// Waiting on the descriptor failed.  Delivered at most once per direction; that direction is not watched further.
  static const Event_set S_ERROR;

  // Constructors/destructor.

  /// Constructs the empty set.
  Event_set();

  // Methods.

  /**
   * Returns `true` if and only if every event in `other` is also in `*this`.  `contains(S_NONE)` is `true`.
   *
   * @param other
   *        Events to check.
   * @return See above.
   */
  bool contains(Event_set other) const;

  /**
   * Returns `true` if and only if the set has no events.
   * @return See above.
   */
  bool empty() const;

  /**
   * Raw bit-mask.
   * @return See above.
   */
  bits_t bits() const;

  /**
   * Adds the events in `other`.
   *
   * @param other
   *        Events.
   * @return `*this`.
   */
  Event_set& operator|=(Event_set other);

private:
  // Constructors/destructor.

  /**
   * Constructs from raw bits.
   *
   * @param bits
   *        Bit-mask.
   */
  explicit Event_set(bits_t bits);

  // Friends.

  // Friend of Event_set: For access to constructor from bits.
  friend Event_set operator|(Event_set events1, Event_set events2);
  // Friend of Event_set: For access to constructor from bits.
  friend Event_set operator&(Event_set events1, Event_set events2);

  // Data.

  /// Bit-mask.
  bits_t m_bits;
}; // class Event_set

// Free functions: in *_fwd.hpp, except the following.

/**
 * Union.
 *
 * @relatesalso Event_set
 *
 * @param events1
 *        Events.
 * @param events2
 *        Events.
 * @return See above.
 */
Event_set operator|(Event_set events1, Event_set events2);

/**
 * Intersection.
 *
 * @relatesalso Event_set
 *
 * @param events1
 *        Events.
 * @param events2
 *        Events.
 * @return See above.
 */
Event_set operator&(Event_set events1, Event_set events2);

/**
 * Equality.
 *
 * @relatesalso Event_set
 *
 * @param events1
 *        Events.
 * @param events2
 *        Events.
 * @return See above.
 */
bool operator==(Event_set events1, Event_set events2);

/**
 * Inequality.
 *
 * @relatesalso Event_set
 *
 * @param events1
 *        Events.
 * @param events2
 *        Events.
 * @return See above.
 */
bool operator!=(Event_set events1, Event_set events2);

} // namespace crux::reactor
