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

#include "crux/core/core_fwd.hpp"
#include "crux/reactor/event_set.hpp"
#include "crux/util/util.hpp"

namespace crux::core
{

// Types.

/**
 * Interface for one unit of application logic driven by the core: a connection's protocol state machine, a
 * listener, a periodic job.  A State is bound to a core::Context in the core::Registry; the core calls it when
 * a token bound to that context becomes ready or times out, and when someone asks for it to be terminated.
 *
 * Every handler receives the Core and the reactor::Event_loop, both mutable, so it can do anything the owner of
 * the loop could: register or deregister descriptors, schedule timeouts, mint ids, bind and unbind tokens and
 * states (its own included), and terminate other states.  The core holds a reference to the State for the
 * duration of each call, so unbinding itself from within a handler is fine.
 *
 * All handlers are invoked from the loop thread only, one at a time, so an implementation needs no locking
 * for its own data.
 */
class State :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Called when the descriptor registered under `token` is ready for (some of) the events of interest.
   * Delivery is level-triggered: if the condition persists after this returns, it is delivered again.
   *
   * @param core
   *        The dispatching core.
   * @param event_loop
   *        The reactor that detected the event.
   * @param token
   *        The descriptor's token.
   * @param events
   *        The events detected; non-empty.
   */
  virtual void on_ready(Core* core, reactor::Event_loop* event_loop, Token token, reactor::Event_set events) = 0;

  /**
   * Called when a timeout scheduled under `token` fires.
   *
   * @param core
   *        The dispatching core.
   * @param event_loop
   *        The reactor.
   * @param token
   *        The token given to reactor::Event_loop::timeout().
   */
  virtual void on_timeout(Core* core, reactor::Event_loop* event_loop, Token token) = 0;

  /**
   * Called by Core::terminate_state().  The state should release its resources: deregister descriptors,
   * clear timeouts, unbind its tokens and, usually, itself.  The core removes nothing on the state's behalf.
   *
   * @param core
   *        The dispatching core.
   * @param event_loop
   *        The reactor.
   */
  virtual void on_terminate(Core* core, reactor::Event_loop* event_loop) = 0;
}; // class State

} // namespace crux::core
