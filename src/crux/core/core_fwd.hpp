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

#include "crux/core/id.hpp"
#include "crux/common.hpp"
#include <boost/shared_ptr.hpp>

/**
 * Crux module containing the dispatch core: the part of a reactor-style event loop that routes I/O readiness,
 * timer expiry and cross-thread work to the right unit of application logic.
 *
 * ### Identity ###
 * Two levels of ids are used.  A core::Token names one I/O resource (a descriptor, a timer) as the reactor knows
 * it.  A core::Context names one logical unit of work: a core::State.  A connection, say, is one Context and
 * one State, but over its life may own several Tokens (its socket; an idle timer; a reconnect timer).  The
 * Tokens may come and go while the Context stays the same.  core::Registry keeps `Token -> Context` and
 * `Context -> State` maps; core::Id_generator makes new values of both.
 *
 * ### Dispatch ###
 * core::Core owns one of each of the above and routes events: the reactor calls Core::on_ready(),
 * Core::on_timeout(), Core::on_message(); these resolve the token to a state (a miss is a no-op) and call the
 * state's handler, handing it the Core and the reactor so that it can register, deregister, bind, unbind and
 * terminate, including itself.
 *
 * ### Threads ###
 * Everything here is meant to be used from one thread, the one running the reactor::Event_loop.  The only thing
 * that crosses threads is core::Closure, a call-once unit of work sent to the loop via reactor::Channel.
 */
namespace crux::core
{

// Types.

// Find doc headers near the bodies of these compound types.

class Closure;
class Core;
class Id_generator;
class Registry;
class State;

/// Tag for core::Token.
struct Token_tag
{
  /// Printed before the raw value.
  static constexpr const char* S_NAME = "tok";
};

/// Tag for core::Context.
struct Context_tag
{
  /// Printed before the raw value.
  static constexpr const char* S_NAME = "ctx";
};

/**
 * Identifies one I/O resource registered with the reactor: a descriptor or a pending timer.  Issued by whoever
 * registers the resource; Core::next_token() mints them for resources the application creates itself.
 */
using Token = Basic_id<Token_tag>;

/**
 * Identifies one logical unit of work, i.e., one State.  Stable for the life of that unit, even as the Tokens
 * bound to it change.  Minted by Core::next_context().
 */
using Context = Basic_id<Context_tag>;

/**
 * Short-hand for ref-counted pointer to a State.  Shared between the Registry and anyone else (e.g., a
 * supervisor, or a dispatch in progress) holding on to the state; the state lives as long as the longest holder.
 * Null means "no state."
 */
using State_ptr = boost::shared_ptr<State>;

} // namespace crux::core
