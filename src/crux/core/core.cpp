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
#include "crux/core/core.hpp"
#include "crux/core/state.hpp"
#include "crux/reactor/event_set.hpp"

namespace crux::core
{

// Implementations.

Core::Core(log::Logger* logger_ptr, Context context_seed, Token token_seed) :
  log::Log_context(logger_ptr, Crux_log_component::S_CORE),
  m_id_generator(context_seed, token_seed)
{
  CRUX_LOG_INFO("Core [" << this << "] created; context seed [" << context_seed << "], "
                "token seed [" << token_seed << "].");
}

Token Core::next_token()
{
  return m_id_generator.next_token();
}

Context Core::next_context()
{
  return m_id_generator.next_context();
}

std::optional<Context> Core::bind_token(Token token, Context context)
{
  const auto prior = m_registry.bind_token(token, context);
  CRUX_LOG_TRACE("Bound [" << token << "] -> [" << context << "].");
  if (prior && (*prior != context))
  {
    CRUX_LOG_TRACE("It replaced the binding [" << token << "] -> [" << *prior << "].");
  }
  return prior;
}

std::optional<Context> Core::unbind_token(Token token)
{
  const auto prior = m_registry.unbind_token(token);
  if (prior)
  {
    CRUX_LOG_TRACE("Unbound [" << token << "] -> [" << *prior << "].");
  }
  return prior;
}

State_ptr Core::bind_state(Context context, const State_ptr& state)
{
  if (!state)
  {
    CRUX_LOG_WARNING("Asked to bind [" << context << "] to a null state; ignoring.");
    return State_ptr();
  }
  // else

  CRUX_LOG_TRACE("Binding [" << context << "] -> state [" << state.get() << "].");
  return m_registry.bind_state(context, state);
}

State_ptr Core::unbind_state(Context context)
{
  auto prior = m_registry.unbind_state(context);
  if (prior)
  {
    CRUX_LOG_TRACE("Unbound [" << context << "] -> state [" << prior.get() << "].");
  }
  return prior;
}

std::optional<Context> Core::resolve_token(Token token) const
{
  return m_registry.resolve_token(token);
}

State_ptr Core::resolve_context(Context context) const
{
  return m_registry.resolve_context(context);
}

const Registry& Core::registry() const
{
  return m_registry;
}

State_ptr Core::resolve_token_to_state(Token token, util::String_view event_desc) const
{
  const auto context = m_registry.resolve_token(token);
  if (!context)
  {
    CRUX_LOG_TRACE("Dropping [" << event_desc << "] on [" << token << "]: token not bound.");
    return State_ptr();
  }
  // else

  auto state = m_registry.resolve_context(*context);
  if (!state)
  {
    CRUX_LOG_TRACE("Dropping [" << event_desc << "] on [" << token << "]: "
                   "[" << *context << "] has no state.");
  }
  return state;
}

void Core::on_ready(reactor::Event_loop* event_loop, Token token, reactor::Event_set events)
{
  // Our own reference: keeps the state alive even if the handler unbinds it.
  const auto state = resolve_token_to_state(token, "ready");
  if (!state)
  {
    return;
  }
  // else

  CRUX_LOG_TRACE("Dispatching ready [" << events << "] on [" << token << "].");
  state->on_ready(this, event_loop, token, events);
}

void Core::on_timeout(reactor::Event_loop* event_loop, Token token)
{
  const auto state = resolve_token_to_state(token, "timeout");
  if (!state)
  {
    return;
  }
  // else

  CRUX_LOG_TRACE("Dispatching timeout on [" << token << "].");
  state->on_timeout(this, event_loop, token);
}

void Core::on_message(reactor::Event_loop* event_loop, Closure&& closure)
{
  Closure local(std::move(closure));
  local(this, event_loop);
}

void Core::terminate_state(reactor::Event_loop* event_loop, Context context)
{
  const auto state = m_registry.resolve_context(context);
  if (!state)
  {
    CRUX_LOG_TRACE("Terminate request on [" << context << "] ignored: no state.");
    return;
  }
  // else

  CRUX_LOG_TRACE("Terminating [" << context << "] -> state [" << state.get() << "].");
  state->on_terminate(this, event_loop);
}

} // namespace crux::core
