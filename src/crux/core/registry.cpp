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
#include "crux/core/registry.hpp"
#include "crux/core/state.hpp"

namespace crux::core
{

// Implementations.

Registry::Registry() = default;

std::optional<Context> Registry::bind_token(Token token, Context context)
{
  const auto result = m_token_to_context.emplace(token, context);
  if (result.second)
  {
    return std::nullopt;
  }
  // else: Already bound; replace and return the old one.

  const Context prior = result.first->second;
  result.first->second = context;
  return prior;
}

std::optional<Context> Registry::unbind_token(Token token)
{
  const auto it = m_token_to_context.find(token);
  if (it == m_token_to_context.end())
  {
    return std::nullopt;
  }
  // else

  const Context prior = it->second;
  m_token_to_context.erase(it);
  return prior;
}

State_ptr Registry::bind_state(Context context, const State_ptr& state)
{
  if (!state)
  {
    return State_ptr();
  }
  // else

  State_ptr& slot = m_context_to_state[context];
  State_ptr prior = std::move(slot); // Null if the slot was just inserted.
  slot = state;
  return prior;
}

State_ptr Registry::unbind_state(Context context)
{
  const auto it = m_context_to_state.find(context);
  if (it == m_context_to_state.end())
  {
    return State_ptr();
  }
  // else

  State_ptr prior = std::move(it->second);
  m_context_to_state.erase(it);
  return prior;
}

std::optional<Context> Registry::resolve_token(Token token) const
{
  const auto it = m_token_to_context.find(token);
  return (it == m_token_to_context.end()) ? std::nullopt : std::optional<Context>(it->second);
}

State_ptr Registry::resolve_context(Context context) const
{
  const auto it = m_context_to_state.find(context);
  return (it == m_context_to_state.end()) ? State_ptr() : it->second;
}

size_t Registry::n_tokens() const
{
  return m_token_to_context.size();
}

size_t Registry::n_states() const
{
  return m_context_to_state.size();
}

} // namespace crux::core
