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
#include "crux/log/config.hpp"
#include <boost/algorithm/string.hpp>
#include <locale>

namespace crux::log
{

// Static initializations.

// By definition INFO is the most-verbose severity meant to avoid affecting performance.
const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_verbosity_default(raw_sev_t(most_verbose_sev_default))
{
  // Nothing.
}

Config::Config(const Config& src) :
  m_verbosity_default(src.m_verbosity_default.load(std::memory_order_relaxed)),
  m_verbosities_by_component(src.m_verbosities_by_component),
  m_component_names(src.m_component_names),
  m_component_keys_by_name(src.m_component_keys_by_name)
{
  // Nothing else.
}

Config::Component_key Config::component_key(const Component& component) // Static.
{
  return Component_key(component.payload_type_index(), component.payload_enum_raw_value());
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  /* Relaxed suffices: a concurrent output_whether_should_log() seeing the old value a split second longer is the
   * same as that message having been logged a split second earlier. */
  m_verbosity_default.store(raw_sev_t(most_verbose_sev_default), std::memory_order_relaxed);

  if (reset)
  {
    m_verbosities_by_component.clear();
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto key_it = m_component_keys_by_name.find(normalized_component_name(component_name));
  if (key_it == m_component_keys_by_name.end())
  {
    return false;
  }
  // else

  m_verbosities_by_component[key_it->second] = most_verbose_sev;
  return true;
}

bool Config::output_component_to_ostream(std::ostream* os_ptr, const Component& component) const
{
  assert(os_ptr);

  if (component.empty()) // Unspecified component at log call site (or wherever).
  {
    return false;
  }
  // else

  const auto name_it = m_component_names.find(component_key(component));
  if (name_it == m_component_names.end())
  {
    return false; // Unregistered component.
  }
  // else

  *os_ptr << name_it->second;
  return true;
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  // Check possible thread-local override in which case it's a very quick filter check.
  const auto sev_override = *(this_thread_verbosity_override());
  if (sev_override != Sev::S_END_SENTINEL)
  {
    return sev <= sev_override;
  }
  // else

  if ((!component.empty()) && (!m_verbosities_by_component.empty()))
  {
    const auto sev_it = m_verbosities_by_component.find(component_key(component));
    if (sev_it != m_verbosities_by_component.end())
    {
      return sev <= sev_it->second;
    }
    // else { No per-component setting.  Fall through. }
  }

  return sev <= Sev(m_verbosity_default.load(std::memory_order_relaxed));
} // Config::output_whether_should_log()

std::string Config::normalized_component_name(util::String_view name) // Static.
{
  using boost::algorithm::to_upper_copy;
  using std::locale;
  using std::string;

  return to_upper_copy(string(name), locale::classic());
}

Sev* Config::this_thread_verbosity_override() // Static.
{
  thread_local Sev verbosity_override = Sev::S_END_SENTINEL; // Initialized 1st time through this line in this thread.
  return &verbosity_override;
}

} // namespace crux::log
