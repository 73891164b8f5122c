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
#include "crux/common.hpp"
#include <ostream>

namespace crux
{

// Static initializations.

const boost::unordered_map<Crux_log_component, std::string> S_CRUX_LOG_COMPONENT_NAME_MAP
  {
    { Crux_log_component::S_UNCAT, "UNCAT" },
    { Crux_log_component::S_LOG, "LOG" },
    { Crux_log_component::S_ERROR, "ERROR" },
    { Crux_log_component::S_UTIL, "UTIL" },
    { Crux_log_component::S_CORE, "CORE" },
    { Crux_log_component::S_REACTOR, "REACTOR" }
  };

// Free function implementations.

std::ostream& operator<<(std::ostream& os, Crux_log_component val)
{
  const auto name_it = S_CRUX_LOG_COMPONENT_NAME_MAP.find(val);
  if (name_it == S_CRUX_LOG_COMPONENT_NAME_MAP.end())
  {
    // Sentinel or corrupt value.  Print the number; better than nothing.
    return os << static_cast<unsigned int>(val);
  }
  // else
  return os << name_it->second;
}

} // namespace crux
