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
#include "crux/reactor/event_loop_options.hpp"
#include <boost/algorithm/string.hpp>

// Internal macros (#undef at the end of file).

/// @cond

#define ADD_CONFIG_OPTION(ARG_opt, ARG_desc) \
  Event_loop_options::add_config_option(opts_desc, #ARG_opt, &target->ARG_opt, defaults_source.ARG_opt, ARG_desc, \
                                        printout_only)

// -v- Doxygen, please stop ignoring.
/// @endcond

namespace crux::reactor
{

// Implementations.

Event_loop_options::Event_loop_options() :
  m_st_notify_capacity(4096),
  m_st_messages_per_tick(256),
  m_st_timer_capacity(65536),
  // They definitely need to opt into this.
  m_st_capture_interrupt_signals_internally(false),
  m_st_thread_nickname("crux_loop")
{
  // Nothing.
}

template<typename Opt_type>
void Event_loop_options::add_config_option(Options_description* opts_desc,
                                           const std::string& opt_id,
                                           Opt_type* target_val, const Opt_type& default_val,
                                           const char* description, bool printout_only) // Static.
{
  using boost::program_options::value;
  if (printout_only)
  {
    opts_desc->add_options()
      (opt_id_to_str(opt_id).c_str(), value<Opt_type>()->default_value(default_val));
  }
  else
  {
    opts_desc->add_options()
      (opt_id_to_str(opt_id).c_str(), value<Opt_type>(target_val)->default_value(default_val),
       description);
  }
}

void Event_loop_options::setup_config_parsing_helper(Options_description* opts_desc,
                                                     Event_loop_options* target,
                                                     const Event_loop_options& defaults_source,
                                                     bool printout_only) // Static.
{
  ADD_CONFIG_OPTION
    (m_st_notify_capacity,
     "The maximum number of messages (closures sent from other threads) that may be pending in the event loop's "
       "channel at a time.  A send beyond that fails rather than blocking or growing the queue.  Must be positive.");
  ADD_CONFIG_OPTION
    (m_st_messages_per_tick,
     "The maximum number of pending messages to run in one go before letting descriptor readiness and timers "
       "through.  Lower values favor I/O latency under a message flood; higher values favor message throughput.  "
       "Must be positive.");
  ADD_CONFIG_OPTION
    (m_st_timer_capacity,
     "The maximum number of timeouts that may be pending at the same time.  Scheduling one more fails.  "
       "Must be positive.");
  ADD_CONFIG_OPTION
    (m_st_capture_interrupt_signals_internally,
     "If and only if this is true, the event loop will detect SIGINT and SIGTERM while running; upon seeing such a "
       "signal, it will shut itself down, so that run() returns.  Leave this false if the application handles "
       "signals itself, and have it call shutdown() instead.");
  ADD_CONFIG_OPTION
    (m_st_thread_nickname,
     "The name under which log lines from the thread running the event loop are logged; also given to the OS "
       "as that thread's name.");
} // Event_loop_options::setup_config_parsing_helper()

void Event_loop_options::setup_config_parsing(Options_description* opts_desc)
{
  // Set up *opts_desc to parse into *this when the caller chooses to.  Take defaults from *this.
  setup_config_parsing_helper(opts_desc, this, *this, false);
}

std::ostream& operator<<(std::ostream& os, const Event_loop_options& opts)
{
  Event_loop_options sink;
  Event_loop_options::Options_description opts_desc{"Per-reactor::Event_loop option values"};
  Event_loop_options::setup_config_parsing_helper(&opts_desc, &sink, opts, true);
  return os << opts_desc;
}

std::string Event_loop_options::opt_id_to_str(const std::string& opt_id) // Static.
{
  using boost::algorithm::starts_with;
  using boost::algorithm::replace_all;
  using std::string;

  const string STATIC_PREFIX = "m_st_";

  string str = opt_id;
  if (starts_with(opt_id, STATIC_PREFIX))
  {
    str.erase(0, STATIC_PREFIX.size());
  }

  replace_all(str, "_", "-");

  return str;
}

} // namespace crux::reactor

#undef ADD_CONFIG_OPTION
