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
#include <boost/program_options.hpp>
#include <string>

namespace crux::reactor
{

// Types.

/**
 * A set of low-level options affecting a single reactor::Event_loop.  The options are set once, at Event_loop
 * construction, and cannot change afterwards (hence the `m_st_` prefix: "static").  The Event_loop checks them
 * in its constructor and fails with error::Code::S_OPTION_CHECK_FAILED if any is invalid.
 *
 * The default constructor sets every option to a reasonable default.  To load options from a command line or
 * config file, use setup_config_parsing():
 *
 *   ~~~
 *   Event_loop_options loop_opts; // Defaults.
 *   Event_loop_options::Options_description opts_desc("Event loop options");
 *   loop_opts.setup_config_parsing(&opts_desc);
 *   // ... add other options to opts_desc (or to a parent options_description); then:
 *   boost::program_options::variables_map vm;
 *   boost::program_options::store(boost::program_options::parse_command_line(argc, argv, opts_desc), vm);
 *   boost::program_options::notify(vm); // loop_opts now holds the parsed values.
 *   ~~~
 *
 * The option names on the command line are the member names sans `m_st_`, with `-` for `_`: e.g.,
 * `--notify-capacity`.
 *
 * ### Adding an option ###
 *   1. Add a member.
 *   2. Give it a default in the constructor.
 *   3. Add an ADD_CONFIG_OPTION() line into setup_config_parsing_helper().
 *   4. If it has validity constraints, check them in Event_loop::Event_loop().
 */
struct Event_loop_options
{
  // Types.

  /// Short-hand for boost.program_options config options description.  See setup_config_parsing().
  using Options_description = boost::program_options::options_description;

  // Constructors/destructor.

  /// Constructs an Event_loop_options with all default values.
  Event_loop_options();

  // Methods.

  /**
   * Modifies a boost.program_options options description so that, when the user parses with it, the values end
   * up in `*this`.  Defaults for the options are taken from `*this`'s current values.
   *
   * @param opts_desc
   *        The options description to which to add our options.  `*this` must exist while `*opts_desc` is
   *        used for parsing.
   */
  void setup_config_parsing(Options_description* opts_desc);

  // Data.

  /**
   * Maximum number of core::Closure objects that may be pending (sent but not yet run) in the Event_loop's
   * channel.  A Channel::send() beyond that fails with error::Code::S_NOTIFY_CHANNEL_FULL.  Must be positive.
   */
  size_t m_st_notify_capacity;

  /**
   * Maximum number of pending core::Closure objects run in one go before the loop gets back to I/O and timers.
   * Must be positive.
   */
  size_t m_st_messages_per_tick;

  /// Maximum number of timeouts pending at the same time.  Must be positive.
  size_t m_st_timer_capacity;

  /**
   * If and only if this is `true`, the Event_loop catches SIGINT and SIGTERM while running and responds with
   * Event_loop::shutdown().
   */
  bool m_st_capture_interrupt_signals_internally;

  /// Logged nickname given to the thread that calls Event_loop::run().
  std::string m_st_thread_nickname;

private:
  // Friends.

  // Friend of Event_loop_options: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Event_loop_options& opts);

  // Methods.

  /**
   * Helper that, for a given option in Event_loop_options, adds it to a boost.program_options description.
   *
   * @tparam Opt_type
   *         The type of the option.
   * @param opts_desc
   *        The options description to which to add.
   * @param opt_id
   *        Name of the member, e.g. "m_st_notify_capacity"; converted by opt_id_to_str().
   * @param target_val
   *        If `!printout_only`, parsed value goes here.
   * @param default_val
   *        Default value.
   * @param description
   *        If `!printout_only`, the option's description.  Otherwise ignored.
   * @param printout_only
   *        See setup_config_parsing_helper().
   */
  template<typename Opt_type>
  static void add_config_option(Options_description* opts_desc,
                                const std::string& opt_id,
                                Opt_type* target_val, const Opt_type& default_val,
                                const char* description, bool printout_only);

  /**
   * Loads the full set of options into `*opts_desc`.  With `printout_only == false`, parsing with `*opts_desc`
   * then sets `*target`, with defaults from `defaults_source`.  With `printout_only == true`, the result is only
   * good for printing `defaults_source`'s values (`target` is ignored, and descriptions are omitted).
   *
   * @param opts_desc
   *        The options description.
   * @param target
   *        Where parsed values go.
   * @param defaults_source
   *        Source of the defaults (or of the values to print).
   * @param printout_only
   *        See above.
   */
  static void setup_config_parsing_helper(Options_description* opts_desc,
                                          Event_loop_options* target,
                                          const Event_loop_options& defaults_source,
                                          bool printout_only);

  /**
   * Converts a member name to an option name: `m_st_` prefix removed, `_` replaced by `-`.
   *
   * @param opt_id
   *        Member name.
   * @return See above.
   */
  static std::string opt_id_to_str(const std::string& opt_id);
}; // struct Event_loop_options

} // namespace crux::reactor
