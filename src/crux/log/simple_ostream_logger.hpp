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

#include "crux/log/ostream_log_msg_writer.hpp"
#include "crux/log/log.hpp"
#include "crux/util/util_fwd.hpp"
#include <iostream>
#include <memory>

namespace crux::log
{

// Types.

/**
 * Logger writing synchronously to console-like streams: INFO and more verbose to one `ostream`, WARNING and more
 * severe to another (by default `cout` and `cerr`; they may be the same stream).  Filtering is by the given Config.
 *
 * One mutex serializes do_log(), so lines from different threads do not interleave even if both streams end up on
 * the same terminal.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger.
   *
   * @param config
   *        Filter; must outlive `*this`.
   * @param os
   *        Destination for INFO and more verbose.
   * @param os_for_err
   *        Destination for WARNING and more severe.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

  // Methods.

  /**
   * Asks #m_config.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty().
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Writes one line to the stream chosen by severity.
   *
   * @param metadata
   *        Not null.
   * @param msg
   *        Text.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  // Data.  (Public!)

  /// The filter given to the constructor.  May be reconfigured by the user.
  Config* const m_config;

private:
  // Data.

  /// Writer for INFO and more verbose; also for everything if both streams are the same.
  Ostream_log_msg_writer m_out_writer;

  /// Writer for WARNING and more severe; null if it would write to the same stream as #m_out_writer.
  std::unique_ptr<Ostream_log_msg_writer> m_err_writer;

  /// Serializes do_log().
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace crux::log
