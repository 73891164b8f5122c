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

#include "crux/log/log.hpp"
#include <boost/io/ios_state.hpp>
#include <boost/noncopyable.hpp>
#include <vector>

namespace crux::log
{

/**
 * Utility class, each object of which wraps a given `ostream` and outputs discrete messages to it adorned with time
 * stamps and other formatting such as separating newlines.  A Logger that writes to an `ostream` is expected to
 * use one of these per `ostream`; it is not itself a Logger.
 *
 * Each message takes one line:
 *
 *   `<sec>.<usec> [<sevr>]: T<thread nickname or ID>: <component>: <file>:<function>(<line>): <msg>`
 *
 * where the time stamp is the POSIX (UTC) time of the log call; `<sevr>` is a 4-letter abbreviation of the
 * log::Sev; and `<component>: ` appears only if the Config knows a name for the message's Component.
 *
 * ### Thread safety ###
 * Not safe to call log() concurrently on one object; the Logger using it must serialize.  The `ostream` must not
 * be used by anyone else while `*this` exists; at destruction its formatting state is restored.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs object wrapping the given `ostream`.  Does not write anything to it.
   *
   * @param config
   *        Controls behavior of `*this`, namely component output.  It must exist while `*this` exists.
   * @param os
   *        The `ostream` to which to log messages.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  /// Restores the formatting state of the `ostream` given to the constructor.
  ~Ostream_log_msg_writer() noexcept;

  // Methods.

  /**
   * Logs to the wrapped `ostream` the given message and associated metadata like severity and time stamp; plus
   * a newline.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.
   * @param msg
   *        The message.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Constants.

  /// Four-letter severity tags, indexed by `Sev` value.
  static const std::vector<util::String_view> S_SEV_TAGS;

  // Data.

  /// Reference to the config object passed to constructor.
  const Config& m_config;

  /// Reference to stream to which to log messages.
  std::ostream& m_os;

  /// Formatter state of #m_os at construction.  Used to restore it at destruction.
  boost::io::ios_all_saver m_clean_os_state;
}; // class Ostream_log_msg_writer

} // namespace crux::log
