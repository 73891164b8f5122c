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

#include "crux/log/config.hpp"
#include "crux/log/simple_ostream_logger.hpp"
#include "crux/common.hpp"
#include <cstdlib>
#include <sstream>

namespace crux::test
{

/**
 * Console Logger for unit tests, configured with the crux components.  Verbosity is INFO unless the environment
 * variable `CRUX_TEST_LOG_SEV` names another log::Sev (e.g., `trace`).
 */
class Test_logger :
  public log::Logger
{
public:
  /**
   * Constructs the logger.
   *
   * @param min_severity
   *        Most verbose severity let through.
   */
  explicit Test_logger(log::Sev min_severity = env_severity()) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    m_config.init_component_names<Crux_log_component>(S_CRUX_LOG_COMPONENT_NAME_MAP, "crux-");
  }

  /// See log::Simple_ostream_logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// See log::Simple_ostream_logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

  /**
   * Severity from `CRUX_TEST_LOG_SEV`, or INFO if unset or unrecognized.
   *
   * @return See above.
   */
  static log::Sev env_severity()
  {
    const char* const env = ::getenv("CRUX_TEST_LOG_SEV");
    if (!env)
    {
      return log::Sev::S_INFO;
    }
    // else
    std::istringstream is(env);
    log::Sev sev = log::Sev::S_NONE;
    is >> sev;
    return (sev == log::Sev::S_NONE) ? log::Sev::S_INFO : sev;
  }

private:
  /// Filter; initialized before #m_logger, which points to it.
  log::Config m_config;

  /// Does the work.
  log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace crux::test
