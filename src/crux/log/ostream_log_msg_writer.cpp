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
#include "crux/log/ostream_log_msg_writer.hpp"
#include "crux/log/config.hpp"
#include <iomanip>

namespace crux::log
{

// Static initializations.

const std::vector<util::String_view> Ostream_log_msg_writer::S_SEV_TAGS
  ({ "null", "fatl", "eror", "warn", "info", "debg", "trce", "data" });

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os),
  m_clean_os_state(m_os)
{
  // The fill is only ever used for the microseconds; the destructor restores the caller's formatting.
  m_os << std::setfill('0');
}

Ostream_log_msg_writer::~Ostream_log_msg_writer() noexcept = default;

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using boost::chrono::duration_cast;
  using boost::chrono::microseconds;
  using std::setw;

  assert(metadata.m_msg_sev != Sev::S_NONE);

  // <sec>.<usec> [<sev>]: T<thread>: [<component>: ]<file>:<function>(<line>): <msg>
  constexpr auto USEC_PER_SEC = 1000000;
  const auto usec = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count();
  m_os << (usec / USEC_PER_SEC) << '.' << setw(6) << (usec % USEC_PER_SEC)
       << " [" << S_SEV_TAGS[size_t(metadata.m_msg_sev)] << "]: T";

  if (!metadata.m_call_thread_nickname.empty())
  {
    m_os << metadata.m_call_thread_nickname;
  }
  else
  {
    m_os << metadata.m_call_thread_id;
  }
  m_os << ": ";

  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << CRUX_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line)
       << ": " << msg << std::endl;
}

} // namespace crux::log
