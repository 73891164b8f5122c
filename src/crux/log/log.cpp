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
#include "crux/log/log.hpp"
#include "crux/error/error.hpp"
#include <pthread.h>
#include <cassert>

namespace crux::log
{

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_this_thread_nickname_ptr;

// Logger implementations.

void Logger::this_thread_set_logged_nickname(util::String_view thread_nickname, Logger* logger_ptr,
                                             bool also_set_os_name) // Static.
{
  using std::string;

  if (thread_nickname.empty())
  {
    s_this_thread_nickname_ptr.reset();
  }
  else
  {
    s_this_thread_nickname_ptr.reset(new string(thread_nickname));
  }

  CRUX_LOG_SET_CONTEXT(logger_ptr, Crux_log_component::S_LOG);
  CRUX_LOG_INFO("Thread ID [" << util::this_thread::get_id() << "] is now logged "
                "as [" << (thread_nickname.empty() ? string("<its ID>") : string(thread_nickname)) << "].");

  if (!also_set_os_name)
  {
    return;
  }
  // else

  // Linux limit, not counting the NUL; longer names fail with ERANGE.
  constexpr size_t MAX_OS_NAME_SZ = 15;

  string os_name = thread_nickname.empty() ? util::ostream_op_string(util::this_thread::get_id())
                                           : string(thread_nickname);
  if (os_name.size() > MAX_OS_NAME_SZ)
  {
    os_name.resize(MAX_OS_NAME_SZ);
  }

  // Returns the error number rather than setting errno.
  const int result = ::pthread_setname_np(::pthread_self(), os_name.c_str());
  if (result != 0)
  {
    const Error_code sys_err_code(result, boost::system::system_category());
    CRUX_LOG_WARNING("Could not set OS thread name [" << os_name << "]; the logged nickname is unaffected.");
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else
  CRUX_LOG_INFO("OS thread name set to [" << os_name << "].");
} // Logger::this_thread_set_logged_nickname()

void Logger::set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata) // Static.
{
  assert(msg_metadata);

  const std::string* const nickname = s_this_thread_nickname_ptr.get();
  if (nickname)
  {
    msg_metadata->m_call_thread_nickname = *nickname;
    return;
  }
  // else
  msg_metadata->m_call_thread_id = util::this_thread::get_id();
}

// Component implementations.

Component::Component() :
  m_payload_type_or_null(0),
  m_payload_enum_raw_value(0)
{
  // Nothing else.
}

bool Component::empty() const
{
  return m_payload_type_or_null == 0;
}

std::type_index Component::payload_type_index() const
{
  assert(!empty());
  return std::type_index(*m_payload_type_or_null);
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_payload_enum_raw_value;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing else.
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::swap(Log_context& other)
{
  std::swap(m_logger, other.m_logger);
  std::swap(m_component, other.m_component);
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  // operator>> matches these names case-insensitively; keep them single words.
  switch (val)
  {
  case Sev::S_NONE:
    return os << "NONE";
  case Sev::S_FATAL:
    return os << "FATAL";
  case Sev::S_ERROR:
    return os << "ERROR";
  case Sev::S_WARNING:
    return os << "WARNING";
  case Sev::S_INFO:
    return os << "INFO";
  case Sev::S_DEBUG:
    return os << "DEBUG";
  case Sev::S_TRACE:
    return os << "TRACE";
  case Sev::S_DATA:
    return os << "DATA";
  case Sev::S_END_SENTINEL:
    break;
  }
  assert(false && "Sentinel or corrupt Sev value.");
  return os << "?";
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  // Name or number; unknown yields S_NONE.
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace crux::log
