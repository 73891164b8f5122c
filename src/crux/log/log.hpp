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

#include "crux/log/log_fwd.hpp"
#include "crux/util/util.hpp"
#include "crux/util/string_ostream.hpp"
#include <boost/chrono/chrono.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/tss.hpp>
#include <string>
#include <typeinfo>
#include <typeindex>

// Macros.  These (conceptually) belong to the crux::log namespace (hence the prefix for each macro).

/**
 * Logs `ARG_stream_fragment` at WARNING severity to `get_logger()`, under component `get_log_component()`, unless
 * the Logger is null or filters it out.  The fragment is not evaluated in the latter cases.
 *
 * The two accessors must be callable at the invocation site: from inside a log::Log_context subclass, or after
 * CRUX_LOG_SET_CONTEXT() in the same block.  Time stamp, source location and thread identity are attached
 * automatically.
 *
 * @param ARG_stream_fragment
 *        `ostream` expression, as in `"x = [" << x << "]."`.  No trailing newline.
 */
#define CRUX_LOG_WARNING(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_WARNING, ARG_stream_fragment)

/// Like CRUX_LOG_WARNING() but at FATAL severity.
#define CRUX_LOG_FATAL(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_FATAL, ARG_stream_fragment)

/// Like CRUX_LOG_WARNING() but at ERROR severity.
#define CRUX_LOG_ERROR(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_ERROR, ARG_stream_fragment)

/// Like CRUX_LOG_WARNING() but at INFO severity.
#define CRUX_LOG_INFO(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_INFO, ARG_stream_fragment)

/// Like CRUX_LOG_WARNING() but at DEBUG severity.
#define CRUX_LOG_DEBUG(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_DEBUG, ARG_stream_fragment)

/// Like CRUX_LOG_WARNING() but at TRACE severity.  Per-event dispatch detail goes here.
#define CRUX_LOG_TRACE(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_TRACE, ARG_stream_fragment)

/// Like CRUX_LOG_WARNING() but at DATA severity.
#define CRUX_LOG_DATA(ARG_stream_fragment) \
  CRUX_LOG_WITH_CHECKING(::crux::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * Defines local `get_logger()` and `get_log_component()` for the rest of the enclosing block, so that
 * `CRUX_LOG_*()` works in free functions, `static` methods and lambdas that have no Log_context at hand.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to log to.  May be null.
 * @param ARG_component_payload
 *        `enum` value wrapped into the Component.
 */
#define CRUX_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::crux::log::Logger*>(ARG_logger_ptr)] \
          () -> ::crux::log::Logger* { return logger_ptr_copy; }; \
  [[maybe_unused]] \
    const auto get_log_component = [component = ::crux::log::Component(ARG_component_payload)] \
                                     () -> const ::crux::log::Component & \
  { \
    return component; \
  }

/**
 * What each `CRUX_LOG_<sev>()` expands to: Logger::should_log() check, then CRUX_LOG_WITHOUT_CHECKING().
 *
 * @param ARG_sev
 *        log::Sev.
 * @param ARG_stream_fragment
 *        See CRUX_LOG_WARNING().
 */
#define CRUX_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  CRUX_UTIL_SEMICOLON_SAFE \
  ( \
    ::crux::log::Logger const * const CRUX_LOG_W_CHK_logger = get_logger(); \
    if (CRUX_LOG_W_CHK_logger && CRUX_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      CRUX_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Builds the Msg_metadata and message and hands them to Logger::do_log() without consulting should_log().
 * No-op if `get_logger()` is null.
 *
 * @param ARG_sev
 *        log::Sev.
 * @param ARG_stream_fragment
 *        See CRUX_LOG_WARNING().
 */
#define CRUX_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  CRUX_UTIL_SEMICOLON_SAFE \
  ( \
    ::crux::log::Logger* const CRUX_LOG_WO_CHK_logger = get_logger(); \
    if (!CRUX_LOG_WO_CHK_logger) \
    { \
      break; \
    } \
    /* else */ \
    /* Wall clock, for human-readable stamps. */ \
    auto const CRUX_LOG_WO_CHK_time_stamp = ::boost::chrono::system_clock::now(); \
    constexpr ::crux::util::String_view CRUX_LOG_WO_CHK_file_str \
      = ::crux::util::get_last_path_segment(::crux::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    const ::crux::util::String_view CRUX_LOG_WO_CHK_func_str(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    ::crux::log::Msg_metadata CRUX_LOG_WO_CHK_metadata; \
    CRUX_LOG_WO_CHK_metadata.m_msg_component = get_log_component(); \
    CRUX_LOG_WO_CHK_metadata.m_msg_sev = ARG_sev; \
    CRUX_LOG_WO_CHK_metadata.m_msg_src_file = CRUX_LOG_WO_CHK_file_str; \
    CRUX_LOG_WO_CHK_metadata.m_msg_src_line = __LINE__; \
    CRUX_LOG_WO_CHK_metadata.m_msg_src_function = CRUX_LOG_WO_CHK_func_str; \
    CRUX_LOG_WO_CHK_metadata.m_called_when = CRUX_LOG_WO_CHK_time_stamp; \
    ::crux::log::Logger::set_thread_info_in_msg_metadata(&CRUX_LOG_WO_CHK_metadata); \
    ::crux::util::String_ostream CRUX_LOG_WO_CHK_os; \
    CRUX_LOG_WO_CHK_os.os() << ARG_stream_fragment << ::std::flush; \
    CRUX_LOG_WO_CHK_logger->do_log(&CRUX_LOG_WO_CHK_metadata, \
                                   ::crux::util::String_view(CRUX_LOG_WO_CHK_os.str())); \
  ) /* CRUX_UTIL_SEMICOLON_SAFE() */

namespace crux::log
{

// Types.

/**
 * The "component" a log line belongs to: one value of some `enum class` with underlying type #enum_raw_t, plus
 * the identity of that `enum` type.  Crux logs under crux::Crux_log_component; an application may use its own
 * `enum` alongside, and equal numeric values of different `enum` types stay distinct.
 *
 * Config names components and filters by them.  Copyable value type; not synchronized.
 */
class Component
{
public:
  // Types.

  /// Required underlying type of payload `enum`s.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty() Component.
  Component();

  /**
   * Wraps `payload`.  Implicit: an `enum` value can be passed where a Component is expected.
   *
   * @tparam Payload
   *         `enum class` with underlying type #enum_raw_t.
   * @param payload
   *        Value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Whether this was default-constructed.
   * @return See above.
   */
  bool empty() const;

  /**
   * The stored value.  Must not be empty(); `Payload` must be the type given at construction.
   *
   * @tparam Payload
   *         See above.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * Type of the stored `enum`.  Must not be empty().
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * Stored value as an integer.  Must not be empty().
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `typeid(Payload)`; null if empty().
  std::type_info const * m_payload_type_or_null;

  /// The value; meaningless if empty().
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/// Everything known about a log call besides the message text.  Of interest to Logger implementations only.
struct Msg_metadata
{
  // Data.

  /// Component.
  Component m_msg_component;

  /// Severity.
  Sev m_msg_sev;

  /// Base name of `__FILE__`; static storage.
  util::String_view m_msg_src_file;

  /// `__LINE__`.
  unsigned int m_msg_src_line;

  /// `__FUNCTION__`; static storage.
  util::String_view m_msg_src_function;

  /// When the log macro was entered.
  boost::chrono::system_clock::time_point m_called_when;

  /// Calling thread's nickname (Logger::this_thread_set_logged_nickname()); empty if it has none.
  std::string m_call_thread_nickname;

  /// Calling thread's ID; set only when #m_call_thread_nickname is empty.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Log sink interface.  Every logging Crux object (core::Core, reactor::Event_loop, ...) takes a `Logger*` at
 * construction; null disables its logging.
 *
 * should_log() is the cheap filter run before a message is composed; do_log() writes a composed message.
 * Both may be called concurrently: from the loop thread and from any thread using a reactor::Channel.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Whether a message with these attributes would be logged.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty().
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Writes the message unconditionally.
   *
   * @param metadata
   *        Not null.
   * @param msg
   *        Text; valid only during the call.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;

  /**
   * Names the calling thread in subsequent log lines (instead of its ID); empty name reverts to the ID.
   *
   * @param thread_nickname
   *        Nickname, or empty.
   * @param logger_ptr
   *        If not null, the change is logged there at INFO.
   * @param also_set_os_name
   *        Also set the OS-level thread name (truncated to the OS limit).
   */
  static void this_thread_set_logged_nickname(util::String_view thread_nickname = util::String_view(),
                                              Logger* logger_ptr = 0,
                                              bool also_set_os_name = true);

  /**
   * Fills in the calling thread's nickname, or its ID if it has none.
   *
   * @param msg_metadata
   *        Not null; both thread fields default-valued on entry.
   */
  static void set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata);

private:
  // Data.

  /// Per-thread nickname; null means none.
  static boost::thread_specific_ptr<std::string> s_this_thread_nickname_ptr;
}; // class Logger

/**
 * Holds a `Logger*` and a Component and exposes them as get_logger() and get_log_component(), the two names the
 * `CRUX_LOG_*()` macros look up.  Logging classes derive from it.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Stores `logger` and an empty Component.
   *
   * @param logger
   *        May be null.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Stores `logger` and `Component(component_payload)`.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        May be null.
   * @param component_payload
   *        See Component.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  // Methods.

  /**
   * Swaps contents with `other`.
   *
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

  /**
   * The Logger; may be null.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The Component.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type_or_null(&(typeid(Payload))),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "Payload type must be an enum.");
  static_assert(std::is_same_v<typename std::underlying_type_t<Payload>, enum_raw_t>,
                "Payload enum underlying type must equal enum_raw_t.");
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace crux::log
