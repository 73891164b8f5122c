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

#include "crux/util/util_fwd.hpp"
#include "crux/common.hpp"

/**
 * Crux module providing logging functionality.  While originally intended to be used from within the rest of Crux,
 * it is a general-purpose logging facility and can be used by any application.
 *
 * The user-facing pieces are:
 *   - Logger: the interface for anything that can decide whether a message should be logged (should_log())
 *     and then log it (do_log()).  The concrete logger is
 *     Simple_ostream_logger, writing to any pair of `ostream`s.
 *   - Config: the verbosity and component-naming configuration a concrete Logger consults.
 *   - Log_context: base class (or member) that stores a `Logger*` and Component, so that the `CRUX_LOG_*()` macros
 *     can be invoked from within its methods without mentioning either.
 *   - `CRUX_LOG_INFO()` and friends: take an `ostream` fragment, e.g.,
 *     `CRUX_LOG_INFO("Registered token [" << token << "].");`, which is evaluated only if should_log() passes.
 *
 * A message is stamped with severity (Sev), Component, source location, time and thread nickname or ID
 * (Msg_metadata) and formatted by Ostream_log_msg_writer into a single line.
 */
namespace crux::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Enumeration containing one of several message severity levels, ordered from highest to
 * lowest.  Generally speaking, volume/verbosity is inversely proportional to severity, though
 * this is not enforced somehow.
 *
 * As the underlying type is `size_t`, and the values are guaranteed to be 0, 1, ... going from lowest
 * to highest verbosity (highest to lowest severity), you may directly use log::Sev values to index into arrays.
 *
 * Do not use S_NONE or S_END_SENTINEL as the severity of an actual message; they are for configuration and
 * validity checks only.
 */
enum class Sev : size_t
{
  /// Sentinel log level that must not be specified for any actual message (at risk of undefined behavior).
  S_NONE = 0,
  /// Message indicates a "fatal" error; the program is about to abort or otherwise fail.
  S_FATAL,
  /// Message indicates a "bad" condition with "worse" impact than that of Sev::S_WARNING.
  S_ERROR,
  /// Message indicates a "bad" condition that is not frequent enough to be of severity Sev::S_TRACE.
  S_WARNING,
  /// Message indicates a not-"bad" condition that is not frequent enough to be of severity Sev::S_TRACE.
  S_INFO,
  /// Message indicates a condition with, perhaps, no significant perf impact if enabled (like Sev::S_INFO).
  S_DEBUG,
  /// Message indicates any condition that may occur with great frequency (thus verbose if logged).
  S_TRACE,
  /// Message satisfies Sev::S_TRACE description AND contains variable-length structure (like packet contents).
  S_DATA,
  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Deserializes a log::Sev from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a log::Sev.  If none is
 * recognized, Sev::S_NONE is the result.  The recognized values are:
 *   - "0", "1", ...: Corresponds to the `int` conversion of that log::Sev (e.g., 0 being NONE).
 *   - Case-insensitive string: e.g., "INFO", "info", "Trace".
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Serializes a log::Sev to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Log_context ADL-friendly swap: Equivalent to `val1.swap(val2)`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace crux::log
