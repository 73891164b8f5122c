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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace crux::util
{

/**
 * An `ostream` appending to an `std::string` which can be read in place, without the copy `ostringstream::str()`
 * makes.  The string is either owned by `*this` or supplied by the user.
 *
 * Backs the log message builder and ostream_op_to_string(); tests also point a log::Simple_ostream_logger
 * at one to inspect what was logged.  Not thread-safe.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stream.
   *
   * @param target_str
   *        String to append to (its existing contents are kept); or null to append to an internal one.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * The stream.
   *
   * @return See above.
   */
  std::ostream& os();

  /**
   * The stream (`const`).
   *
   * @return See above.
   */
  const std::ostream& os() const;

  /**
   * The string written so far; `flush` os() first to see everything.
   *
   * @return See above.
   */
  const std::string& str() const;

  /// Empties str().
  void str_clear();

private:
  // Types.

  /// Boost.iostreams device appending to a string.
  using Appender_device = boost::iostreams::back_insert_device<std::string>;

  // Data.

  /// Target if none was given to the ctor.
  std::string m_own_str;

  /// Target.  Not null.
  std::string* const m_str;

  /// Writes to `*m_str`.
  boost::iostreams::stream<Appender_device> m_appender;
}; // class String_ostream

} // namespace crux::util
