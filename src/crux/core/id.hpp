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

#include "crux/common.hpp"
#include <boost/functional/hash.hpp>
#include <cstddef>
#include <ostream>

namespace crux::core
{

// Types.

/**
 * An integer identifier, strongly typed by `Tag`, so that two kinds of ids with the same representation
 * (e.g., core::Token and core::Context) cannot be mixed up at compile time.  The value itself is opaque: the only
 * things one can do with it are compare, hash, print and get at the raw integer.
 *
 * There is no arithmetic on ids; Id_generator makes new values by working on raw_t.
 *
 * @tparam Tag
 *         Any type providing `static constexpr const char* S_NAME`, printed before the value by `operator<<`.
 *         The type need not be complete otherwise.
 */
template<typename Tag>
class Basic_id
{
public:
  // Types.

  /// The raw integer type.  Unsigned, so that generation wraps rather than overflowing.
  using raw_t = size_t;

  // Constructors/destructor.

  /// Constructs the id with raw value zero.
  constexpr Basic_id();

  /**
   * Constructs the id with the given raw value.
   *
   * @param raw
   *        Raw value.
   */
  constexpr explicit Basic_id(raw_t raw);

  // Methods.

  /**
   * The raw value.
   * @return See above.
   */
  constexpr raw_t raw() const;

private:
  // Data.

  /// The raw value.
  raw_t m_raw;
}; // class Basic_id

// Template implementations.

template<typename Tag>
constexpr Basic_id<Tag>::Basic_id() :
  m_raw(0)
{
  // Nothing else.
}

template<typename Tag>
constexpr Basic_id<Tag>::Basic_id(raw_t raw) :
  m_raw(raw)
{
  // Nothing else.
}

template<typename Tag>
constexpr typename Basic_id<Tag>::raw_t Basic_id<Tag>::raw() const
{
  return m_raw;
}

/**
 * Returns `true` if and only if the two ids have the same raw value.
 *
 * @relatesalso Basic_id
 *
 * @param id1
 *        Object to compare.
 * @param id2
 *        Object to compare.
 * @return See above.
 */
template<typename Tag>
constexpr bool operator==(const Basic_id<Tag>& id1, const Basic_id<Tag>& id2)
{
  return id1.raw() == id2.raw();
}

/**
 * Negation of `==`.
 *
 * @relatesalso Basic_id
 *
 * @param id1
 *        Object to compare.
 * @param id2
 *        Object to compare.
 * @return See above.
 */
template<typename Tag>
constexpr bool operator!=(const Basic_id<Tag>& id1, const Basic_id<Tag>& id2)
{
  return !(id1 == id2);
}

/**
 * Orders by raw value, so ids may be used as keys in ordered containers.  Note that after wraparound this order
 * no longer matches order of generation.
 *
 * @relatesalso Basic_id
 *
 * @param id1
 *        Object to compare.
 * @param id2
 *        Object to compare.
 * @return See above.
 */
template<typename Tag>
constexpr bool operator<(const Basic_id<Tag>& id1, const Basic_id<Tag>& id2)
{
  return id1.raw() < id2.raw();
}

/**
 * Free function that returns the hash of `id.raw()`; has to be a free function named `hash_value` for boost.hash
 * to pick it up.
 *
 * @relatesalso Basic_id
 *
 * @param id
 *        Object to hash.
 * @return See above.
 */
template<typename Tag>
size_t hash_value(const Basic_id<Tag>& id)
{
  return boost::hash<typename Basic_id<Tag>::raw_t>()(id.raw());
}

/**
 * Prints the id as `<name><raw>`, e.g. "tok5" or "ctx7".
 *
 * @relatesalso Basic_id
 *
 * @param os
 *        Stream to which to write.
 * @param id
 *        Object to serialize.
 * @return `os`.
 */
template<typename Tag>
std::ostream& operator<<(std::ostream& os, const Basic_id<Tag>& id)
{
  return os << Tag::S_NAME << id.raw();
}

} // namespace crux::core
