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
#include "crux/util/string_ostream.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <locale>
#include <type_traits>

namespace crux::util
{

// Types.

/**
 * Base for interfaces: contributes only a `virtual` destructor, so deleting through a base pointer is sound.
 * Abstract, though the destructor has a body.
 */
class Null_interface
{
public:
  // Destructor.

  /// Pure but defined.
  virtual ~Null_interface() = 0;
};

// Template implementations.

template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key)
{
  return container.find(key) != container.end();
}

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args)
{
  feed_args_to_ostream(os, ostream_arg1);
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg)
{
  *os << only_ostream_arg;
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  using std::flush;

  String_ostream os(target_str);
  feed_args_to_ostream(&(os.os()), ostream_args...);
  os.os() << flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  using std::string;

  string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::iequals;
  using std::locale;
  using std::string;
  using std::isdigit;
  using std::isalnum;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  auto& is = *is_ptr;

  string token;
  Traits::int_type ch;
  while (((ch = is.peek()) != Traits::eof()) && (isalnum(ch) || (ch == '_')))
  {
    token += Traits::to_char_type(ch);
    is.get();
  }

  Enum val = enum_default;
  if (token.empty())
  {
    return val;
  }
  // else

  if (accept_num_encoding && isdigit(token.front()))
  {
    try
    {
      const auto num_enum = lexical_cast<enum_t>(token);
      if ((num_enum < enum_t(enum_sentinel)) && (num_enum >= enum_t(enum_lowest)))
      {
        val = Enum(num_enum);
      }
    }
    catch (const bad_lexical_cast&)
    {
      // Too large for enum_t; val stays enum_default.
    }
    return val;
  }
  // else

  for (enum_t idx = enum_t(enum_lowest); idx != enum_t(enum_sentinel); ++idx)
  {
    const auto candidate = Enum(idx);
    if (iequals(token, lexical_cast<string>(candidate), locale::classic()))
    {
      val = candidate;
      break;
    }
  }

  return val;
} // istream_to_enum()

constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path);
  constexpr char SEP = '/';

  for (auto idx = path.size(); idx != 0; --idx)
  {
    if (path[idx - 1] == SEP)
    {
      path.remove_prefix(idx);
      break;
    }
  }

  return path;
} // get_last_path_segment()

} // namespace crux::util
