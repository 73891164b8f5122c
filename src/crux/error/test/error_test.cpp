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
#include "crux/error/error.hpp"
#include "crux/log/config.hpp"
#include "crux/log/simple_ostream_logger.hpp"
#include "crux/reactor/error/error.hpp"
#include "crux/util/string_ostream.hpp"
#include <gtest/gtest.h>

namespace crux::error::test
{

namespace
{
using std::string;

/// Toy API following the `Error_code* err_code = 0` convention.
class Divider :
  public log::Log_context
{
public:
  explicit Divider(log::Logger* logger_ptr) :
    log::Log_context(logger_ptr, Crux_log_component::S_ERROR)
  {
    // Nothing else.
  }

  int divide(int num, int denom, Error_code* err_code = 0)
  {
    CRUX_ERROR_EXEC_AND_THROW_ON_ERROR(int, divide, num, denom, _1);

    if (denom == 0)
    {
      CRUX_ERROR_EMIT_ERROR(boost::system::errc::make_error_code(boost::system::errc::invalid_argument));
      return 0;
    }
    // else
    err_code->clear();
    return num / denom;
  }

  void check_positive(int val, Error_code* err_code = 0)
  {
    CRUX_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(check_positive, val, _1);

    if (val <= 0)
    {
      CRUX_ERROR_EMIT_ERROR(reactor::error::Code::S_OPTION_CHECK_FAILED);
      return;
    }
    // else
    err_code->clear();
  }
}; // class Divider

} // Anonymous namespace

TEST(Runtime_error, What)
{
  const Runtime_error no_code("just context");
  EXPECT_EQ(string(no_code.what()), "just context");
  EXPECT_FALSE(no_code.code());

  const Runtime_error with_code(reactor::error::Code::S_NOTIFY_CHANNEL_FULL, "ctx here");
  const string what = with_code.what();
  EXPECT_EQ(with_code.code(), reactor::error::Code::S_NOTIFY_CHANNEL_FULL);
  EXPECT_NE(what.find("ctx here"), string::npos) << what;
  EXPECT_NE(what.find("capacity"), string::npos) << what;
}

TEST(Error_code_convention, ReturnOrThrow)
{
  log::Config cfg;
  util::String_ostream os;
  log::Simple_ostream_logger logger{&cfg, os.os(), os.os()};
  Divider divider{&logger};

  // Non-null err_code: no throw, error reported.
  Error_code err_code;
  EXPECT_EQ(divider.divide(7, 2, &err_code), 3);
  EXPECT_FALSE(err_code);
  divider.divide(7, 0, &err_code);
  EXPECT_EQ(err_code, boost::system::errc::invalid_argument);
  EXPECT_NE(os.str().find("Error code emitted"), string::npos);

  // Success clears a prior error.
  divider.check_positive(5, &err_code);
  EXPECT_FALSE(err_code);
  divider.check_positive(-5, &err_code);
  EXPECT_EQ(err_code, reactor::error::Code::S_OPTION_CHECK_FAILED);

  // Null err_code: result returned on success; throws on error, with the code.
  EXPECT_EQ(divider.divide(9, 3), 3);
  EXPECT_NO_THROW(divider.check_positive(1));
  try
  {
    divider.divide(1, 0);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), boost::system::errc::invalid_argument);
    EXPECT_NE(string(exc.what()).find("divide"), string::npos) << exc.what();
  }
  EXPECT_THROW(divider.check_positive(0), Runtime_error);
} // TEST(Error_code_convention, ReturnOrThrow)

TEST(Reactor_error, Category)
{
  const Error_code err_code = reactor::error::Code::S_TOKEN_NOT_REGISTERED;
  EXPECT_EQ(string(err_code.category().name()), "crux_reactor");
  EXPECT_EQ(err_code.value(), int(reactor::error::Code::S_TOKEN_NOT_REGISTERED));
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_NE(err_code, Error_code(reactor::error::Code::S_TOKEN_ALREADY_REGISTERED));
}

} // namespace crux::error::test
