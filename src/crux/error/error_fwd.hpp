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
 * Crux module that facilitates working with error codes and exceptions; essentially comprised of niceties on top
 * boost.system's error facility.
 *
 * The convention (see crux::Error_code doc header): a failable API takes a trailing `Error_code* err_code = 0`.
 * With #CRUX_ERROR_EXEC_AND_THROW_ON_ERROR() or exec_void_and_throw_on_error() placed at the top of such an API,
 * the body only ever deals with the non-null `err_code` case; the null case (throw Runtime_error) is handled by
 * re-invoking the API with a local `Error_code` and throwing if it ends up truthy.
 */
namespace crux::error
{

// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_error;

// Free functions.

/**
 * Helper for implementing the `err_code`-or-throw convention in APIs returning a value.  See
 * #CRUX_ERROR_EXEC_AND_THROW_ON_ERROR(), which is the recommended way to use it.
 *
 * @tparam Func
 *         Callable with signature `Ret (Error_code*)`.
 * @tparam Ret
 *         Return type of the API.
 * @param func
 *        The API itself, partially applied with all args except the `Error_code*`.
 * @param ret
 *        If `func()` is invoked (and does not throw), its result is stored here.
 * @param err_code
 *        The API's `err_code` argument.
 * @param context
 *        Call-site context for the exception message.
 * @return `true` if `err_code` was null, so `func()` was invoked, did not throw, and `*ret` holds the result:
 *         the caller should return `*ret` immediately.  `false` if `err_code` is not null; the caller should
 *         proceed with its actual work.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * Equivalent of exec_and_throw_on_error() for APIs returning `void`.
 *
 * @tparam Func
 *         Callable with signature `void (Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace crux::error
