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

#include "crux/log/log.hpp"
#include <boost/unordered_map.hpp>
#include <atomic>
#include <typeindex>
#include <utility>

namespace crux::log
{

// Types.

/**
 * Class used to configure the filtering and logging behavior of Logger%s; its use in your custom Logger%s is
 * optional but encouraged; it supports per-Component verbosity and per-Component names.
 *
 * A Config stores:
 *   - A default most-verbose severity: a message with Sev more verbose than it is filtered out, unless its Component
 *     has its own setting.
 *   - Per-Component most-verbose severities, which override the default for that Component.
 *   - Per-Component names, used for output (Ostream_log_msg_writer prints them) and for
 *     configure_component_verbosity_by_name().  Names are normalized to upper case, with an optional prefix
 *     per `enum` type, so that two `enum`s can share member names (e.g., "CRUX_CORE" vs. "ECHO_CORE").
 *   - A per-thread verbosity override (this_thread_verbosity_override()), checked before everything else.
 *     Tests use it to silence intentionally noisy sections.
 *
 * A Component whose `enum` type was never given to init_component_names() is still filtered by the default
 * severity, and is simply not printed.
 *
 * ### Thread safety ###
 * output_whether_should_log() and output_component_to_ostream() may be called concurrently with each other.
 * configure_default_verbosity() may be called concurrently with those too (the default is stored atomically).
 * init_component_names() and `configure_component_verbosity*()` must be called before any concurrent logging
 * through a Logger using `*this` begins.
 */
class Config
{
public:
  // Constants.

  /// Recommended default/catch-all most-verbose-severity-to-log for a Config.  By definition it is Sev::S_INFO.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually blank but functional set of Config.  Only the default verbosity is set: all messages
   * of `most_verbose_sev_default` or more severe pass, regardless of Component.
   *
   * @param most_verbose_sev_default
   *        Same as in configure_default_verbosity().
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /**
   * Copy constructor, making a deep copy of `src`.
   *
   * @param src
   *        Source to copy.
   */
  Config(const Config& src);

  /// For now at least there's no reason for assignment or move.
  void operator=(const Config&) = delete;

  // Methods.

  /**
   * A key output of Config, this computes the verbosity-filtering answer to Logger::should_log() based on the
   * given log-call-site severity and component and the verbosity configuration in `*this`.
   *
   * @param sev
   *        See Logger::should_log().
   * @param component
   *        See Logger::should_log().
   * @return `true` if we recommend to let the associated message be logged; `false` to suppress it.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * An output of Config, this writes a string representation of the given component value to the given
   * `ostream`, if possible.  Returns `true` if it wrote anything; `false` if the Component is empty or its name
   * is not known to `*this`.
   *
   * @param os
   *        Pointer (not null) to the `ostream` to which to possibly write.
   * @param component
   *        The component value from the log call site.
   * @return `true` if and only if something was written to `*os`.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers the names of the values of the `enum class Component_payload`, so that components can be printed by
   * name and configured by name.
   *
   * @tparam Component_payload
   *         An `enum class` as required by Component.
   * @param component_names
   *        Each value's name, e.g., crux::S_CRUX_LOG_COMPONENT_NAME_MAP.  Names must be non-empty and distinct.
   * @param payload_type_prefix_or_empty
   *        Prepended to each name (after normalization to upper case).  May be empty.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_map<Component_payload, std::string>& component_names,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Sets the default verbosity to the given value, to be used by subsequent output_whether_should_log() calls whenever
   * one is not overridden by a per-component setting.  Optionally removes all per-component settings.
   *
   * @param most_verbose_sev_default
   *        The most-verbose (numerically highest) `Sev sev` value such that output_whether_should_log() will return
   *        `true`, for components with no per-component verbosity.
   * @param reset
   *        If `true`, forgets all per-component verbosities.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the per-component verbosity for the given component to the given value.
   *
   * @tparam Component_payload
   *         An `enum class` as required by Component.
   * @param most_verbose_sev
   *        Verbosity for `component_payload`; overrides the default.
   * @param component_payload
   *        The component.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity(), but the component is specified by name, including the prefix
   * (case-insensitively), as registered via init_component_names().
   *
   * @param most_verbose_sev
   *        Verbosity for the component.
   * @param component_name
   *        Component name.
   * @return `true` on success; `false` if the name is not registered.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  /**
   * Returns pointer to this thread's *mutable* verbosity override.  If it is set to anything other than
   * Sev::S_END_SENTINEL (the initial value in every thread), then output_whether_should_log() in this thread
   * ignores all other configuration and returns `sev <= *this_thread_verbosity_override()`.
   *
   * @return Pointer to the thread-local override; never null.
   */
  static Sev* this_thread_verbosity_override();

private:
  // Types.

  /// Identifies a component regardless of its `enum` type: the type's identity plus the numeric value.
  using Component_key = std::pair<std::type_index, Component::enum_raw_t>;

  /// How we store a log::Sev (which is mere `enum`) atomically.
  using raw_sev_t = uint8_t;

  // Methods.

  /**
   * Returns the key of a non-empty Component.
   *
   * @param component
   *        Component; `!component.empty()`.
   * @return See above.
   */
  static Component_key component_key(const Component& component);

  /**
   * Normalized version of given component name: upper-cased.
   *
   * @param name
   *        Source name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  // Data.

  /// Most verbose severity that passes the filter for components without their own setting.
  std::atomic<raw_sev_t> m_verbosity_default;

  /// Per-component verbosities.
  boost::unordered_map<Component_key, Sev> m_verbosities_by_component;

  /// Per-component output names, already normalized and prefixed.
  boost::unordered_map<Component_key, std::string> m_component_names;

  /// Reverse of #m_component_names, for configure_component_verbosity_by_name().
  boost::unordered_map<std::string, Component_key> m_component_keys_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_names(const boost::unordered_map<Component_payload, std::string>& component_names,
                                  util::String_view payload_type_prefix_or_empty)
{
  using std::string;

  const string prefix_normalized(normalized_component_name(payload_type_prefix_or_empty));

  for (const auto& enum_val_and_name : component_names)
  {
    assert(!enum_val_and_name.second.empty()); // Advertised as not allowed.

    string name_normalized(prefix_normalized);
    name_normalized += normalized_component_name(enum_val_and_name.second);

    const auto key = component_key(Component(enum_val_and_name.first));
    assert(!util::key_exists(m_component_keys_by_name, name_normalized));

    m_component_keys_by_name.emplace(name_normalized, key);
    m_component_names[key] = std::move(name_normalized);
  }
} // Config::init_component_names()

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  m_verbosities_by_component[component_key(Component(component_payload))] = most_verbose_sev;
}

} // namespace crux::log
