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

#include "crux/core/core_fwd.hpp"
#include "crux/reactor/reactor_fwd.hpp"
#include <memory>
#include <type_traits>
#include <utility>

namespace crux::core
{

// Types.

/**
 * A call-once unit of work to be run on the loop thread, with access to the core::Core and reactor::Event_loop:
 * the thing one sends through a reactor::Channel to make the loop do something on another thread's behalf.
 *
 * It can be made from any callable `F` such that `F(Core*, reactor::Event_loop*)` is valid, including one that
 * is move-only (e.g., a lambda capturing a `std::unique_ptr`), which `std::function` cannot hold.  The Closure
 * is itself move-only.
 *
 * Invoking it consumes the payload, then runs it: the callable is moved out of `*this` before it is called, so
 * it runs at most once even if it invokes `*this` again.  Invoking an empty() Closure (default-constructed,
 * moved-from, or already invoked) does nothing.
 *
 * ### Thread safety ###
 * Whatever the callable captures is moved to the loop thread along with the Closure.  Closure itself adds no
 * synchronization; the captures must be safe to use from the loop thread.  (Ownership moves with the Closure,
 * so captured-by-value data typically are.)
 */
class Closure
{
public:
  // Constructors/destructor.

  /// Constructs an empty() Closure.
  Closure();

  /**
   * Constructs a Closure that will invoke `func` (moved or copied in).  Implicit, so that a lambda can be passed
   * where a Closure is expected.
   *
   * @tparam Func
   *         Callable; see class doc header.
   * @param func
   *        The callable.
   */
  template<typename Func,
           typename = std::enable_if_t<!std::is_same_v<std::decay_t<Func>, Closure>>>
  Closure(Func&& func);

  /**
   * Move-constructs from `src`, which becomes empty().
   *
   * @param src
   *        Source.
   */
  Closure(Closure&& src);

  /// Destroys the payload, if any, without invoking it.
  ~Closure();

  // Methods.

  /**
   * Move-assigns from `src`, which becomes empty().  Any payload `*this` had is destroyed without being invoked.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Closure& operator=(Closure&& src);

  /// Disallow copying.
  Closure(const Closure&) = delete;

  /// Disallow copying.
  Closure& operator=(const Closure&) = delete;

  /**
   * If not empty(), consumes the payload (empty() becomes `true`) and invokes it; otherwise does nothing.
   *
   * @param core
   *        Passed to the callable.
   * @param event_loop
   *        Passed to the callable.
   */
  void operator()(Core* core, reactor::Event_loop* event_loop);

  /**
   * Returns `true` if there is no payload to invoke.
   * @return See above.
   */
  bool empty() const;

private:
  // Types.

  /// Type-erased payload.
  class Payload_base
  {
  public:
    // Constructors/destructor.

    /// Boring virtual destructor.
    virtual ~Payload_base();

    // Methods.

    /**
     * Invokes the held callable.  Called at most once.
     *
     * @param core
     *        See Closure::operator()().
     * @param event_loop
     *        See Closure::operator()().
     */
    virtual void run(Core* core, reactor::Event_loop* event_loop) = 0;
  }; // class Payload_base

  /**
   * Payload_base implementation holding a `Func`.
   *
   * @tparam Func
   *         See Closure::Closure().
   */
  template<typename Func>
  class Payload :
    public Payload_base
  {
  public:
    /**
     * Constructs the payload.
     *
     * @tparam Func_arg
     *         `Func` or a reference to it.
     * @param func
     *        Callable, moved or copied in.
     */
    template<typename Func_arg>
    explicit Payload(Func_arg&& func);

    /**
     * Invokes #m_func as an rvalue.
     *
     * @param core
     *        See Closure::operator()().
     * @param event_loop
     *        See Closure::operator()().
     */
    void run(Core* core, reactor::Event_loop* event_loop) override;

  private:
    /// The callable.
    Func m_func;
  }; // class Payload

  // Data.

  /// The payload; null if empty().
  std::unique_ptr<Payload_base> m_payload;
}; // class Closure

// Template implementations.

template<typename Func, typename>
Closure::Closure(Func&& func) :
  m_payload(std::make_unique<Payload<std::decay_t<Func>>>(std::forward<Func>(func)))
{
  static_assert(std::is_invocable_v<std::decay_t<Func>&&, Core*, reactor::Event_loop*>,
                "Closure payload must be callable as F(Core*, reactor::Event_loop*).");
}

template<typename Func>
template<typename Func_arg>
Closure::Payload<Func>::Payload(Func_arg&& func) :
  m_func(std::forward<Func_arg>(func))
{
  // Nothing else.
}

template<typename Func>
void Closure::Payload<Func>::run(Core* core, reactor::Event_loop* event_loop) // Virtual.
{
  std::move(m_func)(core, event_loop);
}

} // namespace crux::core
