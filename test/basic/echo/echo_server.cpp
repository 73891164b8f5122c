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


#include "crux/reactor/event_loop.hpp"
#include "crux/core/core.hpp"
#include "crux/core/state.hpp"
#include "crux/error/error.hpp"
#include "crux/log/config.hpp"
#include "crux/log/simple_ostream_logger.hpp"
#include <boost/program_options.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/make_shared.hpp>
#include <boost/array.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <iostream>

/* This simple program is a Crux-based TCP echo server.
 *   <executable> --port <TCP port> [--idle-timeout-ms <ms>] [--log-sev <severity>] [event loop options...]
 * It listens on all interfaces.  Everything runs in one thread: a listener state accepts connections, and each
 * connection is a state of its own, echoing back whatever it receives until the peer closes, an error occurs, or
 * nothing has been received for the idle timeout.  SIGINT/SIGTERM stop the server.
 *
 * It uses nothing but the public Crux API plus raw POSIX sockets, so it is a decent example of how protocol logic
 * sits on top of core::Core and reactor::Event_loop. */

namespace
{

using crux::core::Core;
using crux::core::Token;
using crux::core::Context;
using crux::reactor::Event_loop;
using crux::reactor::Event_set;
using crux::reactor::Timeout;
using crux::Error_code;
using crux::Fine_duration;

/// Returns the current `errno` as an Error_code.
Error_code errno_code()
{
  return Error_code(errno, boost::system::system_category());
}

/// One accepted connection.  Owns its descriptor.
class Connection_state :
  public crux::core::State,
  public crux::log::Log_context,
  public boost::enable_shared_from_this<Connection_state>
{
public:
  explicit Connection_state(crux::log::Logger* logger_ptr, int fd, Context context, Token io_token,
                            Token timer_token, const Fine_duration& idle_timeout) :
    crux::log::Log_context(logger_ptr, crux::Crux_log_component::S_UNCAT),
    m_fd(fd),
    m_context(context),
    m_io_token(io_token),
    m_timer_token(timer_token),
    m_idle_timeout(idle_timeout)
  {
    // Nothing else.
  }

  ~Connection_state()
  {
    if (m_fd != -1)
    {
      ::close(m_fd);
    }
  }

  /// Binds us into `core` and starts watching the descriptor and the idle timer.
  void start(Core* core, Event_loop* event_loop)
  {
    core->bind_state(m_context, shared_from_this());
    core->bind_token(m_io_token, m_context);
    core->bind_token(m_timer_token, m_context);

    Error_code err_code;
    event_loop->register_descriptor(m_fd, m_io_token, Event_set::S_READABLE, &err_code);
    if (err_code)
    {
      core->terminate_state(event_loop, m_context);
      return;
    }
    // else
    if (!restart_idle_timer(event_loop))
    {
      core->terminate_state(event_loop, m_context);
    }
  }

  void on_ready(Core* core, Event_loop* event_loop, Token, Event_set events) override
  {
    if (events.contains(Event_set::S_ERROR))
    {
      CRUX_LOG_WARNING("Connection [" << m_context << "]: wait failed; closing.");
      core->terminate_state(event_loop, m_context);
      return;
    }
    // else

    if (events.contains(Event_set::S_READABLE) && (!receive(event_loop)))
    {
      core->terminate_state(event_loop, m_context);
      return;
    }
    // else
    if (!flush(event_loop))
    {
      core->terminate_state(event_loop, m_context);
    }
  }

  void on_timeout(Core* core, Event_loop* event_loop, Token) override
  {
    m_timeout = Timeout();
    CRUX_LOG_INFO("Connection [" << m_context << "]: idle for too long; closing.");
    core->terminate_state(event_loop, m_context);
  }

  void on_terminate(Core* core, Event_loop* event_loop) override
  {
    Error_code err_code;
    event_loop->deregister_descriptor(m_io_token, &err_code); // May not be registered; fine.
    if (m_timeout != Timeout())
    {
      event_loop->clear_timeout(m_timeout);
      m_timeout = Timeout();
    }

    core->unbind_token(m_io_token);
    core->unbind_token(m_timer_token);
    core->unbind_state(m_context); // Core keeps us alive until this call returns.

    ::close(m_fd);
    m_fd = -1;
    CRUX_LOG_INFO("Connection [" << m_context << "] closed; [" << m_n_echoed << "] bytes echoed.");
  }

private:
  /// Reads what is available into #m_outbox.  Returns `false` if the connection is done.
  bool receive(Event_loop* event_loop)
  {
    boost::array<char, 4096> buf;
    const auto n_read = ::read(m_fd, buf.data(), buf.size());
    if (n_read > 0)
    {
      m_outbox.append(buf.data(), size_t(n_read));
      return restart_idle_timer(event_loop);
    }
    // else
    if (n_read == 0)
    {
      CRUX_LOG_INFO("Connection [" << m_context << "]: peer closed.");
      return false;
    }
    // else
    if ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR))
    {
      return true; // Spurious readiness.
    }
    // else
    const Error_code sys_err_code = errno_code();
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    return false;
  }

  /// Writes as much of #m_outbox as possible; watches writability while some remains.  `false` on error.
  bool flush(Event_loop* event_loop)
  {
    while (!m_outbox.empty())
    {
      const auto n_written = ::send(m_fd, m_outbox.data(), m_outbox.size(), MSG_NOSIGNAL);
      if (n_written < 0)
      {
        if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
        {
          break;
        }
        // else
        if (errno == EINTR)
        {
          continue;
        }
        // else
        const Error_code sys_err_code = errno_code();
        CRUX_ERROR_SYS_ERROR_LOG_WARNING();
        return false;
      }
      // else
      m_outbox.erase(0, size_t(n_written));
      m_n_echoed += size_t(n_written);
    }

    const bool want_write = !m_outbox.empty();
    if (want_write != m_watching_write)
    {
      Error_code err_code;
      event_loop->reregister_descriptor(m_io_token,
                                        want_write ? (Event_set::S_READABLE | Event_set::S_WRITABLE)
                                                   : Event_set::S_READABLE,
                                        &err_code);
      if (err_code)
      {
        return false;
      }
      // else
      m_watching_write = want_write;
    }
    return true;
  } // flush()

  /// (Re)arms the idle timeout.  Returns `false` if it could not be armed; the connection should then close.
  bool restart_idle_timer(Event_loop* event_loop)
  {
    if (m_timeout != Timeout())
    {
      event_loop->clear_timeout(m_timeout);
      m_timeout = Timeout();
    }

    Error_code sys_err_code;
    m_timeout = event_loop->timeout(m_timer_token, m_idle_timeout, &sys_err_code);
    if (sys_err_code)
    {
      CRUX_LOG_WARNING("Connection [" << m_context << "]: cannot arm idle timeout; closing.");
      CRUX_ERROR_SYS_ERROR_LOG_WARNING();
      return false;
    }
    // else
    return true;
  }

  int m_fd;
  const Context m_context;
  const Token m_io_token;
  const Token m_timer_token;
  const Fine_duration m_idle_timeout;
  Timeout m_timeout;
  std::string m_outbox;
  bool m_watching_write = false;
  size_t m_n_echoed = 0;
}; // class Connection_state

/// The listening socket.  Owns its descriptor.
class Listener_state :
  public crux::core::State,
  public crux::log::Log_context
{
public:
  explicit Listener_state(crux::log::Logger* logger_ptr, int fd, const Fine_duration& idle_timeout) :
    crux::log::Log_context(logger_ptr, crux::Crux_log_component::S_UNCAT),
    m_fd(fd),
    m_idle_timeout(idle_timeout)
  {
    // Nothing else.
  }

  ~Listener_state()
  {
    ::close(m_fd);
  }

  void on_ready(Core* core, Event_loop* event_loop, Token, Event_set events) override
  {
    if (events.contains(Event_set::S_ERROR))
    {
      CRUX_LOG_WARNING("Listening socket wait failed; stopping.");
      event_loop->shutdown();
      return;
    }
    // else

    for ( ; ; )
    {
      const int fd = ::accept4(m_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
      if (fd == -1)
      {
        if ((errno != EAGAIN) && (errno != EWOULDBLOCK) && (errno != EINTR))
        {
          const Error_code sys_err_code = errno_code();
          CRUX_ERROR_SYS_ERROR_LOG_WARNING();
        }
        return;
      }
      // else

      const Context context = core->next_context();
      const auto conn = boost::make_shared<Connection_state>(get_logger(), fd, context, core->next_token(),
                                                             core->next_token(), m_idle_timeout);
      CRUX_LOG_INFO("Accepted connection [" << context << "].");
      conn->start(core, event_loop);
    }
  }

  void on_timeout(Core*, Event_loop*, Token) override {}
  void on_terminate(Core*, Event_loop*) override {}

private:
  const int m_fd;
  const Fine_duration m_idle_timeout;
}; // class Listener_state

} // Anonymous namespace

// Logs to cout and cerr through Crux logging; the program body is in main().
class Main :
  public crux::log::Log_context,
  private boost::noncopyable
{
public:
  // Boring constructor.
  explicit Main();
  // The program body.  Forward `int main()` here.
  int main(int argc, const char** argv);

private:
  // Helper: opens a non-blocking TCP socket listening on all interfaces at `port`.
  int listen_on(unsigned short port);

  // The logger for our console output.
  crux::log::Config m_std_log_config;
  crux::log::Simple_ostream_logger m_logger;
};

int main(int argc, const char** argv)
{
  Main prog;
  return prog.main(argc, argv);
}

Main::Main() :
  Log_context(&m_logger, crux::Crux_log_component::S_UNCAT),
  m_logger(&m_std_log_config)
{
  m_std_log_config.init_component_names<crux::Crux_log_component>(crux::S_CRUX_LOG_COMPONENT_NAME_MAP, "echo-");

  crux::log::Logger::this_thread_set_logged_nickname("echo_srv_main", get_logger());
}

int Main::main(int argc, const char** argv)
{
  using crux::log::Sev;
  using crux::reactor::Event_loop_options;
  using crux::error::Runtime_error;
  using boost::chrono::milliseconds;
  namespace opts = boost::program_options;

  const int BAD_EXIT = 1;

  unsigned short port = 0;
  unsigned int idle_timeout_ms = 0;
  Sev log_sev = Sev::S_INFO;
  Event_loop_options loop_opts;
  loop_opts.m_st_capture_interrupt_signals_internally = true; // Be reasonably graceful on SIGINT/SIGTERM.

  opts::options_description opts_desc("Echo server options");
  opts_desc.add_options()
    ("help", "Print this and exit.")
    ("port", opts::value<unsigned short>(&port)->required(), "TCP port on which to listen.")
    ("idle-timeout-ms", opts::value<unsigned int>(&idle_timeout_ms)->default_value(30000),
     "Close a connection after receiving nothing for this long.")
    ("log-sev", opts::value<Sev>(&log_sev)->default_value(Sev::S_INFO),
     "Most verbose severity logged (e.g., warning, info, trace).");
  Event_loop_options::Options_description loop_opts_desc("Event loop options");
  loop_opts.setup_config_parsing(&loop_opts_desc);
  opts_desc.add(loop_opts_desc);

  try
  {
    opts::variables_map vars;
    opts::store(opts::parse_command_line(argc, argv, opts_desc), vars);
    if (vars.count("help") != 0)
    {
      std::cout << opts_desc << '\n';
      return 0;
    }
    // else
    opts::notify(vars);
  }
  catch (const opts::error& exc)
  {
    CRUX_LOG_WARNING("Bad command line: [" << exc.what() << "].  Usage:\n" << opts_desc);
    return BAD_EXIT;
  }

  m_std_log_config.configure_default_verbosity(log_sev, true);

  // For simplicity, choose the exception-throwing error handling.  Do not pass in &Error_code.
  try
  {
    // Declared before the loop, so the loop (and its references to descriptors) goes away first.
    Core core(get_logger());
    Event_loop event_loop(get_logger(), 0, loop_opts);

    const int listen_fd = listen_on(port);
    const auto listener = boost::make_shared<Listener_state>(get_logger(), listen_fd, milliseconds(idle_timeout_ms));
    const Context listener_context = core.next_context();
    const Token listener_token = core.next_token();
    core.bind_state(listener_context, listener);
    core.bind_token(listener_token, listener_context);

    // The Listener_state owns the descriptor from here on.
    event_loop.register_descriptor(listen_fd, listener_token, Event_set::S_READABLE);

    CRUX_LOG_INFO("Awaiting incoming connections on port [" << port << "].");
    event_loop.run(&core);

    CRUX_LOG_INFO("Done; closing [" << (core.registry().n_states() - 1) << "] remaining connections.");
  }
  catch (const Runtime_error& exc)
  {
    CRUX_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // Main::main()

int Main::listen_on(unsigned short port)
{
  using crux::error::Runtime_error;

  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd == -1)
  {
    throw Runtime_error(errno_code(), CRUX_UTIL_WHERE_AM_I_STR());
  }
  // else

  const int one = 1;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);

  if ((::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one) == -1)
      || (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof addr) == -1)
      || (::listen(fd, SOMAXCONN) == -1))
  {
    const Error_code sys_err_code = errno_code();
    ::close(fd);
    CRUX_ERROR_SYS_ERROR_LOG_WARNING();
    throw Runtime_error(sys_err_code, CRUX_UTIL_WHERE_AM_I_STR());
  }
  // else
  return fd;
} // Main::listen_on()
