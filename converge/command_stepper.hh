// Stepper that delegates every call to an external helper program:
//
//   <helper> begin|remove|update-options|supports-options|exists <request>
//
// <request> is a temporary YAML file holding the call's arguments
// (platform, handle, answers or options). The helper prints one YAML
// mapping on stdout:
//
//   handle: <id>            begin
//   supported: true|false   supports-options
//   exists: true|false      exists
//   ok: true                remove, update-options
//
// or reports a failure with
//
//   error: validation|not_found|conflict|transient
//   message: <text>
//   field: <name>           validation only, optional
//   step: <index>           validation only, optional
//
// A non-zero exit status without a parseable error is a TransientError.
// A helper still running when the timeout expires is killed together with
// its process group, and the call fails with a TransientError.
#pragma once

// Standard library includes
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "converge/error.hh"
#include "converge/node.hh"
#include "converge/stepper.hh"
#include "converge/types.hh"

namespace converge {

  inline constexpr std::chrono::milliseconds DEFAULT_HELPER_TIMEOUT{ 60000 };

  class CommandStepper : public Stepper {
  public:
    // `timeout` bounds each helper call. `scratch_dir` receives the request
    // files; defaults to $TMPDIR or /tmp
    inline explicit CommandStepper( std::string helper,
      std::chrono::milliseconds timeout = DEFAULT_HELPER_TIMEOUT,
      std::string scratch_dir = std::string() )
      : helper_( std::move(helper) ), timeout_( timeout ),
      scratch_dir_( std::move(scratch_dir) )
    {}

    InstanceHandle begin( const std::string& platform,
      const Steps& answers ) override;
    void remove( const InstanceHandle& handle ) override;
    void update_options( const InstanceHandle& handle,
      const Steps& options ) override;
    bool supports_options( const InstanceHandle& handle ) override;
    bool instance_exists( const InstanceHandle& handle ) override;

  private:
    std::string helper_;
    std::chrono::milliseconds timeout_;
    std::string scratch_dir_;

    // Runs the helper and returns its response mapping. Helper-reported
    // errors are rethrown as the matching exception type.
    ordered_node invoke( const std::string& verb,
      const ordered_node& request ) const;
  };

namespace internal {

  inline const std::string HELPER_PLATFORM = "platform";
  inline const std::string HELPER_HANDLE = "handle";
  inline const std::string HELPER_ANSWERS = "answers";
  inline const std::string HELPER_OPTIONS = "options";
  inline const std::string HELPER_SUPPORTED = "supported";
  inline const std::string HELPER_EXISTS = "exists";
  inline const std::string HELPER_ERROR = "error";
  inline const std::string HELPER_MESSAGE = "message";
  inline const std::string HELPER_FIELD = "field";
  inline const std::string HELPER_STEP = "step";

  // Request file that is unlinked when it goes out of scope
  class ScratchFile {
  public:
    inline ScratchFile( const std::string& dir, const std::string& content ) {
      std::string base = dir;
      if ( base.empty() ) {
        const char* tmp = std::getenv( "TMPDIR" );
        base = ( tmp && *tmp ) ? tmp : "/tmp";
      }
      std::string templ = base + "/converge-request-XXXXXX";
      int fd = ::mkstemp( templ.data() );
      if ( fd < 0 ) {
        throw TransientError( "cannot create request file in '" + base
          + "': " + std::strerror(errno) );
      }
      path_ = templ;

      std::size_t written = 0;
      while ( written < content.size() ) {
        ssize_t n = ::write( fd, content.data() + written,
          content.size() - written );
        if ( n < 0 ) {
          if ( errno == EINTR ) continue;
          const std::string msg = "cannot write request file '" + path_
            + "': " + std::strerror( errno );
          ::close( fd );
          ::unlink( path_.c_str() );
          throw TransientError( msg );
        }
        written += static_cast< std::size_t >( n );
      }
      ::close( fd );
    }
    ScratchFile( const ScratchFile& ) = delete;
    ScratchFile& operator=( const ScratchFile& ) = delete;
    inline ~ScratchFile() { ::unlink( path_.c_str() ); }

    inline const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

  struct HelperRun {
    int status = -1; // exit status, or -1 if it did not exit normally
    bool timed_out = false;
    std::string output;
  };

  inline pid_t wait_child( pid_t pid, int* status, int flags ) {
    pid_t w;
    do {
      w = ::waitpid( pid, status, flags );
    } while ( w < 0 && errno == EINTR );
    return w;
  }

  // SIGTERM first, SIGKILL if the group is still around shortly after
  inline void kill_group( pid_t pid ) {
    int status = 0;
    ::killpg( pid, SIGTERM );
    for ( int i = 0; i < 20; ++i ) {
      if ( wait_child(pid, &status, WNOHANG) != 0 ) return;
      std::this_thread::sleep_for( std::chrono::milliseconds(5) );
    }
    ::killpg( pid, SIGKILL );
    wait_child( pid, &status, 0 );
  }

  // Run `argv` in its own process group and capture its stdout. The child
  // and everything it started are killed once `timeout` has passed.
  inline HelperRun run_helper( const std::vector< std::string >& argv,
    std::chrono::milliseconds timeout )
  {
    std::vector< char* > args;
    for ( const auto& a : argv ) {
      args.push_back( const_cast< char* >(a.c_str()) );
    }
    args.push_back( nullptr );

    // Close-on-exec, so helpers started by other workers do not hold the
    // write end open; dup2 clears the flag on the child's stdout
    int out_pipe[ 2 ];
    if ( ::pipe2(out_pipe, O_CLOEXEC) != 0 ) {
      throw TransientError( std::string("cannot create helper pipe: ")
        + std::strerror(errno) );
    }

    const pid_t pid = ::fork();
    if ( pid < 0 ) {
      const std::string msg = std::string( "cannot start helper: " )
        + std::strerror( errno );
      ::close( out_pipe[0] );
      ::close( out_pipe[1] );
      throw TransientError( msg );
    }
    if ( pid == 0 ) {
      ::setpgid( 0, 0 );
      ::dup2( out_pipe[1], STDOUT_FILENO );
      ::close( out_pipe[0] );
      ::close( out_pipe[1] );
      ::execv( args[0], args.data() );
      ::_exit( 127 );
    }
    // Mirrors the child's setpgid; fails harmlessly once the child has exec'd
    ::setpgid( pid, pid );
    ::close( out_pipe[1] );

    HelperRun run;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining = [&]() {
      return std::chrono::duration_cast< std::chrono::milliseconds >(
        deadline - std::chrono::steady_clock::now() ).count();
    };

    char buffer[ 4096 ];
    for (;;) {
      const auto left = remaining();
      if ( left <= 0 ) { run.timed_out = true; break; }

      struct pollfd pfd;
      pfd.fd = out_pipe[0];
      pfd.events = POLLIN;
      pfd.revents = 0;
      const int ready = ::poll( &pfd, 1, static_cast< int >(
        std::min< long long >(left, 100)) );
      if ( ready < 0 ) {
        if ( errno == EINTR ) continue;
        break;
      }
      if ( ready == 0 ) continue;

      const ssize_t n = ::read( out_pipe[0], buffer, sizeof(buffer) );
      if ( n > 0 ) run.output.append( buffer, static_cast< std::size_t >(n) );
      else if ( n == 0 ) break;
      else if ( errno != EINTR ) break;
    }
    ::close( out_pipe[0] );

    // The helper may close stdout and keep running
    int status = 0;
    while ( !run.timed_out ) {
      const pid_t w = wait_child( pid, &status, WNOHANG );
      if ( w == pid ) break;
      if ( w < 0 ) return run;
      if ( remaining() <= 0 ) { run.timed_out = true; break; }
      std::this_thread::sleep_for( std::chrono::milliseconds(5) );
    }
    if ( run.timed_out ) {
      kill_group( pid );
      return run;
    }

    if ( WIFEXITED(status) ) run.status = WEXITSTATUS( status );
    return run;
  }

  inline std::optional< std::string > response_string(
    const ordered_node& response, const std::string& key )
  {
    if ( !response.is_mapping() || !response.contains(key) ) {
      return std::nullopt;
    }
    const ordered_node& v = response.at( key );
    if ( !v.is_scalar() || v.is_null() ) return std::nullopt;
    return to_string_any( v );
  }

  inline std::optional< bool > response_bool( const ordered_node& response,
    const std::string& key )
  {
    if ( !response.is_mapping() || !response.contains(key) ) {
      return std::nullopt;
    }
    const ordered_node& v = response.at( key );
    if ( !v.is_boolean() ) return std::nullopt;
    return v.get_value< bool >();
  }

  [[noreturn]] inline void throw_helper_error( const ordered_node& response,
    const std::string& verb )
  {
    const std::string kind = response_string( response, HELPER_ERROR )
      .value_or( "transient" );
    const std::string message = response_string( response, HELPER_MESSAGE )
      .value_or( "helper reported " + kind + " error during " + verb );

    if ( kind == "validation" ) {
      // A negative step names no step
      std::optional< std::size_t > step;
      if ( response.contains(HELPER_STEP)
        && response.at(HELPER_STEP).is_integer() ) {
        const auto index = to_native_checked< std::int64_t >(
          response.at(HELPER_STEP) );
        if ( index >= 0 ) step = static_cast< std::size_t >( index );
      }
      throw ValidationError( message,
        response_string( response, HELPER_FIELD ).value_or( std::string() ),
        step );
    }
    if ( kind == "not_found" ) throw NotFoundError( message );
    if ( kind == "conflict" ) throw ConflictError( message );
    throw TransientError( message );
  }

} // namespace internal

} // namespace converge

// CommandStepper member function definitions

inline converge::ordered_node converge::CommandStepper::invoke(
  const std::string& verb, const ordered_node& request ) const
{
  internal::ScratchFile file( scratch_dir_,
    ordered_node::serialize(request) );

  spdlog::debug( "-> {} {} {}", helper_, verb, file.path() );
  const internal::HelperRun run = internal::run_helper(
    { helper_, verb, file.path() }, timeout_ );
  if ( run.timed_out ) {
    throw TransientError( "helper " + verb + " timed out after "
      + std::to_string(timeout_.count()) + " ms" );
  }

  const std::string& output = run.output;
  const int status = run.status;
  spdlog::debug( "<- [{}] {}", status, output );

  ordered_node response;
  if ( !internal::is_blank(output) ) {
    try {
      response = ordered_node::deserialize( output );
    } catch ( const fkyaml::exception& ex ) {
      if ( status != 0 ) {
        throw TransientError( "helper " + verb + " exited with status "
          + std::to_string(status) );
      }
      throw TransientError( "unreadable helper response to " + verb + ": "
        + ex.what() );
    }
  }

  if ( response.is_mapping() && response.contains(internal::HELPER_ERROR) ) {
    internal::throw_helper_error( response, verb );
  }
  if ( status != 0 ) {
    throw TransientError( "helper " + verb + " exited with status "
      + std::to_string(status) );
  }
  return response;
}

inline converge::InstanceHandle converge::CommandStepper::begin(
  const std::string& platform, const Steps& answers )
{
  ordered_node request = ordered_node::mapping();
  request[ internal::HELPER_PLATFORM ] = internal::make_node_from( platform );
  request[ internal::HELPER_ANSWERS ] = internal::steps_to_node( answers );

  ordered_node response = this->invoke( "begin", request );
  auto handle = internal::response_string( response,
    internal::HELPER_HANDLE );
  if ( !handle || handle->empty() ) {
    throw Error( "helper begin for platform " + platform
      + " returned no handle" );
  }
  return *handle;
}

inline void converge::CommandStepper::remove( const InstanceHandle& handle ) {
  ordered_node request = ordered_node::mapping();
  request[ internal::HELPER_HANDLE ] = internal::make_node_from( handle );
  this->invoke( "remove", request );
}

inline void converge::CommandStepper::update_options(
  const InstanceHandle& handle, const Steps& options )
{
  ordered_node request = ordered_node::mapping();
  request[ internal::HELPER_HANDLE ] = internal::make_node_from( handle );
  request[ internal::HELPER_OPTIONS ] = internal::steps_to_node( options );
  this->invoke( "update-options", request );
}

inline bool converge::CommandStepper::supports_options(
  const InstanceHandle& handle )
{
  ordered_node request = ordered_node::mapping();
  request[ internal::HELPER_HANDLE ] = internal::make_node_from( handle );

  ordered_node response = this->invoke( "supports-options", request );
  auto supported = internal::response_bool( response,
    internal::HELPER_SUPPORTED );
  if ( !supported ) {
    throw Error( "helper supports-options returned no 'supported' flag" );
  }
  return *supported;
}

// Helpers without drift support may answer with an empty mapping
inline bool converge::CommandStepper::instance_exists(
  const InstanceHandle& handle )
{
  ordered_node request = ordered_node::mapping();
  request[ internal::HELPER_HANDLE ] = internal::make_node_from( handle );

  ordered_node response = this->invoke( "exists", request );
  return internal::response_bool( response, internal::HELPER_EXISTS ).value_or( true );
}
