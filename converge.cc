#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "converge.hh"

namespace {

  std::atomic< bool > g_cancel{ false };

  void on_signal( int ) { g_cancel = true; }

  const char* const USAGE =
    "usage: converge plan  --state <lockfile> <desired.yaml>\n"
    "       converge apply --state <lockfile> --stepper <helper> [--jobs N]\n"
    "                      [--stepper-timeout SECONDS] [--no-drift-check]\n"
    "                      [--log-level LEVEL] <desired.yaml>\n";

  struct CliArgs {
    std::string command;
    std::string state;
    std::string stepper;
    std::string document;
    std::size_t jobs = 1;
    std::chrono::milliseconds stepper_timeout =
      converge::DEFAULT_HELPER_TIMEOUT;
    bool detect_drift = true;
    std::string log_level = "info";
  };

  std::size_t parse_positive( const std::string& flag,
    const std::string& text )
  {
    std::size_t pos = 0;
    unsigned long n = 0;
    try {
      n = std::stoul( text, &pos );
    } catch ( const std::exception& ) {
      pos = 0;
    }
    if ( pos != text.size() || n == 0 ) {
      throw std::invalid_argument( flag + " expects a positive integer, got '"
        + text + "'" );
    }
    return static_cast< std::size_t >( n );
  }

  CliArgs parse_args( int argc, char** argv ) {
    std::vector< std::string > args( argv + 1, argv + argc );
    if ( args.empty() ) throw std::invalid_argument( "missing command" );

    CliArgs out;
    out.command = args[ 0 ];
    if ( out.command != "plan" && out.command != "apply" ) {
      throw std::invalid_argument( "unknown command '" + out.command + "'" );
    }

    for ( std::size_t i = 1; i < args.size(); ++i ) {
      const std::string& a = args[ i ];
      auto value = [&]() -> const std::string& {
        if ( i + 1 >= args.size() ) {
          throw std::invalid_argument( a + " expects a value" );
        }
        return args[ ++i ];
      };

      if ( a == "--state" ) out.state = value();
      else if ( a == "--stepper" ) out.stepper = value();
      else if ( a == "--jobs" ) out.jobs = parse_positive( a, value() );
      else if ( a == "--stepper-timeout" ) {
        out.stepper_timeout = std::chrono::seconds( parse_positive(a, value()) );
      }
      else if ( a == "--no-drift-check" ) out.detect_drift = false;
      else if ( a == "--log-level" ) out.log_level = value();
      else if ( a.size() > 1 && a[0] == '-' ) {
        throw std::invalid_argument( "unknown option '" + a + "'" );
      }
      else if ( out.document.empty() ) out.document = a;
      else throw std::invalid_argument( "unexpected argument '" + a + "'" );
    }

    if ( out.state.empty() ) throw std::invalid_argument( "--state is required" );
    if ( out.document.empty() ) {
      throw std::invalid_argument( "missing desired-state document" );
    }
    if ( out.command == "apply" && out.stepper.empty() ) {
      throw std::invalid_argument( "--stepper is required for apply" );
    }
    return out;
  }

  void setup_logging( const std::string& level ) {
    static const std::vector< std::string > known = {
      "trace", "debug", "info", "warning", "warn", "error", "critical", "off"
    };
    bool ok = false;
    for ( const auto& k : known ) ok = ok || ( k == level );
    if ( !ok ) {
      throw std::invalid_argument( "unknown log level '" + level + "'" );
    }

    // stdout carries the YAML result, so logs go to stderr
    auto logger = spdlog::stderr_color_mt( "converge" );
    spdlog::set_default_logger( logger );
    spdlog::set_level( spdlog::level::from_str(level) );
  }

  int run_plan( const CliArgs& args ) {
    converge::DocumentLoader loader;
    const auto desired = loader.load_file( args.document );
    converge::LockFileStore store( args.state );

    const auto plan = converge::plan( desired, store.load() );
    std::cout << converge::ordered_node::serialize(
      converge::plan_to_node(plan) );
    return 0;
  }

  int run_apply( const CliArgs& args ) {
    converge::DocumentLoader loader;
    const auto desired = loader.load_file( args.document );

    converge::LockFileStore store( args.state );
    converge::CommandStepper stepper( args.stepper, args.stepper_timeout );

    converge::ReconcilerOptions options;
    options.max_concurrency = args.jobs;
    options.detect_drift = args.detect_drift;
    options.cancel = &g_cancel;

    std::signal( SIGINT, on_signal );
    std::signal( SIGTERM, on_signal );

    converge::Reconciler reconciler( store, stepper, options );
    const converge::ReconciliationReport report = reconciler.run( desired );
    std::cout << converge::ordered_node::serialize(
      converge::report_to_node(report) );
    return report.has_errors() ? 2 : 0;
  }

} // anonymous namespace

int main( int argc, char** argv ) {
  CliArgs args;
  try {
    args = parse_args( argc, argv );
    setup_logging( args.log_level );
  } catch ( const std::exception& ex ) {
    std::cerr << "[converge] error: " << ex.what() << "\n" << USAGE;
    return 1;
  }

  try {
    if ( args.command == "plan" ) return run_plan( args );
    return run_apply( args );
  } catch (const std::exception& ex) {
    std::cerr << "[converge] error: " << ex.what() << "\n";
    return 1;
  }
}
