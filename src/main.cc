/* ========================================================================== *
 *
 * @file main.cc
 *
 * @brief Executable building and activating NixOS, Home-Manager and
 *        nix-darwin configurations.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>

#include <nix/error.hh>
#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "nh/command/elevation.hh"
#include "nh/command/executor.hh"
#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/core/command.hh"
#include "nh/core/exceptions.hh"
#include "nh/core/logging.hh"
#include "nh/core/util.hh"
#include "nh/darwin/command.hh"
#include "nh/home/command.hh"
#include "nh/os/command.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

#ifndef NH_VERSION
#  error "NH_VERSION must be set"
#endif

/* -------------------------------------------------------------------------- */

/**
 * @class CaughtException
 * @brief An exception thrown when an otherwise unhandled exception is caught.
 *        This ensures proper JSON formatting.
 * @{
 */
NH_DEFINE_EXCEPTION( CaughtException,
                     EC_FAILURE,
                     "caught an unhandled exception" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @class NixException
 * @brief An exception thrown when an otherwise unhandled Nix exception is
 *        caught. This ensures proper JSON formatting.
 * @{
 */
NH_DEFINE_EXCEPTION( NixException, EC_NIX, "caught a nix exception" )
/** @} */


/* -------------------------------------------------------------------------- */

}  // namespace nh

/* -------------------------------------------------------------------------- */

void
setVerbosityFromEnv()
{
  auto * valueChars = std::getenv( "_NH_VERBOSITY" );
  if ( valueChars == nullptr ) { return; }
  std::string value( valueChars );
  if ( value == std::string( "0" ) ) { nix::verbosity = nix::lvlError; }
  else if ( value == std::string( "1" ) ) { nix::verbosity = nix::lvlInfo; }
  else if ( value == std::string( "2" ) ) { nix::verbosity = nix::lvlDebug; }
  else if ( value == std::string( "3" ) ) { nix::verbosity = nix::lvlChatty; }
  else if ( value == std::string( "4" ) ) { nix::verbosity = nix::lvlVomit; }
  // Put this at the end so that if we *want* logging it will show up
  traceLog( "found _NH_VERBOSITY=" + value );
}


/* -------------------------------------------------------------------------- */

int
run( int argc, char * argv[] )
{
  /* Everything after `--' belongs to `nix'. */
  nh::command::SplitArgs split = nh::command::splitTrailingArgs( argc, argv );

  /* Define arg parsers. */

  nh::command::VerboseParser prog( "nh", NH_VERSION );
  prog.add_description(
    "Build and activate NixOS, Home-Manager and nix-darwin configurations" );

  nh::os::OsCommand cmdOs;
  prog.add_subparser( cmdOs.getParser() );

  nh::home::HomeCommand cmdHome;
  prog.add_subparser( cmdHome.getParser() );

  nh::darwin::DarwinCommand cmdDarwin;
  prog.add_subparser( cmdDarwin.getParser() );

  /* Parse Args */
  try
    {
      prog.parse_args( split.args );
    }
  catch ( const std::runtime_error & err )
    {
      throw nh::command::InvalidArgException( err.what() );
    }

  /* Set the verbosity level requested by the caller */
  setVerbosityFromEnv();

  // We wait to init here so we have verbosity.
  nh::initNix();

  nh::Context                  ctx = nh::Context::fromEnvironment();
  nh::command::ProcessExecutor executor;
  auto elevation = nh::command::makeElevationStrategy( ctx, executor );
  nh::command::CommandRunner runner( ctx, executor, *elevation );

  /* Run subcommand */
  if ( prog.is_subcommand_used( cmdOs.getParser() ) )
    {
      cmdOs.setExtraArgs( split.trailing );
      return cmdOs.run( runner );
    }
  if ( prog.is_subcommand_used( cmdHome.getParser() ) )
    {
      cmdHome.setExtraArgs( split.trailing );
      return cmdHome.run( runner );
    }
  if ( prog.is_subcommand_used( cmdDarwin.getParser() ) )
    {
      cmdDarwin.setExtraArgs( split.trailing );
      return cmdDarwin.run( runner );
    }

  std::cerr << prog << std::endl;
  throw nh::NhException( "You must provide a valid subcommand" );
}

/* -------------------------------------------------------------------------- */
int
printAndReturnException( const nh::NhException & err )
{
  if ( isatty( STDOUT_FILENO ) == 0 )
    {
      std::cout << nlohmann::json( err ).dump() << '\n';
    }
  else { std::cerr << err.what() << '\n'; }

  return err.getErrorCode();
}

/* -------------------------------------------------------------------------- */

int
main( int argc, char * argv[] )
{
  /* Allows you to run without catching which is useful for
   * `gdb'/`lldb' backtraces. */
  auto * maybeNC = std::getenv( "NH_NO_CATCH" );
  if ( ( maybeNC != nullptr ) && ( maybeNC != std::string( "" ) )
       && ( maybeNC != std::string( "0" ) ) )
    {
      return run( argc, argv );
    }

  /* Wrap all execution in an error handler that pretty prints exceptions. */
  int exit_code = 0;
  try
    {
      exit_code = run( argc, argv );
    }
  catch ( const nh::NhException & err )
    {
      exit_code = printAndReturnException( err );
    }
  catch ( const nix::Error & err )
    {
      exit_code = printAndReturnException(
        nh::NixException( "running nh subcommand",
                          nix::filterANSIEscapes( err.what(), true ) ) );
    }
  catch ( const std::exception & err )
    {
      exit_code = printAndReturnException(
        nh::CaughtException( "running nh subcommand", err.what() ) );
    }

  return exit_code;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
