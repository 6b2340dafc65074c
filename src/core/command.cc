/* ========================================================================== *
 *
 * @file core/command.cc
 *
 * @brief Executable command helpers, argument parsers, etc.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <nix/logging.hh>

#include "nh/core/command.hh"
#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

VerboseParser::VerboseParser( const std::string & name,
                              const std::string & version )
  : argparse::ArgumentParser( name, version, argparse::default_arguments::help )
{
  this->add_argument( "-q", "--quiet" )
    .help( "decrease the logging verbosity level. May be used up to 3 times." )
    .action(
      [&]( const auto & )
      {
        nix::verbosity = ( nix::verbosity <= nix::lvlError )
                           ? nix::lvlError
                           : static_cast<nix::Verbosity>( nix::verbosity - 1 );
      } )
    .default_value( false )
    .implicit_value( true )
    .append();

  this->add_argument( "-v", "--verbose" )
    .help( "increase the logging verbosity level. May be used up to 4 times." )
    .action(
      [&]( const auto & )
      {
        nix::verbosity = ( nix::lvlVomit <= nix::verbosity )
                           ? nix::lvlVomit
                           : static_cast<nix::Verbosity>( nix::verbosity + 1 );
      } )
    .default_value( false )
    .implicit_value( true )
    .append();
}


/* -------------------------------------------------------------------------- */

SplitArgs
splitTrailingArgs( int argc, char * argv[] )
{
  SplitArgs rsl;
  bool      trailing = false;
  for ( int idx = 0; idx < argc; ++idx )
    {
      std::string arg( argv[idx] );
      if ( trailing ) { rsl.trailing.emplace_back( std::move( arg ) ); }
      else if ( arg == "--" ) { trailing = true; }
      else { rsl.args.emplace_back( std::move( arg ) ); }
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
