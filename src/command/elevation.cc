/* ========================================================================== *
 *
 * @file command/elevation.cc
 *
 * @brief Construct `sudo` wrappers for commands which need root.
 *
 *
 * -------------------------------------------------------------------------- */

#include <memory>
#include <string>

#include <nix/error.hh>

#include "nh/command/elevation.hh"
#include "nh/command/executor.hh"
#include "nh/context.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

/** @brief Append `[-A] [env K=V ...]`. */
static void
appendCommon( Args & prefix, const ElevationRequest & request )
{
  if ( request.askpass ) { prefix.emplace_back( "-A" ); }
  if ( ! request.set.empty() )
    {
      prefix.emplace_back( "env" );
      for ( const auto & [name, value] : request.set )
        {
          prefix.emplace_back( name + "=" + value );
        }
    }
}


/* -------------------------------------------------------------------------- */

Args
LinuxElevation::buildPrefix( const ElevationRequest & request ) const
{
  Args prefix = { "sudo" };
  if ( ! request.preserve.empty() )
    {
      prefix.emplace_back( "--preserve-env="
                           + concatStringsSep( ",", request.preserve ) );
    }
  appendCommon( prefix, request );
  return prefix;
}


/* -------------------------------------------------------------------------- */

Args
DarwinElevation::buildPrefix( const ElevationRequest & request ) const
{
  Args prefix = { "sudo", "--set-home" };
  if ( this->supportsPreserveEnv && ( ! request.preserve.empty() ) )
    {
      prefix.emplace_back( "--preserve-env="
                           + concatStringsSep( ",", request.preserve ) );
    }
  appendCommon( prefix, request );
  return prefix;
}


/* -------------------------------------------------------------------------- */

std::unique_ptr<ElevationStrategy>
makeElevationStrategy( const Context & ctx, Executor & executor )
{
  if ( ctx.hostOs == HOST_LINUX ) { return std::make_unique<LinuxElevation>(); }

  bool supportsPreserveEnv = false;
  try
    {
      ExecResult help = executor.execute( Invocation { "sudo", { "--help" } },
                                          true );
      supportsPreserveEnv
        = help.output.find( "--preserve-env" ) != std::string::npos;
    }
  catch ( const nix::Error & err )
    {
      debugLog( nix::fmt( "failed to probe `sudo --help': %s", err.what() ) );
    }
  debugLog( nix::fmt( "sudo supports `--preserve-env': %s",
                      supportsPreserveEnv ? "yes" : "no" ) );
  return std::make_unique<DarwinElevation>( supportsPreserveEnv );
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
