/* ========================================================================== *
 *
 * @file darwin/command.cc
 *
 * @brief The `nh darwin` command.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <iostream>

#include <argparse/argparse.hpp>

#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/core/util.hh"
#include "nh/darwin/command.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

namespace nh::darwin {

/* -------------------------------------------------------------------------- */

void
DarwinCommand::addRebuildArgs( command::VerboseParser & parser )
{
  this->addInstallableArgs( parser );
  this->addCommonArgs( parser );
  this->addHostnameArg( parser );
  this->addBypassRootCheckArg( parser );
}


DarwinCommand::DarwinCommand()
  : parser( "darwin" ), pSwitch( "switch" ), pBuild( "build" ), pRepl( "repl" )
{
  this->parser.add_description( "Manage a nix-darwin system" );

  this->pSwitch.add_description(
    "Build, activate, and make the configuration the system profile" );
  this->addRebuildArgs( this->pSwitch );
  this->parser.add_subparser( this->pSwitch );

  this->pBuild.add_description( "Build the configuration" );
  this->addRebuildArgs( this->pBuild );
  this->parser.add_subparser( this->pBuild );

  this->pRepl.add_description( "Open `nix repl' on the configuration" );
  this->addInstallableArgs( this->pRepl );
  this->addHostnameArg( this->pRepl );
  this->parser.add_subparser( this->pRepl );
}


/* -------------------------------------------------------------------------- */

int
DarwinCommand::runRebuild( command::CommandRunner & runner,
                           rebuild_variant          variant )
{
  const Context & ctx = runner.getContext();
  if ( ctx.hostOs != HOST_DARWIN )
    {
      warningLog( "`nh darwin' is meant to be run on macOS" );
    }
  if ( variant == RV_BUILD ) { this->ignoreDryAndAsk( "nh darwin build" ); }

  RebuildRequest request
    = this->toRebuildRequest( PLATFORM_DARWIN,
                              variant,
                              this->getInstallable( ctx, ENV_DARWIN_FLAKE ) );
  request.elevate = ( variant == RV_BUILD )
                      ? false
                      : checkNotRoot( this->bypassRootCheck, ctx );

  RebuildOrchestrator orchestrator( runner,
                                    PlatformLayout::darwin(),
                                    makeEvalProbe( runner, this->extraArgs ),
                                    defaultPrompt );
  orchestrator.run( request );
  return EXIT_SUCCESS;
}


int
DarwinCommand::runRepl( command::CommandRunner & runner )
{
  const Context & ctx = runner.getContext();
  nh::runRepl( runner,
               this->getInstallable( ctx, ENV_DARWIN_FLAKE ),
               "darwinConfigurations",
               resolveTargetHostname( this->configName, ctx ).name,
               makeEvalProbe( runner, this->extraArgs ),
               this->extraArgs );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
DarwinCommand::run( command::CommandRunner & runner )
{
  if ( this->parser.is_subcommand_used( "switch" ) )
    {
      return this->runRebuild( runner, RV_SWITCH );
    }
  if ( this->parser.is_subcommand_used( "build" ) )
    {
      return this->runRebuild( runner, RV_BUILD );
    }
  if ( this->parser.is_subcommand_used( "repl" ) )
    {
      return this->runRepl( runner );
    }
  std::cerr << this->parser << std::endl;
  throw NhException( "You must provide a valid `darwin' subcommand" );
  return EXIT_FAILURE;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::darwin


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
