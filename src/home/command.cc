/* ========================================================================== *
 *
 * @file home/command.cc
 *
 * @brief The `nh home` command.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <iostream>

#include <argparse/argparse.hpp>

#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/home/command.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

namespace nh::home {

/* -------------------------------------------------------------------------- */

void
HomeCommand::addRebuildArgs( command::VerboseParser & parser )
{
  this->addInstallableArgs( parser );
  this->addCommonArgs( parser );
  this->addConfigurationArg( parser );
  this->addSpecialisationArgs( parser );
  this->addBackupExtensionArg( parser );
}


HomeCommand::HomeCommand()
  : parser( "home" ), pSwitch( "switch" ), pBuild( "build" ), pRepl( "repl" )
{
  this->parser.add_description( "Manage a Home-Manager configuration" );

  this->pSwitch.add_description( "Build and activate the configuration" );
  this->addRebuildArgs( this->pSwitch );
  this->parser.add_subparser( this->pSwitch );

  this->pBuild.add_description( "Build the configuration" );
  this->addRebuildArgs( this->pBuild );
  this->parser.add_subparser( this->pBuild );

  this->pRepl.add_description( "Open `nix repl' on the configuration" );
  this->addInstallableArgs( this->pRepl );
  this->addConfigurationArg( this->pRepl );
  this->parser.add_subparser( this->pRepl );
}


/* -------------------------------------------------------------------------- */

int
HomeCommand::runRebuild( command::CommandRunner & runner,
                         rebuild_variant          variant )
{
  const Context & ctx = runner.getContext();
  if ( variant == RV_BUILD ) { this->ignoreDryAndAsk( "nh home build" ); }

  RebuildRequest request
    = this->toRebuildRequest( PLATFORM_HOME,
                              variant,
                              this->getInstallable( ctx, ENV_HOME_FLAKE ) );
  /* Home-Manager activates as the invoking user. */
  request.elevate = false;

  RebuildOrchestrator orchestrator( runner,
                                    PlatformLayout::home( ctx ),
                                    makeEvalProbe( runner, this->extraArgs ),
                                    defaultPrompt );
  orchestrator.run( request );
  return EXIT_SUCCESS;
}


int
HomeCommand::runRepl( command::CommandRunner & runner )
{
  nh::runRepl( runner,
               this->getInstallable( runner.getContext(), ENV_HOME_FLAKE ),
               "homeConfigurations",
               this->configName,
               makeEvalProbe( runner, this->extraArgs ),
               this->extraArgs );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
HomeCommand::run( command::CommandRunner & runner )
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
  throw NhException( "You must provide a valid `home' subcommand" );
  return EXIT_FAILURE;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::home


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
