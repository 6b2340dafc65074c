/* ========================================================================== *
 *
 * @file os/command.cc
 *
 * @brief The `nh os` command.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/core/util.hh"
#include "nh/generations.hh"
#include "nh/os/command.hh"
#include "nh/rollback.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

namespace nh::os {

/* -------------------------------------------------------------------------- */

void
OsCommand::addRebuildArgs( command::VerboseParser & parser )
{
  this->addInstallableArgs( parser );
  this->addCommonArgs( parser );
  this->addHostnameArg( parser );
  this->addSpecialisationArgs( parser );
  this->addRemoteArgs( parser );
  this->addBypassRootCheckArg( parser );
}


OsCommand::OsCommand()
  : parser( "os" )
  , pSwitch( "switch" )
  , pBoot( "boot" )
  , pTest( "test" )
  , pBuild( "build" )
  , pBuildVm( "build-vm" )
  , pRepl( "repl" )
  , pRollback( "rollback" )
  , pInfo( "info" )
  , profile( "/nix/var/nix/profiles/system" )
{
  this->parser.add_description( "Manage a NixOS system" );

  this->pSwitch.add_description(
    "Build, activate, and make the configuration the boot default" );
  this->addRebuildArgs( this->pSwitch );
  this->parser.add_subparser( this->pSwitch );

  this->pBoot.add_description(
    "Build and make the configuration the boot default" );
  this->addRebuildArgs( this->pBoot );
  this->parser.add_subparser( this->pBoot );

  this->pTest.add_description( "Build and activate the configuration" );
  this->addRebuildArgs( this->pTest );
  this->parser.add_subparser( this->pTest );

  this->pBuild.add_description( "Build the configuration" );
  this->addRebuildArgs( this->pBuild );
  this->parser.add_subparser( this->pBuild );

  this->pBuildVm.add_description(
    "Build a virtual machine running the configuration" );
  this->addRebuildArgs( this->pBuildVm );
  this->addWithBootloaderArg( this->pBuildVm );
  this->parser.add_subparser( this->pBuildVm );

  this->pRepl.add_description( "Open `nix repl' on the configuration" );
  this->addInstallableArgs( this->pRepl );
  this->addHostnameArg( this->pRepl );
  this->parser.add_subparser( this->pRepl );

  this->pRollback.add_description(
    "Return to an earlier generation of the system profile" );
  this->pRollback.add_argument( "--to" )
    .help( "generation to roll back to, defaults to the previous one" )
    .metavar( "N" )
    .nargs( 1 )
    .action(
      [&]( const std::string & str )
      {
        std::optional<uint64_t> number = parseUInt( str );
        if ( ! number.has_value() )
          {
            throw command::InvalidArgException(
              "`--to' expects a generation number, got `" + str + "'" );
          }
        this->rollbackTo = number;
      } );
  this->pRollback.add_argument( "-n", "--dry" )
    .help( "show what would change without rolling back" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->dry = true; } );
  this->pRollback.add_argument( "-a", "--ask" )
    .help( "ask for confirmation before rolling back" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->ask = true; } );
  this->pRollback.add_argument( "--diff" )
    .help( "when to compare with the active configuration: "
           "`auto', `always' or `never'" )
    .metavar( "WHEN" )
    .nargs( 1 )
    .action( [&]( const std::string & str )
             { this->diff = parseDiffMode( str ); } );
  this->addSpecialisationArgs( this->pRollback );
  this->addBypassRootCheckArg( this->pRollback );
  this->parser.add_subparser( this->pRollback );

  this->pInfo.add_description( "List the generations of the system profile" );
  this->pInfo.add_argument( "--json" )
    .help( "print the generations as JSON" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->json = true; } );
  this->pInfo.add_argument( "-p", "--profile" )
    .help( "profile to list, defaults to the system profile" )
    .metavar( "PATH" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->profile = str; } );
  this->parser.add_subparser( this->pInfo );
}


/* -------------------------------------------------------------------------- */

/** @brief Find `<out>/bin/run-*-vm`. */
static std::optional<std::filesystem::path>
findVmScript( const std::filesystem::path & out )
{
  std::error_code err;
  for ( const auto & entry :
        std::filesystem::directory_iterator( out / "bin", err ) )
    {
      std::string name = entry.path().filename().string();
      if ( hasPrefix( "run-", name ) && hasSuffix( "-vm", name ) )
        {
          return entry.path();
        }
    }
  return std::nullopt;
}


int
OsCommand::runRebuild( command::CommandRunner & runner,
                       rebuild_variant          variant )
{
  const Context & ctx       = runner.getContext();
  bool            buildOnly = ( variant == RV_BUILD ) || ( variant == RV_BUILD_VM );

  if ( buildOnly )
    {
      this->ignoreDryAndAsk( ( variant == RV_BUILD ) ? "nh os build"
                                                     : "nh os build-vm" );
    }
  if ( ( variant == RV_BUILD_VM ) && ( ! this->outLink.has_value() ) )
    {
      this->outLink = "result";
    }

  RebuildRequest request
    = this->toRebuildRequest( PLATFORM_NIXOS,
                              variant,
                              this->getInstallable( ctx, ENV_OS_FLAKE ) );
  request.elevate
    = buildOnly ? false : checkNotRoot( this->bypassRootCheck, ctx );

  RebuildOrchestrator orchestrator( runner,
                                    PlatformLayout::nixos(),
                                    makeEvalProbe( runner, this->extraArgs ),
                                    defaultPrompt );
  orchestrator.run( request );

  if ( variant == RV_BUILD_VM )
    {
      std::optional<std::filesystem::path> script
        = findVmScript( *this->outLink );
      if ( script.has_value() )
        {
          infoLog( nix::fmt( "Done. The virtual machine can be started by "
                             "running `%s'",
                             script->string() ) );
        }
    }

  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
OsCommand::runRepl( command::CommandRunner & runner )
{
  const Context & ctx = runner.getContext();
  nh::runRepl( runner,
               this->getInstallable( ctx, ENV_OS_FLAKE ),
               "nixosConfigurations",
               resolveTargetHostname( this->configName, ctx ).name,
               makeEvalProbe( runner, this->extraArgs ),
               this->extraArgs );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
OsCommand::runRollback( command::CommandRunner & runner )
{
  RollbackRequest request;
  request.to               = this->rollbackTo;
  request.dry              = this->dry;
  request.ask              = this->ask;
  request.diff             = this->diff;
  request.specialisation   = this->specialisation;
  request.noSpecialisation = this->noSpecialisation;
  request.elevate
    = checkNotRoot( this->bypassRootCheck, runner.getContext() );

  RollbackOrchestrator orchestrator( runner,
                                     PlatformLayout::nixos(),
                                     defaultPrompt );
  orchestrator.run( request );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
OsCommand::runInfo()
{
  std::vector<GenerationInfo> generations = listGenerations( this->profile );
  if ( this->json )
    {
      nlohmann::json jto = generations;
      std::cout << jto.dump() << '\n';
    }
  else { printGenerations( std::cout, std::move( generations ) ); }
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
OsCommand::run( command::CommandRunner & runner )
{
  if ( this->parser.is_subcommand_used( "switch" ) )
    {
      return this->runRebuild( runner, RV_SWITCH );
    }
  if ( this->parser.is_subcommand_used( "boot" ) )
    {
      return this->runRebuild( runner, RV_BOOT );
    }
  if ( this->parser.is_subcommand_used( "test" ) )
    {
      return this->runRebuild( runner, RV_TEST );
    }
  if ( this->parser.is_subcommand_used( "build" ) )
    {
      return this->runRebuild( runner, RV_BUILD );
    }
  if ( this->parser.is_subcommand_used( "build-vm" ) )
    {
      return this->runRebuild( runner, RV_BUILD_VM );
    }
  if ( this->parser.is_subcommand_used( "repl" ) )
    {
      return this->runRepl( runner );
    }
  if ( this->parser.is_subcommand_used( "rollback" ) )
    {
      return this->runRollback( runner );
    }
  if ( this->parser.is_subcommand_used( "info" ) ) { return this->runInfo(); }
  std::cerr << this->parser << std::endl;
  throw NhException( "You must provide a valid `os' subcommand" );
  return EXIT_FAILURE;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::os


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
