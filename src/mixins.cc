/* ========================================================================== *
 *
 * @file mixins.cc
 *
 * @brief Argument groups shared by the `os`, `home` and `darwin` commands.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <utility>

#include <argparse/argparse.hpp>
#include <nix/util.hh>

#include "nh/attr-path.hh"
#include "nh/context.hh"
#include "nh/core/command.hh"
#include "nh/core/util.hh"
#include "nh/mixins.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

void
InstallableMixin::addInstallableArgs( argparse::ArgumentParser & parser )
{
  parser.add_argument( "installable" )
    .help( "flake reference `REF#ATTRS', or the attribute path when one of "
           "`--file', `--expr' or `--store-path' is given" )
    .metavar( "INSTALLABLE" )
    .nargs( argparse::nargs_pattern::optional )
    .action( [&]( const std::string & str ) { this->positional = str; } );

  parser.add_argument( "-f", "--file" )
    .help( "evaluate the configuration tree from a `nix' file" )
    .metavar( "FILE" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->file = str; } );

  parser.add_argument( "-E", "--expr" )
    .help( "evaluate the configuration tree from an expression" )
    .metavar( "EXPR" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->expr = str; } );

  parser.add_argument( "--store-path" )
    .help( "treat INSTALLABLE as an already built store path" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->storePath = true; } );
}


Installable
InstallableMixin::getInstallable( const Context &     ctx,
                                  const std::string & platformVar ) const
{
  int selectors = ( this->file.has_value() ? 1 : 0 )
                  + ( this->expr.has_value() ? 1 : 0 )
                  + ( this->storePath ? 1 : 0 );
  if ( 1 < selectors )
    {
      throw command::InvalidArgException(
        "only one of `--file', `--expr' and `--store-path' may be given" );
    }

  if ( this->storePath )
    {
      if ( ! this->positional.has_value() )
        {
          throw command::InvalidArgException(
            "`--store-path' requires a path as INSTALLABLE" );
        }
      return StoreInstallable { *this->positional };
    }

  AttrPath attribute = this->positional.has_value()
                         ? parseAttrPath( *this->positional )
                         : AttrPath {};
  if ( this->file.has_value() )
    {
      return FileInstallable { *this->file, std::move( attribute ) };
    }
  if ( this->expr.has_value() )
    {
      return ExpressionInstallable { *this->expr, std::move( attribute ) };
    }

  if ( this->positional.has_value() )
    {
      return installableFromEnvOverride( *this->positional );
    }

  if ( auto value = ctx.flakeOverride( platformVar ); value.has_value() )
    {
      debugLog( "using installable from the environment: " + *value );
      return installableFromEnvOverride( *value );
    }

  return FlakeInstallable { ".", {} };
}


/* -------------------------------------------------------------------------- */

void
RebuildArgsMixin::addCommonArgs( argparse::ArgumentParser & parser )
{
  parser.add_argument( "-n", "--dry" )
    .help( "build and compare without activating" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->dry = true; } );

  parser.add_argument( "-a", "--ask" )
    .help( "ask for confirmation before activating" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->ask = true; } );

  parser.add_argument( "--no-nom" )
    .help( "do not pipe build logs through `nom'" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->noNom = true; } );

  parser.add_argument( "-o", "--out-link" )
    .help( "keep the build result at PATH" )
    .metavar( "PATH" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->outLink = str; } );

  parser.add_argument( "--diff" )
    .help( "when to compare with the active configuration: "
           "`auto', `always' or `never'" )
    .metavar( "WHEN" )
    .nargs( 1 )
    .action( [&]( const std::string & str )
             { this->diff = parseDiffMode( str ); } );
}


argparse::Argument &
RebuildArgsMixin::addHostnameArg( argparse::ArgumentParser & parser )
{
  return parser.add_argument( "-H", "--hostname" )
    .help( "configuration to build, defaults to the local hostname" )
    .metavar( "HOSTNAME" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->configName = str; } );
}


argparse::Argument &
RebuildArgsMixin::addConfigurationArg( argparse::ArgumentParser & parser )
{
  return parser.add_argument( "-c", "--configuration" )
    .help( "configuration to build, defaults to `USER@HOST' then `USER'" )
    .metavar( "NAME" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->configName = str; } );
}


void
RebuildArgsMixin::addSpecialisationArgs( argparse::ArgumentParser & parser )
{
  parser.add_argument( "-s", "--specialisation" )
    .help( "activate the specialisation NAME" )
    .metavar( "NAME" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->specialisation = str; } );

  parser.add_argument( "-S", "--no-specialisation" )
    .help( "ignore the active specialisation" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->noSpecialisation = true; } );
}


void
RebuildArgsMixin::addRemoteArgs( argparse::ArgumentParser & parser )
{
  parser.add_argument( "--build-host" )
    .help( "build on HOST over `ssh'" )
    .metavar( "HOST" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->buildHost = str; } );

  parser.add_argument( "--target-host" )
    .help( "deploy to HOST over `ssh'" )
    .metavar( "HOST" )
    .nargs( 1 )
    .action( [&]( const std::string & str ) { this->targetHost = str; } );
}


argparse::Argument &
RebuildArgsMixin::addBypassRootCheckArg( argparse::ArgumentParser & parser )
{
  return parser.add_argument( "-R", "--bypass-root-check" )
    .help( "allow running as root, privileged steps run without `sudo'" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->bypassRootCheck = true; } );
}


argparse::Argument &
RebuildArgsMixin::addWithBootloaderArg( argparse::ArgumentParser & parser )
{
  return parser.add_argument( "--with-bootloader" )
    .help( "build a VM which boots through the bootloader" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->withBootloader = true; } );
}


argparse::Argument &
RebuildArgsMixin::addBackupExtensionArg( argparse::ArgumentParser & parser )
{
  return parser.add_argument( "-b", "--backup-extension" )
    .help( "move conflicting files aside with the extension EXT" )
    .metavar( "EXT" )
    .nargs( 1 )
    .action( [&]( const std::string & str )
             { this->backupExtension = str; } );
}


/* -------------------------------------------------------------------------- */

void
RebuildArgsMixin::ignoreDryAndAsk( const std::string & commandName )
{
  if ( this->dry || this->ask )
    {
      warningLog( nix::fmt( "`--ask' and `--dry' have no effect for `%s'",
                            commandName ) );
    }
  this->dry = false;
  this->ask = false;
}


RebuildRequest
RebuildArgsMixin::toRebuildRequest( platform_kind   platform,
                                    rebuild_variant variant,
                                    Installable     installable ) const
{
  RebuildRequest request;
  request.platform         = platform;
  request.variant          = variant;
  request.installable      = std::move( installable );
  request.configName       = this->configName;
  request.dry              = this->dry;
  request.ask              = this->ask;
  request.nom              = ! this->noNom;
  request.outLink          = this->outLink;
  request.diff             = this->diff;
  request.specialisation   = this->specialisation;
  request.noSpecialisation = this->noSpecialisation;
  request.buildHost        = this->buildHost;
  request.targetHost       = this->targetHost;
  request.withBootloader   = this->withBootloader;
  request.backupExtension  = this->backupExtension;
  request.extraArgs        = this->extraArgs;
  return request;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
