/* ========================================================================== *
 *
 * @file command/runner.cc
 *
 * @brief Describe and run local, remote, and elevated commands.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nix/error.hh>
#include <nix/processes.hh>

#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

CommandFailedException::CommandFailedException( std::string_view description,
                                                int              status )
  : NhException( "command failed",
                 std::string( description ),
                 ( status < 0 ) ? std::string( "could not be started" )
                                : nix::statusToString( status ) )
  , status( status )
{}


/* -------------------------------------------------------------------------- */

Command &
Command::arg( std::string value )
{
  this->arguments.emplace_back( std::move( value ) );
  return *this;
}

Command &
Command::args( const Args & values )
{
  this->arguments.insert( this->arguments.end(), values.begin(), values.end() );
  return *this;
}


Command &
Command::env( const std::string & name, std::string value )
{
  this->envPolicy.insert_or_assign( name, EnvAction::set( std::move( value ) ) );
  return *this;
}

Command &
Command::preserveEnv( const std::string & name )
{
  this->envPolicy.insert_or_assign( name, EnvAction::preserve() );
  return *this;
}

Command &
Command::unsetEnv( const std::string & name )
{
  this->envPolicy.insert_or_assign( name, EnvAction::unset() );
  return *this;
}


Command &
Command::elevate( bool value )
{
  this->elevated = value;
  return *this;
}

Command &
Command::dry( bool value )
{
  this->dryRun = value;
  return *this;
}

Command &
Command::ssh( std::optional<std::string> host )
{
  this->sshHost = std::move( host );
  return *this;
}

Command &
Command::message( std::string value )
{
  this->msg = std::move( value );
  return *this;
}


/* -------------------------------------------------------------------------- */

Command &
Command::withNixEnv( const Context & ctx )
{
  if ( ctx.home.has_value() ) { this->env( "HOME", *ctx.home ); }
  if ( ctx.user.has_value() ) { this->env( "USER", *ctx.user ); }
  for ( const char * name : { "PATH",
                              "NIX_CONFIG",
                              "NIX_PATH",
                              "NIX_REMOTE",
                              "NIX_SSL_CERT_FILE",
                              "NIX_USER_CONF_FILES" } )
    {
      this->preserveEnv( name );
    }
  return *this;
}


Command &
Command::withNhEnv( const Context & ctx )
{
  for ( auto & [name, value] : ctx.nhVariables() )
    {
      this->env( name, std::move( value ) );
    }
  return *this;
}


/* -------------------------------------------------------------------------- */

Invocation
CommandRunner::toInvocation( const Command & cmd ) const
{
  Invocation inv;

  if ( cmd.isElevated() )
    {
      /* The askpass helper lives on this machine, a remote `sudo' could not
       * run it. */
      bool askpass = this->ctx.askpass.has_value()
                     && ( ! cmd.getSshHost().has_value() );
      ElevationRequest request;
      request.askpass = askpass;
      for ( const auto & [name, action] : cmd.getEnvPolicy() )
        {
          switch ( action.kind )
            {
              case EnvAction::SET:
                request.set.emplace( name, action.value );
                break;
              case EnvAction::PRESERVE:
                request.preserve.emplace_back( name );
                break;
              /* `sudo' clears everything we don't preserve. */
              case EnvAction::UNSET: break;
            }
        }

      Args prefix = this->elevation.buildPrefix( request );
      inv.program = prefix.front();
      inv.args.assign( prefix.begin() + 1, prefix.end() );
      inv.args.emplace_back( cmd.getProgram() );
      inv.args.insert( inv.args.end(),
                       cmd.getArgs().begin(),
                       cmd.getArgs().end() );

      if ( askpass )
        {
          EnvMap env          = this->ctx.environment;
          env["SUDO_ASKPASS"] = *this->ctx.askpass;
          inv.environment     = std::move( env );
        }
    }
  else if ( cmd.getSshHost().has_value() )
    {
      /* The remote shell gets its own environment, so literal values are
       * passed with `env'. */
      inv.program = cmd.getProgram();
      inv.args    = cmd.getArgs();
      Args sets;
      for ( const auto & [name, action] : cmd.getEnvPolicy() )
        {
          if ( action.kind == EnvAction::SET )
            {
              sets.emplace_back( name + "=" + action.value );
            }
        }
      if ( ! sets.empty() )
        {
          sets.emplace_back( inv.program );
          sets.insert( sets.end(), inv.args.begin(), inv.args.end() );
          inv.program = "env";
          inv.args    = std::move( sets );
        }
    }
  else
    {
      inv.program = cmd.getProgram();
      inv.args    = cmd.getArgs();

      bool   modified = false;
      EnvMap env      = this->ctx.environment;
      for ( const auto & [name, action] : cmd.getEnvPolicy() )
        {
          switch ( action.kind )
            {
              case EnvAction::SET:
                env.insert_or_assign( name, action.value );
                modified = true;
                break;
              case EnvAction::UNSET:
                modified = ( env.erase( name ) != 0 ) || modified;
                break;
              /* Inherited anyway. */
              case EnvAction::PRESERVE: break;
            }
        }
      if ( modified ) { inv.environment = std::move( env ); }
    }

  if ( cmd.getSshHost().has_value() )
    {
      Invocation remote;
      remote.program = "ssh";
      remote.args    = { "-T", *cmd.getSshHost() };
      remote.input   = inv.toString();
      return remote;
    }

  return inv;
}


/* -------------------------------------------------------------------------- */

/** @brief Log @a cmd before running it, return its rendered form. */
static std::string
announce( const Command & cmd, const Invocation & inv )
{
  if ( cmd.getMessage().has_value() ) { infoLog( *cmd.getMessage() ); }
  std::string line = inv.toString();
  if ( inv.input.has_value() ) { line += " <<< " + nix::shellEscape( *inv.input ); }
  if ( cmd.isDry() ) { infoLog( "dry run, not executing: " + line ); }
  else { debugLog( "running: " + line ); }
  return line;
}


void
CommandRunner::run( const Command & cmd )
{
  Invocation  inv  = this->toInvocation( cmd );
  std::string line = announce( cmd, inv );
  if ( cmd.isDry() ) { return; }

  ExecResult result;
  try
    {
      result = this->executor.execute( inv, false );
    }
  catch ( const nix::Error & err )
    {
      throw CommandFailedException( line + ": " + err.what(), -1 );
    }
  if ( result.status != 0 )
    {
      throw CommandFailedException( cmd.getMessage().value_or( line ),
                                    result.status );
    }
}


std::optional<std::string>
CommandRunner::capture( const Command & cmd )
{
  Invocation  inv  = this->toInvocation( cmd );
  std::string line = announce( cmd, inv );
  if ( cmd.isDry() ) { return std::nullopt; }

  ExecResult result;
  try
    {
      result = this->executor.execute( inv, true );
    }
  catch ( const nix::Error & err )
    {
      throw CommandFailedException( line + ": " + err.what(), -1 );
    }
  if ( result.status != 0 )
    {
      throw CommandFailedException( cmd.getMessage().value_or( line ),
                                    result.status );
    }
  return std::move( result.output );
}


void
CommandRunner::runPipeline( const Command & head, const Command & tail )
{
  Invocation  headInv = this->toInvocation( head );
  Invocation  tailInv = this->toInvocation( tail );
  std::string line    = announce( head, headInv ) + " |& " + tailInv.toString();
  debugLog( "pipeline: " + line );
  if ( head.isDry() ) { return; }

  ExecResult result;
  try
    {
      result = this->executor.executePipeline( headInv, tailInv );
    }
  catch ( const nix::Error & err )
    {
      throw CommandFailedException( line + ": " + err.what(), -1 );
    }
  if ( result.status != 0 )
    {
      throw CommandFailedException( head.getMessage().value_or( line ),
                                    result.status );
    }
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
