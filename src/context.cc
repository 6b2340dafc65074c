/* ========================================================================== *
 *
 * @file context.cc
 *
 * @brief The process environment, captured once at startup.
 *
 *
 * -------------------------------------------------------------------------- */

#include <climits>
#include <optional>
#include <string>
#include <unistd.h>

#include <nix/environment-variables.hh>

#include "nh/context.hh"
#include "nh/core/exceptions.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

static std::optional<std::string>
localHostname()
{
  /* A truncated name is not guaranteed to be terminated. */
  char buffer[_POSIX_HOST_NAME_MAX + 1] = {};  // NOLINT
  if ( gethostname( &buffer[0], sizeof( buffer ) - 1 ) != 0 )
    {
      return std::nullopt;
    }
  std::string rsl( &buffer[0] );
  if ( rsl.empty() ) { return std::nullopt; }
  return rsl;
}


/* -------------------------------------------------------------------------- */

Context
Context::fromEnvironment()
{
  Context ctx;
  for ( const auto & [name, value] : nix::getEnv() )
    {
      ctx.environment.emplace( name, value );
    }

  ctx.user     = ctx.getEnv( "USER" );
  ctx.home     = ctx.getEnv( "HOME" );
  ctx.askpass  = ctx.getEnv( "NH_SUDO_ASKPASS" );
  ctx.hostname = localHostname();
  ctx.isRoot   = geteuid() == 0;
#ifdef __APPLE__
  ctx.hostOs = HOST_DARWIN;
#else
  ctx.hostOs = HOST_LINUX;
#endif

  debugLog( nix::fmt( "user: %s, home: %s, hostname: %s",
                      ctx.user.value_or( "<unset>" ),
                      ctx.home.value_or( "<unset>" ),
                      ctx.hostname.value_or( "<unknown>" ) ) );
  return ctx;
}


/* -------------------------------------------------------------------------- */

const std::string &
Context::requireUser() const
{
  if ( ! this->user.has_value() || this->user->empty() )
    {
      throw EnvironmentException( "could not determine the current user",
                                  "`USER' is not set" );
    }
  return *this->user;
}


const std::string &
Context::requireHome() const
{
  if ( ! this->home.has_value() || this->home->empty() )
    {
      throw EnvironmentException( "could not determine the home directory",
                                  "`HOME' is not set" );
    }
  return *this->home;
}


const std::string &
Context::requireHostname() const
{
  if ( ! this->hostname.has_value() )
    {
      throw EnvironmentException(
        "unable to determine the hostname automatically",
        "please specify one with `--hostname'" );
    }
  return *this->hostname;
}


/* -------------------------------------------------------------------------- */

std::optional<std::string>
Context::getEnv( const std::string & name ) const
{
  auto maybeValue = this->environment.find( name );
  if ( maybeValue == this->environment.end() ) { return std::nullopt; }
  return maybeValue->second;
}


EnvMap
Context::nhVariables() const
{
  EnvMap rsl;
  for ( const auto & [name, value] : this->environment )
    {
      if ( hasPrefix( "NH_", name ) ) { rsl.emplace( name, value ); }
    }
  return rsl;
}


std::optional<std::string>
Context::flakeOverride( const std::string & platformVar ) const
{
  for ( const auto & var : { platformVar, std::string( ENV_FLAKE ) } )
    {
      auto value = this->getEnv( var );
      if ( value.has_value() && ( ! trim_copy( *value ).empty() ) )
        {
          debugLog( nix::fmt( "using installable from `%s': %s", var, *value ) );
          return value;
        }
    }
  return std::nullopt;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
