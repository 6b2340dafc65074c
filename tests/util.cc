/* ========================================================================== *
 *
 * @file util.cc
 *
 * @brief Tests for miscellaneous helpers, exceptions, and the
 *        process context.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include <nlohmann/json.hpp>

#include "nh/context.hh"
#include "nh/core/command.hh"
#include "nh/core/exceptions.hh"
#include "nh/core/util.hh"
#include "recording-executor.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nh;

/* -------------------------------------------------------------------------- */

bool
test_parseUInt()
{
  EXPECT( isUInt( "42" ) );
  EXPECT( ! isUInt( "" ) );
  EXPECT( ! isUInt( "-1" ) );
  EXPECT( ! isUInt( "4a" ) );

  EXPECT( parseUInt( "0" ) == std::optional<uint64_t>( 0 ) );
  EXPECT( parseUInt( "123" ) == std::optional<uint64_t>( 123 ) );
  EXPECT( parseUInt( "18446744073709551615" )
          == std::optional<uint64_t>( UINT64_MAX ) );
  EXPECT( ! parseUInt( "18446744073709551616" ).has_value() );
  EXPECT( ! parseUInt( "1.5" ).has_value() );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_prefixSuffix()
{
  EXPECT( hasPrefix( "NH_", "NH_FLAKE" ) );
  EXPECT( ! hasPrefix( "NH_", "NIX_PATH" ) );
  EXPECT( ! hasPrefix( "NH_FLAKE_", "NH_" ) );
  EXPECT( hasSuffix( "-link", "system-3-link" ) );
  EXPECT( ! hasSuffix( "-link", "link" ) );
  return true;
}


bool
test_trim()
{
  EXPECT_EQ( trim_copy( "  gaming\n" ), std::string( "gaming" ) );
  EXPECT_EQ( ltrim_copy( "\t x " ), std::string( "x " ) );
  EXPECT_EQ( rtrim_copy( " x \n" ), std::string( " x" ) );
  EXPECT_EQ( trim_copy( " \n " ), std::string() );

  std::string str = "  true\n";
  trim( str );
  EXPECT_EQ( str, std::string( "true" ) );
  return true;
}


bool
test_toCommandLine()
{
  EXPECT_EQ( toCommandLine( "nix", { "build", "/etc/nixos#a b" } ),
             std::string( "'nix' 'build' '/etc/nixos#a b'" ) );
  EXPECT_EQ( toCommandLine( "echo", { "it's" } ),
             std::string( "'echo' 'it'\\''s'" ) );
  EXPECT_EQ( toCommandLine( "true", {} ), std::string( "'true'" ) );
  return true;
}


bool
test_concatStringsSep()
{
  std::vector<std::string> parts = { "PATH", "NIX_PATH" };
  EXPECT_EQ( concatStringsSep( ",", parts ), std::string( "PATH,NIX_PATH" ) );
  EXPECT_EQ( concatStringsSep( ",", std::vector<std::string> {} ),
             std::string() );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Everything after the first `--` is forwarded untouched. */
bool
test_splitTrailingArgs()
{
  {
    std::vector<std::string> raw
      = { "nh", "os", "switch", ".", "--", "--impure", "--", "-L" };
    std::vector<char *> argv;
    for ( auto & arg : raw ) { argv.push_back( arg.data() ); }
    command::SplitArgs split
      = command::splitTrailingArgs( static_cast<int>( argv.size() ),
                                    argv.data() );
    EXPECT( split.args
            == ( std::vector<std::string> { "nh", "os", "switch", "." } ) );
    EXPECT( split.trailing == ( Args { "--impure", "--", "-L" } ) );
  }
  {
    std::vector<std::string> raw = { "nh", "home", "build" };
    std::vector<char *>      argv;
    for ( auto & arg : raw ) { argv.push_back( arg.data() ); }
    command::SplitArgs split
      = command::splitTrailingArgs( static_cast<int>( argv.size() ),
                                    argv.data() );
    EXPECT_EQ( split.args.size(), static_cast<size_t>( 3 ) );
    EXPECT( split.trailing.empty() );
  }
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_exceptionMessages()
{
  EnvironmentException bare;
  EXPECT_EQ( std::string( bare.what() ), std::string( "invalid environment" ) );
  EXPECT( ! bare.getContextMessage().has_value() );

  EnvironmentException full( "HOME is unset", "getenv failed" );
  EXPECT_EQ( std::string( full.what() ),
             std::string( "invalid environment: HOME is unset: getenv failed" ) );
  EXPECT_EQ( full.getErrorCode(), EC_ENVIRONMENT );

  NhException generic( "oops" );
  EXPECT_EQ( std::string( generic.what() ), std::string( "general error: oops" ) );
  EXPECT_EQ( generic.getErrorCode(), EC_NH_EXCEPTION );
  return true;
}


bool
test_exceptionJSON()
{
  nlohmann::json jto;
  to_json( jto, UserRejectedException( "declined" ) );
  EXPECT_EQ( jto["exit_code"].get<int>(),
             static_cast<int>( EC_USER_REJECTED ) );
  EXPECT_EQ( jto["category_message"].get<std::string>(),
             std::string( "user rejected the new configuration" ) );
  EXPECT_EQ( jto["context_message"].get<std::string>(),
             std::string( "declined" ) );
  EXPECT( ! jto.contains( "caught_message" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_contextRequire()
{
  Context ctx = makeTestContext();
  EXPECT_EQ( ctx.requireUser(), std::string( "alice" ) );
  EXPECT_EQ( ctx.requireHome(), std::string( "/home/alice" ) );
  EXPECT_EQ( ctx.requireHostname(), std::string( "laptop" ) );

  ctx.hostname.reset();
  EXPECT_THROWS( (void) ctx.requireHostname(), EnvironmentException );
  ctx.user.reset();
  EXPECT_THROWS( (void) ctx.requireUser(), EnvironmentException );
  return true;
}


/** @brief The captured hostname is the one reported by the system. */
bool
test_contextHostname()
{
  char expected[256] = {};  // NOLINT
  if ( gethostname( &expected[0], sizeof( expected ) - 1 ) != 0 )
    {
      return true;
    }
  Context ctx = Context::fromEnvironment();
  if ( expected[0] == '\0' )
    {
      EXPECT( ! ctx.hostname.has_value() );
      return true;
    }
  EXPECT( ctx.hostname.has_value() );
  EXPECT_EQ( *ctx.hostname, std::string( &expected[0] ) );
  return true;
}


/** @brief The platform variable wins over `NH_FLAKE`, blanks are ignored. */
bool
test_flakeOverride()
{
  Context ctx = makeTestContext();
  EXPECT( ctx.flakeOverride( ENV_OS_FLAKE )
          == std::optional<std::string>( "/etc/nixos" ) );

  ctx.environment[ENV_OS_FLAKE] = "/srv/flake#laptop";
  EXPECT( ctx.flakeOverride( ENV_OS_FLAKE )
          == std::optional<std::string>( "/srv/flake#laptop" ) );
  EXPECT( ctx.flakeOverride( ENV_HOME_FLAKE )
          == std::optional<std::string>( "/etc/nixos" ) );

  ctx.environment[ENV_OS_FLAKE] = "  ";
  ctx.environment[ENV_FLAKE]    = "";
  EXPECT( ! ctx.flakeOverride( ENV_OS_FLAKE ).has_value() );
  return true;
}


bool
test_nhVariables()
{
  Context ctx                     = makeTestContext();
  ctx.environment["NH_NO_CHECKS"] = "1";
  EnvMap vars                     = ctx.nhVariables();
  EXPECT_EQ( vars.size(), static_cast<size_t>( 2 ) );
  EXPECT( vars.count( "NH_FLAKE" ) == 1 );
  EXPECT( vars.count( "NH_NO_CHECKS" ) == 1 );
  EXPECT( ctx.getEnv( "USER" ) == std::optional<std::string>( "alice" ) );
  EXPECT( ! ctx.getEnv( "MISSING" ).has_value() );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int exitCode = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( exitCode, __VA_ARGS__ )

  RUN_TEST( parseUInt );
  RUN_TEST( prefixSuffix );
  RUN_TEST( trim );
  RUN_TEST( toCommandLine );
  RUN_TEST( concatStringsSep );
  RUN_TEST( splitTrailingArgs );
  RUN_TEST( exceptionMessages );
  RUN_TEST( exceptionJSON );
  RUN_TEST( contextRequire );
  RUN_TEST( contextHostname );
  RUN_TEST( flakeOverride );
  RUN_TEST( nhVariables );

  return exitCode;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
