/* ========================================================================== *
 *
 * @file workflow.cc
 *
 * @brief Steps shared by the rebuild and rollback workflows.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cctype>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <nix/error.hh>
#include <nix/file-system.hh>
#include <nix/logging.hh>
#include <nix/util.hh>

#include "nh/attr-path.hh"
#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/core/command.hh"
#include "nh/core/util.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

OutputPath::OutputPath( std::filesystem::path path ) : path( std::move( path ) )
{}

OutputPath::OutputPath( std::filesystem::path            path,
                        std::unique_ptr<nix::AutoDelete> dir )
  : path( std::move( path ) ), tempDir( std::move( dir ) )
{}

OutputPath::OutputPath( OutputPath && ) noexcept = default;

OutputPath &
OutputPath::operator=( OutputPath && ) noexcept
  = default;

OutputPath::~OutputPath() = default;


OutputPath
OutputPath::create( const std::optional<std::filesystem::path> & outLink,
                    const std::string &                          prefix )
{
  if ( outLink.has_value() ) { return OutputPath( *outLink ); }

  std::filesystem::path dir = nix::createTempDir( "", prefix );
  auto                  del = std::make_unique<nix::AutoDelete>( dir, true );
  debugLog( nix::fmt( "using temporary output directory `%s'", dir.string() ) );
  return OutputPath( dir / "result", std::move( del ) );
}


/* -------------------------------------------------------------------------- */

void
buildConfiguration( command::CommandRunner & runner,
                    const BuildRequest &     request )
{
  command::Command build( "nix" );
  build.arg( "build" ).args( toBuildArgs( request.installable ) );
  if ( request.builder.has_value() )
    {
      build.arg( "--builders" )
        .arg( nix::fmt( "ssh://%s - - - 100", *request.builder ) );
    }
  build.arg( "--out-link" )
    .arg( request.outLink.string() )
    .args( request.extraArgs )
    .message( request.message );

  try
    {
      if ( request.nom )
        {
          build.args( { "--log-format", "internal-json", "--verbose" } );
          runner.runPipeline( build, command::Command( "nom" ).arg( "--json" ) );
        }
      else { runner.run( build ); }
    }
  catch ( const command::CommandFailedException & err )
    {
      throw BuildException( displayInstallable( request.installable ),
                            err.what() );
    }
}


/* -------------------------------------------------------------------------- */

std::optional<std::string>
resolveSpecialisation( bool                               noSpecialisation,
                       const std::optional<std::string> & explicitName,
                       const std::filesystem::path &      markerFile )
{
  if ( noSpecialisation ) { return std::nullopt; }
  if ( explicitName.has_value() ) { return explicitName; }
  if ( markerFile.empty() ) { return std::nullopt; }

  std::error_code err;
  if ( ! std::filesystem::is_regular_file( markerFile, err ) )
    {
      debugLog( nix::fmt( "no specialisation marker at `%s'",
                          markerFile.string() ) );
      return std::nullopt;
    }
  try
    {
      std::string name = trim_copy( nix::readFile( markerFile.string() ) );
      if ( name.empty() ) { return std::nullopt; }
      return name;
    }
  catch ( const nix::Error & readErr )
    {
      warningLog( nix::fmt( "unable to read specialisation marker `%s': %s",
                            markerFile.string(),
                            readErr.what() ) );
      return std::nullopt;
    }
}


std::filesystem::path
targetProfilePath( const std::filesystem::path &      out,
                   const std::optional<std::string> & specialisation )
{
  if ( ! specialisation.has_value() ) { return out; }
  return out / "specialisation" / *specialisation;
}


/* -------------------------------------------------------------------------- */

diff_mode
parseDiffMode( const std::string & str )
{
  if ( str == "auto" ) { return DIFF_AUTO; }
  if ( str == "always" ) { return DIFF_ALWAYS; }
  if ( str == "never" ) { return DIFF_NEVER; }
  throw command::InvalidArgException(
    "unknown diff mode `" + str + "'",
    "expected one of `auto', `always', or `never'" );
}


void
compareConfigurations( command::CommandRunner &      runner,
                       const std::filesystem::path & current,
                       const std::filesystem::path & target,
                       diff_strictness               strictness )
{
  command::Command diff( runner.getContext().diffProgram );
  diff.arg( current.string() ).arg( target.string() ).message(
    "Comparing changes" );
  try
    {
      runner.run( diff );
    }
  catch ( const command::CommandFailedException & err )
    {
      if ( strictness == DIFF_STRICT ) { throw; }
      warningLog( nix::fmt( "failed to compare configurations: %s",
                            err.what() ) );
    }
}


/* -------------------------------------------------------------------------- */

bool
defaultPrompt( const std::string & question )
{
  std::optional<char> answer = nix::logger->ask( question );
  return answer.has_value()
         && ( std::tolower( static_cast<unsigned char>( *answer ) ) == 'y' );
}


void
confirmAction( const ConfirmFn & confirm )
{
  if ( ! confirm( "Apply the config?" ) ) { throw UserRejectedException(); }
}


/* -------------------------------------------------------------------------- */

TreeProbe
makeEvalProbe( command::CommandRunner & runner, Args extraArgs )
{
  return [&runner, extraArgs = std::move( extraArgs )](
           const Installable & tree,
           const std::string & name ) -> bool
  {
    command::Command eval( "nix" );
    eval.arg( "eval" )
      .args( extraArgs )
      .arg( "--apply" )
      .arg( "x: x ? " + quoteNixString( name ) )
      .args( toBuildArgs( tree ) );
    try
      {
        std::optional<std::string> out = runner.capture( eval );
        return out.has_value() && ( trim_copy( *out ) == "true" );
      }
    catch ( const command::CommandFailedException & err )
      {
        debugLog( nix::fmt( "probe for `%s' failed: %s", name, err.what() ) );
        return false;
      }
  };
}


/* -------------------------------------------------------------------------- */

TargetHostname
resolveTargetHostname( const std::optional<std::string> & explicitName,
                       const Context &                    ctx )
{
  if ( ! explicitName.has_value() )
    {
      return TargetHostname { ctx.requireHostname(), false };
    }
  bool mismatch
    = ctx.hostname.has_value() && ( *ctx.hostname != *explicitName );
  if ( mismatch )
    {
      debugLog( nix::fmt( "target hostname `%s' differs from local `%s'",
                          *explicitName,
                          *ctx.hostname ) );
    }
  return TargetHostname { *explicitName, mismatch };
}


bool
checkNotRoot( bool bypass, const Context & ctx )
{
  if ( bypass )
    {
      warningLog( "bypassing root check, now running nix as root" );
      return false;
    }
  if ( ctx.isRoot )
    {
      throw EnvironmentException(
        "refusing to run as root",
        "`sudo' is called internally as needed, pass "
        "`--bypass-root-check' to override" );
    }
  return true;
}


/* -------------------------------------------------------------------------- */

std::optional<std::filesystem::path>
firstExisting( const std::vector<std::filesystem::path> & candidates )
{
  for ( const auto & candidate : candidates )
    {
      std::error_code err;
      if ( std::filesystem::exists( candidate, err ) ) { return candidate; }
    }
  return std::nullopt;
}


/* -------------------------------------------------------------------------- */

void
runRepl( command::CommandRunner &           runner,
         const Installable &                installable,
         const std::string &                configType,
         const std::optional<std::string> & configName,
         const TreeProbe &                  probe,
         const Args &                       extraArgs )
{
  if ( std::holds_alternative<StoreInstallable>( installable ) )
    {
      throw InvalidInstallableException(
        "`nix repl' does not support store path installables" );
    }

  Installable resolved = resolveAgainstTree( installable,
                                             configType,
                                             {},
                                             configName,
                                             false,
                                             probe,
                                             runner.getContext() );
  debugLog( "opening repl on " + displayInstallable( resolved ) );

  runner.run( command::Command( "nix" )
                .withNixEnv( runner.getContext() )
                .arg( "repl" )
                .args( toBuildArgs( resolved ) )
                .args( extraArgs ) );
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
