/* ========================================================================== *
 *
 * @file rebuild.cc
 *
 * @brief Build a configuration, show what changes, and activate it.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <nix/error.hh>
#include <nix/file-system.hh>
#include <nix/util.hh>

#include "nh/command/runner.hh"
#include "nh/context.hh"
#include "nh/core/util.hh"
#include "nh/rebuild.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

std::string_view
rebuildStateName( rebuild_state state )
{
  switch ( state )
    {
      case RS_RESOLVE_INSTALLABLE: return "resolve-installable";
      case RS_BUILD: return "build";
      case RS_RESOLVE_SPECIALISATION: return "resolve-specialisation";
      case RS_DIFF: return "diff";
      case RS_CONFIRM: return "confirm";
      case RS_COPY_REMOTE: return "copy-remote";
      case RS_ACTIVATE: return "activate";
      case RS_REGISTER_BOOT: return "register-boot";
      case RS_DONE: return "done";
      default: return "unknown";
    }
}


/* -------------------------------------------------------------------------- */

PlatformLayout
PlatformLayout::nixos()
{
  return PlatformLayout { "nixosConfigurations",
                          "nh-os",
                          "/nix/var/nix/profiles/system",
                          { "/run/current-system" },
                          "/etc/specialisation" };
}


PlatformLayout
PlatformLayout::darwin()
{
  return PlatformLayout { "darwinConfigurations",
                          "nh-darwin",
                          "/nix/var/nix/profiles/system",
                          { "/run/current-system" },
                          "" };
}


PlatformLayout
PlatformLayout::home( const Context & ctx )
{
  const std::filesystem::path home = ctx.requireHome();
  return PlatformLayout {
    "homeConfigurations",
    "nh-home",
    "",
    { std::filesystem::path( "/nix/var/nix/profiles/per-user" )
        / ctx.requireUser() / "home-manager",
      home / ".local/state/nix/profiles/home-manager" },
    home / ".local/share/home-manager/specialisation"
  };
}


/* -------------------------------------------------------------------------- */

RebuildOrchestrator::RebuildOrchestrator( command::CommandRunner & runner,
                                          PlatformLayout           layout,
                                          TreeProbe                probe,
                                          ConfirmFn                confirm )
  : runner( runner )
  , layout( std::move( layout ) )
  , probe( std::move( probe ) )
  , confirm( std::move( confirm ) )
{}


void
RebuildOrchestrator::enter( rebuild_state next )
{
  debugLog( nix::fmt( "rebuild: %s -> %s",
                      rebuildStateName( this->state ),
                      rebuildStateName( next ) ) );
  this->state = next;
}


/* -------------------------------------------------------------------------- */

/** @brief Whether @a request runs the activation program. */
static bool
needsActivation( const RebuildRequest & request )
{
  if ( request.platform == PLATFORM_NIXOS )
    {
      return ( request.variant == RV_SWITCH ) || ( request.variant == RV_TEST );
    }
  return request.variant == RV_SWITCH;
}

/** @brief Whether @a request makes the configuration the boot default. */
static bool
needsBootRegistration( const RebuildRequest & request )
{
  switch ( request.platform )
    {
      case PLATFORM_NIXOS:
        return ( request.variant == RV_SWITCH )
               || ( request.variant == RV_BOOT );
      case PLATFORM_DARWIN: return request.variant == RV_SWITCH;
      default: return false;
    }
}

static bool
isBuildOnly( const RebuildRequest & request )
{
  return ( request.variant == RV_BUILD ) || ( request.variant == RV_BUILD_VM );
}


/* -------------------------------------------------------------------------- */

Installable
RebuildOrchestrator::resolveInstallable( const RebuildRequest & request )
{
  AttrPath                   extraPath;
  std::optional<std::string> configName = request.configName;
  switch ( request.platform )
    {
      case PLATFORM_NIXOS:
        {
          std::string final = "toplevel";
          if ( request.variant == RV_BUILD_VM )
            {
              final = request.withBootloader ? "vmWithBootLoader" : "vm";
            }
          extraPath = { "config", "system", "build", final };
          break;
        }
      case PLATFORM_HOME:
        extraPath = { "config", "home", "activationPackage" };
        break;
      case PLATFORM_DARWIN:
        extraPath = { "config", "system", "build", "toplevel" };
        break;
    }

  return resolveAgainstTree( request.installable,
                             this->layout.configType,
                             extraPath,
                             configName,
                             true,
                             this->probe,
                             this->runner.getContext() );
}


/* -------------------------------------------------------------------------- */

void
RebuildOrchestrator::diff( const RebuildRequest &        request,
                           const std::filesystem::path & target,
                           bool                          hostnameMismatch )
{
  if ( request.diff == DIFF_NEVER )
    {
      debugLog( "not comparing configurations, disabled by `--diff never'" );
      return;
    }
  if ( hostnameMismatch && ( request.diff == DIFF_AUTO ) )
    {
      infoLog( "not comparing configurations, the target hostname differs "
               "from this machine" );
      return;
    }

  std::optional<std::filesystem::path> current
    = firstExisting( this->layout.currentProfiles );
  if ( ! current.has_value() )
    {
      debugLog( "no active configuration, skipping comparison" );
      return;
    }

  compareConfigurations( this->runner,
                         *current,
                         target,
                         ( request.platform == PLATFORM_HOME ) ? DIFF_LENIENT
                                                               : DIFF_STRICT );
}


/* -------------------------------------------------------------------------- */

void
RebuildOrchestrator::copyRemote( const RebuildRequest &        request,
                                 const std::filesystem::path & out )
{
  this->runner.run(
    command::Command( "nix" )
      .withNixEnv( this->runner.getContext() )
      .args( { "copy",
               "--to",
               "ssh://" + *request.targetHost,
               std::filesystem::weakly_canonical( out ).string() } )
      .message( "Copying configuration to " + *request.targetHost ) );
}


/* -------------------------------------------------------------------------- */

/** @brief Whether `activate-user` is missing or only a deprecation stub. */
static bool
darwinNeedsElevation( const std::filesystem::path & out )
{
  std::filesystem::path activateUser = out / "activate-user";
  std::error_code       err;
  if ( ! std::filesystem::exists( activateUser, err ) ) { return true; }
  try
    {
      return nix::readFile( activateUser.string() )
               .find( "# nix-darwin: deprecated" )
             != std::string::npos;
    }
  catch ( const nix::Error & readErr )
    {
      debugLog( nix::fmt( "unable to read `%s': %s",
                          activateUser.string(),
                          readErr.what() ) );
      return true;
    }
}


void
RebuildOrchestrator::activate( const RebuildRequest &        request,
                               const std::filesystem::path & out,
                               const std::filesystem::path & target )
{
  const Context & ctx = this->runner.getContext();
  try
    {
      switch ( request.platform )
        {
          case PLATFORM_NIXOS:
            this->runner.run(
              command::Command(
                std::filesystem::weakly_canonical(
                  target / "bin" / "switch-to-configuration" )
                  .string() )
                .arg( "test" )
                .elevate( request.elevate )
                .ssh( request.targetHost )
                .message( "Activating configuration" ) );
            break;

          case PLATFORM_HOME:
            {
              command::Command activate( ( target / "activate" ).string() );
              activate.withNixEnv( ctx ).message( "Activating configuration" );
              if ( request.backupExtension.has_value() )
                {
                  infoLog( nix::fmt( "Using %s as the backup extension",
                                     *request.backupExtension ) );
                  activate.env( "HOME_MANAGER_BACKUP_EXT",
                                *request.backupExtension );
                }
              this->runner.run( activate );
              break;
            }

          case PLATFORM_DARWIN:
            this->runner.run(
              command::Command( ( target / "sw/bin/darwin-rebuild" ).string() )
                .arg( "activate" )
                .elevate( request.elevate && darwinNeedsElevation( out ) )
                .message( "Activating configuration" ) );
            break;
        }
    }
  catch ( const command::CommandFailedException & err )
    {
      throw ActivationException( target.string(), err.what() );
    }
}


/* -------------------------------------------------------------------------- */

void
RebuildOrchestrator::registerBoot( const RebuildRequest &        request,
                                   const std::filesystem::path & out )
{
  const std::filesystem::path resolved = std::filesystem::weakly_canonical( out );
  try
    {
      this->runner.run( command::Command( "nix" )
                          .withNixEnv( this->runner.getContext() )
                          .args( { "build",
                                   "--no-link",
                                   "--profile",
                                   this->layout.systemProfile.string(),
                                   resolved.string() } )
                          .elevate( request.elevate )
                          .ssh( request.targetHost )
                          .message( "Setting system profile" ) );

      if ( request.platform == PLATFORM_NIXOS )
        {
          this->runner.run(
            command::Command(
              ( resolved / "bin" / "switch-to-configuration" ).string() )
              .arg( "boot" )
              .elevate( request.elevate )
              .ssh( request.targetHost )
              .message( "Adding configuration to bootloader" ) );
        }
    }
  catch ( const command::CommandFailedException & err )
    {
      throw ActivationException( "unable to make `" + resolved.string()
                                   + "' the boot default",
                                 err.what() );
    }
}


/* -------------------------------------------------------------------------- */

void
RebuildOrchestrator::run( const RebuildRequest & request )
{
  const Context & ctx = this->runner.getContext();

  this->enter( RS_RESOLVE_INSTALLABLE );
  bool           hostnameMismatch = false;
  RebuildRequest resolvedRequest  = request;
  if ( request.platform != PLATFORM_HOME )
    {
      TargetHostname target
        = resolveTargetHostname( request.configName, ctx );
      resolvedRequest.configName = target.name;
      hostnameMismatch
        = target.mismatch && ( request.platform == PLATFORM_NIXOS );
    }
  Installable installable = this->resolveInstallable( resolvedRequest );

  this->enter( RS_BUILD );
  /* Lives until every step reading the result has finished. */
  OutputPath out = OutputPath::create( request.outLink, this->layout.tempPrefix );
  std::string message;
  switch ( request.platform )
    {
      case PLATFORM_NIXOS:
        message = ( request.variant == RV_BUILD_VM )
                    ? "Building NixOS VM image"
                    : "Building NixOS configuration";
        break;
      case PLATFORM_HOME: message = "Building Home-Manager configuration"; break;
      case PLATFORM_DARWIN: message = "Building Darwin configuration"; break;
    }
  buildConfiguration( this->runner,
                      BuildRequest { installable,
                                     out.get(),
                                     request.extraArgs,
                                     request.buildHost,
                                     message,
                                     request.nom } );

  this->enter( RS_RESOLVE_SPECIALISATION );
  std::optional<std::string> specialisation
    = resolveSpecialisation( request.noSpecialisation,
                             request.specialisation,
                             this->layout.specialisationMarker );
  if ( specialisation.has_value() )
    {
      verboseLog( "using specialisation " + *specialisation );
    }
  std::filesystem::path target = targetProfilePath( out.get(), specialisation );

  this->enter( RS_DIFF );
  this->diff( request, target, hostnameMismatch );

  this->enter( RS_CONFIRM );
  if ( request.dry || isBuildOnly( request ) )
    {
      if ( request.ask )
        {
          warningLog( request.dry
                        ? "`--ask' has no effect as dry run was requested"
                        : "`--ask' has no effect when only building" );
        }
      this->enter( RS_DONE );
      return;
    }
  if ( request.ask ) { confirmAction( this->confirm ); }

  if ( request.targetHost.has_value() )
    {
      this->enter( RS_COPY_REMOTE );
      this->copyRemote( request, out.get() );
    }

  if ( needsActivation( request ) )
    {
      this->enter( RS_ACTIVATE );
      this->activate( request, out.get(), target );
    }

  if ( needsBootRegistration( request ) )
    {
      this->enter( RS_REGISTER_BOOT );
      this->registerBoot( request, out.get() );
    }

  this->enter( RS_DONE );
  debugLog( "completed with output path " + out.get().string() );
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
