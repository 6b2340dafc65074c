/* ========================================================================== *
 *
 * @file rebuild.cc
 *
 * @brief Tests for `nh::RebuildOrchestrator`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "capture-logger.hh"
#include "nh/command/elevation.hh"
#include "nh/command/runner.hh"
#include "nh/rebuild.hh"
#include "recording-executor.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nh;

/* -------------------------------------------------------------------------- */

static bool
probeAlways( const Installable &, const std::string & )
{
  return true;
}

static bool
probeNever( const Installable &, const std::string & )
{
  return false;
}


/* -------------------------------------------------------------------------- */

/**
 * @brief A fake machine: a pre-built `result`, an active configuration and
 *        a recording executor.
 *
 * Paths are canonical since activation programs are resolved through
 * symlinks.
 */
struct Fixture
{

  TempDir                 tmp;
  std::filesystem::path   root = std::filesystem::canonical( this->tmp.path );
  Context                 ctx = makeTestContext();
  RecordingExecutor       executor;
  command::LinuxElevation elevation;
  command::CommandRunner  runner;
  PlatformLayout          layout;
  int                     prompts = 0;
  bool                    answer  = true;

  Fixture() : runner( this->ctx, this->executor, this->elevation )
  {
    std::filesystem::create_directories( this->root / "result" / "bin" );
    std::filesystem::create_directories( this->root / "current" );
    this->layout = PlatformLayout { "nixosConfigurations",
                                    "nh-test",
                                    this->root / "profiles" / "system",
                                    { this->root / "current" },
                                    this->root / "specialisation" };
  }

  [[nodiscard]] std::filesystem::path
  out() const
  {
    return this->root / "result";
  }

  [[nodiscard]] RebuildRequest
  request( platform_kind platform, rebuild_variant variant ) const
  {
    RebuildRequest request;
    request.platform    = platform;
    request.variant     = variant;
    request.installable = FlakeInstallable { "/etc/nixos", {} };
    if ( platform != PLATFORM_HOME ) { request.configName = "laptop"; }
    request.nom     = false;
    request.outLink = this->out();
    return request;
  }

  [[nodiscard]] RebuildOrchestrator
  orchestrator( TreeProbe probe = probeAlways )
  {
    return RebuildOrchestrator( this->runner,
                                this->layout,
                                std::move( probe ),
                                [this]( const std::string & )
                                {
                                  ++this->prompts;
                                  return this->answer;
                                } );
  }

  [[nodiscard]] long
  indexOf( const std::string & needle ) const
  {
    return this->executor.indexOf( needle );
  }


}; /* End struct `Fixture' */


/* -------------------------------------------------------------------------- */

/** @brief Build, diff, activate, then register for boot. */
bool
test_switchOrder()
{
  Fixture fx;
  auto    orchestrator = fx.orchestrator();
  orchestrator.run( fx.request( PLATFORM_NIXOS, RV_SWITCH ) );

  long build = fx.indexOf( "nix build /etc/nixos#nixosConfigurations.laptop."
                           "config.system.build.toplevel --out-link" );
  long diff     = fx.indexOf( "dix " );
  long activate = fx.indexOf( "sudo " + fx.out().string()
                              + "/bin/switch-to-configuration test" );
  long profile  = fx.indexOf( "nix build --no-link --profile "
                             + fx.layout.systemProfile.string() );
  long boot     = fx.indexOf( "/bin/switch-to-configuration boot" );

  EXPECT_EQ( build, 0L );
  EXPECT( build < diff );
  EXPECT( diff < activate );
  EXPECT( activate < profile );
  EXPECT( profile < boot );
  EXPECT_EQ( orchestrator.getState(), RS_DONE );
  EXPECT_EQ( fx.prompts, 0 );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_bootSkipsActivation()
{
  Fixture fx;
  auto    orchestrator = fx.orchestrator();
  orchestrator.run( fx.request( PLATFORM_NIXOS, RV_BOOT ) );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration test" ), -1L );
  EXPECT( fx.indexOf( "switch-to-configuration boot" ) != -1L );
  return true;
}


bool
test_testSkipsBoot()
{
  Fixture fx;
  auto    orchestrator = fx.orchestrator();
  orchestrator.run( fx.request( PLATFORM_NIXOS, RV_TEST ) );
  EXPECT( fx.indexOf( "switch-to-configuration test" ) != -1L );
  EXPECT_EQ( fx.indexOf( "--profile" ), -1L );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration boot" ), -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A dry run with `--ask` neither prompts nor activates. */
bool
test_dryWithAsk()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_SWITCH );
  request.dry                 = true;
  request.ask                 = true;
  LogCapture capture;
  orchestrator.run( request );

  EXPECT( capture.logger.hasWarning(
    "`--ask' has no effect as dry run was requested" ) );
  EXPECT_EQ( fx.prompts, 0 );
  EXPECT( fx.indexOf( "dix " ) != -1L );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration" ), -1L );
  EXPECT_EQ( fx.indexOf( "--profile" ), -1L );
  EXPECT_EQ( orchestrator.getState(), RS_DONE );
  return true;
}


bool
test_buildWithAsk()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD );
  request.ask                 = true;
  LogCapture capture;
  orchestrator.run( request );

  EXPECT( capture.logger.hasWarning(
    "`--ask' has no effect when only building" ) );
  EXPECT_EQ( fx.prompts, 0 );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration" ), -1L );
  EXPECT_EQ( fx.indexOf( "sudo" ), -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Declining stops before anything is activated. */
bool
test_rejected()
{
  Fixture fx;
  fx.answer                   = false;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_SWITCH );
  request.ask                 = true;

  EXPECT_THROWS( orchestrator.run( request ), UserRejectedException );
  EXPECT_EQ( fx.prompts, 1 );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration" ), -1L );
  EXPECT_EQ( orchestrator.getState(), RS_CONFIRM );
  return true;
}


bool
test_accepted()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_TEST );
  request.ask                 = true;
  orchestrator.run( request );
  EXPECT_EQ( fx.prompts, 1 );
  EXPECT( fx.indexOf( "switch-to-configuration test" ) != -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_resolutionFailure()
{
  Fixture fx;
  auto    orchestrator = fx.orchestrator( probeNever );
  EXPECT_THROWS( orchestrator.run( fx.request( PLATFORM_NIXOS, RV_SWITCH ) ),
                 ResolutionException );
  EXPECT( fx.executor.invocations.empty() );
  EXPECT_EQ( orchestrator.getState(), RS_RESOLVE_INSTALLABLE );
  return true;
}


bool
test_buildFailure()
{
  Fixture fx;
  fx.executor.respond( "--out-link", exitStatus( 1 ) );
  auto orchestrator = fx.orchestrator();
  EXPECT_THROWS( orchestrator.run( fx.request( PLATFORM_NIXOS, RV_SWITCH ) ),
                 BuildException );
  EXPECT_EQ( fx.executor.invocations.size(), static_cast<size_t>( 1 ) );
  EXPECT_EQ( orchestrator.getState(), RS_BUILD );
  return true;
}


bool
test_activationFailure()
{
  Fixture fx;
  fx.executor.respond( "switch-to-configuration test", exitStatus( 4 ) );
  auto orchestrator = fx.orchestrator();
  EXPECT_THROWS( orchestrator.run( fx.request( PLATFORM_NIXOS, RV_SWITCH ) ),
                 ActivationException );
  EXPECT_EQ( fx.indexOf( "--profile" ), -1L );
  EXPECT_EQ( orchestrator.getState(), RS_ACTIVATE );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A failing diff aborts a NixOS rebuild. */
bool
test_strictDiff()
{
  Fixture fx;
  fx.executor.respond( "dix ", exitStatus( 1 ) );
  auto orchestrator = fx.orchestrator();
  EXPECT_THROWS( orchestrator.run( fx.request( PLATFORM_NIXOS, RV_SWITCH ) ),
                 command::CommandFailedException );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration" ), -1L );
  return true;
}


/** @brief Another host's configuration is only compared on request. */
bool
test_hostnameMismatchDiff()
{
  {
    Fixture        fx;
    auto           orchestrator = fx.orchestrator();
    RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD );
    request.configName          = "server";
    orchestrator.run( request );
    EXPECT_EQ( fx.indexOf( "dix " ), -1L );
    EXPECT( fx.indexOf( "nixosConfigurations.server" ) != -1L );
  }
  {
    Fixture        fx;
    auto           orchestrator = fx.orchestrator();
    RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD );
    request.configName          = "server";
    request.diff                = DIFF_ALWAYS;
    orchestrator.run( request );
    EXPECT( fx.indexOf( "dix " ) != -1L );
  }
  {
    Fixture        fx;
    auto           orchestrator = fx.orchestrator();
    RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD );
    request.diff                = DIFF_NEVER;
    orchestrator.run( request );
    EXPECT_EQ( fx.indexOf( "dix " ), -1L );
  }
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief The marker selects what is activated, boot uses the base. */
bool
test_specialisationMarker()
{
  Fixture fx;
  {
    std::ofstream marker( fx.layout.specialisationMarker );
    marker << "gaming\n";
  }
  auto orchestrator = fx.orchestrator();
  orchestrator.run( fx.request( PLATFORM_NIXOS, RV_SWITCH ) );
  EXPECT( fx.indexOf( "result/specialisation/gaming/bin/"
                      "switch-to-configuration test" )
          != -1L );
  EXPECT( fx.indexOf( "result/bin/switch-to-configuration boot" ) != -1L );
  EXPECT( fx.indexOf( "dix " + fx.root.string() + "/current "
                      + fx.out().string() + "/specialisation/gaming" )
          != -1L );
  return true;
}


bool
test_specialisationOverride()
{
  Fixture fx;
  {
    std::ofstream marker( fx.layout.specialisationMarker );
    marker << "gaming\n";
  }
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_TEST );
  request.specialisation      = "work";
  orchestrator.run( request );
  EXPECT( fx.indexOf( "specialisation/work/bin/switch-to-configuration test" )
          != -1L );

  Fixture        plain;
  auto           second = plain.orchestrator();
  RebuildRequest none   = plain.request( PLATFORM_NIXOS, RV_TEST );
  none.specialisation   = "work";
  none.noSpecialisation = true;
  second.run( none );
  EXPECT_EQ( plain.indexOf( "specialisation/" ), -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief The closure is copied before anything runs on the target host. */
bool
test_remoteTarget()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_SWITCH );
  request.targetHost          = "server";
  request.buildHost           = "builder";
  orchestrator.run( request );

  EXPECT( fx.indexOf( "--builders ssh://builder - - - 100" ) != -1L );
  long copy     = fx.indexOf( "nix copy --to ssh://server" );
  long activate = fx.indexOf( "ssh -T server <<< 'sudo' " );
  long profile  = fx.indexOf( "'--profile'" );
  EXPECT( copy != -1L );
  EXPECT( copy < activate );
  EXPECT( activate < profile );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_nomPipeline()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD );
  request.nom                 = true;
  orchestrator.run( request );
  EXPECT( fx.indexOf( "--log-format internal-json --verbose" ) == 0L );
  EXPECT_EQ( fx.indexOf( "nom --json" ), 1L );
  return true;
}


bool
test_buildVm()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD_VM );
  request.withBootloader      = true;
  orchestrator.run( request );
  EXPECT( fx.indexOf( "nixosConfigurations.laptop.config.system.build."
                      "vmWithBootLoader" )
          == 0L );
  EXPECT_EQ( fx.indexOf( "sudo" ), -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A temporary result lives exactly as long as the rebuild. */
bool
test_temporaryOutput()
{
  Fixture        fx;
  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_NIXOS, RV_BUILD );
  request.outLink.reset();

  std::filesystem::path seen;
  bool                  existedDuringBuild = false;
  fx.executor.onExecute = [&]( const command::Invocation & invocation )
  {
    for ( size_t idx = 0; ( idx + 1 ) < invocation.args.size(); ++idx )
      {
        if ( invocation.args[idx] == "--out-link" )
          {
            seen = invocation.args[idx + 1];
            existedDuringBuild = std::filesystem::exists( seen.parent_path() );
          }
      }
  };
  orchestrator.run( request );

  EXPECT( ! seen.empty() );
  EXPECT( existedDuringBuild );
  EXPECT_EQ( seen.filename(), std::filesystem::path( "result" ) );
  EXPECT( ! std::filesystem::exists( seen.parent_path() ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Home-Manager activates unelevated and tolerates a failed diff. */
bool
test_home()
{
  Fixture fx;
  fx.layout.configType = "homeConfigurations";
  fx.layout.systemProfile.clear();
  fx.layout.specialisationMarker.clear();
  fx.executor.respond( "dix ", exitStatus( 1 ) );

  auto           orchestrator = fx.orchestrator();
  RebuildRequest request      = fx.request( PLATFORM_HOME, RV_SWITCH );
  request.elevate             = false;
  request.backupExtension     = "bak";
  orchestrator.run( request );

  EXPECT( fx.indexOf( "homeConfigurations.alice@laptop.config.home."
                      "activationPackage" )
          == 0L );
  long activate = fx.indexOf( fx.out().string() + "/activate" );
  EXPECT( activate != -1L );
  const command::Invocation & inv
    = fx.executor.invocations[static_cast<size_t>( activate )];
  EXPECT_EQ( inv.program, ( fx.out() / "activate" ).string() );
  EXPECT( inv.environment.has_value() );
  EXPECT_EQ( inv.environment->at( "HOME_MANAGER_BACKUP_EXT" ),
             std::string( "bak" ) );
  EXPECT_EQ( fx.indexOf( "sudo" ), -1L );
  EXPECT_EQ( fx.indexOf( "--profile" ), -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_darwin()
{
  Fixture fx;
  fx.layout.configType = "darwinConfigurations";
  fx.layout.specialisationMarker.clear();

  auto orchestrator = fx.orchestrator();
  orchestrator.run( fx.request( PLATFORM_DARWIN, RV_SWITCH ) );

  long activate = fx.indexOf( "sudo " + fx.out().string()
                              + "/sw/bin/darwin-rebuild activate" );
  long profile  = fx.indexOf( "nix build --no-link --profile" );
  EXPECT( activate != -1L );
  EXPECT( activate < profile );
  EXPECT_EQ( fx.indexOf( "switch-to-configuration" ), -1L );
  return true;
}


/** @brief A working `activate-user` means activation runs as the user. */
bool
test_darwinUserActivation()
{
  Fixture fx;
  fx.layout.configType = "darwinConfigurations";
  fx.layout.specialisationMarker.clear();
  {
    std::ofstream script( fx.out() / "activate-user" );
    script << "#!/bin/sh\necho activating user\n";
  }

  auto orchestrator = fx.orchestrator();
  orchestrator.run( fx.request( PLATFORM_DARWIN, RV_SWITCH ) );
  EXPECT( fx.indexOf( fx.out().string() + "/sw/bin/darwin-rebuild activate" )
          != -1L );
  EXPECT_EQ( fx.indexOf( "sudo " + fx.out().string() + "/sw/bin/darwin-rebuild" ),
             -1L );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int exitCode = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( exitCode, __VA_ARGS__ )

  RUN_TEST( switchOrder );
  RUN_TEST( bootSkipsActivation );
  RUN_TEST( testSkipsBoot );
  RUN_TEST( dryWithAsk );
  RUN_TEST( buildWithAsk );
  RUN_TEST( rejected );
  RUN_TEST( accepted );
  RUN_TEST( resolutionFailure );
  RUN_TEST( buildFailure );
  RUN_TEST( activationFailure );
  RUN_TEST( strictDiff );
  RUN_TEST( hostnameMismatchDiff );
  RUN_TEST( specialisationMarker );
  RUN_TEST( specialisationOverride );
  RUN_TEST( remoteTarget );
  RUN_TEST( nomPipeline );
  RUN_TEST( buildVm );
  RUN_TEST( temporaryOutput );
  RUN_TEST( home );
  RUN_TEST( darwin );
  RUN_TEST( darwinUserActivation );

  return exitCode;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
