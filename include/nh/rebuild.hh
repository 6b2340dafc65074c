/* ========================================================================== *
 *
 * @file nh/rebuild.hh
 *
 * @brief Build a configuration, show what changes, and activate it.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nh/core/types.hh"
#include "nh/installable.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

namespace command {
class CommandRunner;
}


/* -------------------------------------------------------------------------- */

/** @brief The kind of configuration being deployed. */
enum platform_kind {
  PLATFORM_NIXOS  = 0,
  PLATFORM_HOME   = 1,
  PLATFORM_DARWIN = 2
}; /* End enum `platform_kind' */

/** @brief What to do with a configuration once it is built. */
enum rebuild_variant {
  /** Activate now and make it the boot default. */
  RV_SWITCH = 0,
  /** Only make it the boot default. */
  RV_BOOT = 1,
  /** Only activate now. */
  RV_TEST = 2,
  /** Only build. */
  RV_BUILD = 3,
  /** Build a virtual machine running the configuration. */
  RV_BUILD_VM = 4
}; /* End enum `rebuild_variant' */

/** @brief Steps of a rebuild, in the order they run. */
enum rebuild_state {
  RS_RESOLVE_INSTALLABLE = 0,
  RS_BUILD,
  RS_RESOLVE_SPECIALISATION,
  RS_DIFF,
  RS_CONFIRM,
  RS_COPY_REMOTE,
  RS_ACTIVATE,
  RS_REGISTER_BOOT,
  RS_DONE
}; /* End enum `rebuild_state' */

[[nodiscard]] std::string_view
rebuildStateName( rebuild_state state );


/* -------------------------------------------------------------------------- */

/** @brief Well known paths of a platform. */
struct PlatformLayout
{

  /** Name of the attribute set holding configurations. */
  std::string configType;

  /** Prefix of temporary output directories. */
  std::string tempPrefix;

  /** The profile made the boot default, empty when there is none. */
  std::filesystem::path systemProfile;

  /** Candidates for the active configuration, the first existing wins. */
  std::vector<std::filesystem::path> currentProfiles;

  /** File naming the active specialisation, empty when unsupported. */
  std::filesystem::path specialisationMarker;


  [[nodiscard]] static PlatformLayout
  nixos();

  [[nodiscard]] static PlatformLayout
  darwin();

  /** @throws EnvironmentException if `USER` or `HOME` are unset. */
  [[nodiscard]] static PlatformLayout
  home( const Context & ctx );


}; /* End struct `PlatformLayout' */


/* -------------------------------------------------------------------------- */

/** @brief Everything a rebuild needs from the command line. */
struct RebuildRequest
{
  platform_kind   platform = PLATFORM_NIXOS;
  rebuild_variant variant  = RV_SWITCH;

  Installable installable = FlakeInstallable { ".", {} };

  /**
   * Configuration name inside the tree.
   * For NixOS and Darwin this is the hostname, for Home-Manager the
   * `user@host` or `user` name.
   */
  std::optional<std::string> configName;

  bool dry = false;
  bool ask = false;
  bool nom = true;

  std::optional<std::filesystem::path> outLink;

  diff_mode diff = DIFF_AUTO;

  std::optional<std::string> specialisation;
  bool                       noSpecialisation = false;

  std::optional<std::string> buildHost;
  std::optional<std::string> targetHost;

  /** Whether privileged steps go through `sudo`. */
  bool elevate = true;

  /** Build `vmWithBootLoader` instead of `vm`. */
  bool withBootloader = false;

  /** Passed to Home-Manager as `HOME_MANAGER_BACKUP_EXT`. */
  std::optional<std::string> backupExtension;

  /** Extra arguments for `nix build` and `nix eval`. */
  Args extraArgs;
}; /* End struct `RebuildRequest' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Runs a rebuild as a strict sequence of steps.
 *
 * @see rebuild_state
 */
class RebuildOrchestrator
{

private:

  command::CommandRunner & runner;
  PlatformLayout           layout;
  TreeProbe                probe;
  ConfirmFn                confirm;

  rebuild_state state = RS_RESOLVE_INSTALLABLE;


  void
  enter( rebuild_state next );

  [[nodiscard]] Installable
  resolveInstallable( const RebuildRequest & request );

  void
  diff( const RebuildRequest &        request,
        const std::filesystem::path & target,
        bool                          hostnameMismatch );

  void
  copyRemote( const RebuildRequest & request, const std::filesystem::path & out );

  void
  activate( const RebuildRequest &        request,
            const std::filesystem::path & out,
            const std::filesystem::path & target );

  void
  registerBoot( const RebuildRequest &        request,
                const std::filesystem::path & out );


public:

  RebuildOrchestrator( command::CommandRunner & runner,
                       PlatformLayout           layout,
                       TreeProbe                probe,
                       ConfirmFn                confirm );

  /** @brief Run every step @a request needs. */
  void
  run( const RebuildRequest & request );

  /** @brief The last step entered. */
  [[nodiscard]] rebuild_state
  getState() const
  {
    return this->state;
  }


}; /* End class `RebuildOrchestrator' */


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
