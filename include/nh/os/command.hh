/* ========================================================================== *
 *
 * @file nh/os/command.hh
 *
 * @brief The `nh os` command.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <utility>

#include "nh/core/command.hh"
#include "nh/core/types.hh"
#include "nh/mixins.hh"
#include "nh/rebuild.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

namespace command {
class CommandRunner;
}


/* -------------------------------------------------------------------------- */

namespace os {

/* -------------------------------------------------------------------------- */

/**
 * @brief Manage a NixOS system.
 *
 * This command has additional subcommands:
 * - `nh os switch|boot|test|build|build-vm [INSTALLABLE] [-- NIX-ARGS...]`
 *   + Build the system configuration and activate it as requested.
 * - `nh os repl [INSTALLABLE]`
 *   + Open `nix repl` on the system configuration.
 * - `nh os rollback [--to N]`
 *   + Return to an earlier generation of the system profile.
 * - `nh os info [--json] [--profile PATH]`
 *   + List the generations of the system profile.
 */
class OsCommand
  : public InstallableMixin
  , public RebuildArgsMixin
{

private:

  command::VerboseParser parser;    /**< `os`          parser */
  command::VerboseParser pSwitch;   /**< `os switch`   parser */
  command::VerboseParser pBoot;     /**< `os boot`     parser */
  command::VerboseParser pTest;     /**< `os test`     parser */
  command::VerboseParser pBuild;    /**< `os build`    parser */
  command::VerboseParser pBuildVm;  /**< `os build-vm` parser */
  command::VerboseParser pRepl;     /**< `os repl`     parser */
  command::VerboseParser pRollback; /**< `os rollback` parser */
  command::VerboseParser pInfo;     /**< `os info`     parser */

  std::optional<uint64_t> rollbackTo;
  bool                    json = false;
  std::filesystem::path   profile;

  void
  addRebuildArgs( command::VerboseParser & parser );

  int
  runRebuild( command::CommandRunner & runner, rebuild_variant variant );

  int
  runRepl( command::CommandRunner & runner );

  int
  runRollback( command::CommandRunner & runner );

  int
  runInfo();


public:

  OsCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  void
  setExtraArgs( Args args )
  {
    this->extraArgs = std::move( args );
  }

  /**
   * @brief Execute the `os` routine.
   * @return `EXIT_SUCCESS` or `EXIT_FAILURE`.
   */
  int
  run( command::CommandRunner & runner );


}; /* End class `OsCommand' */


/* -------------------------------------------------------------------------- */

}  // namespace os

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
