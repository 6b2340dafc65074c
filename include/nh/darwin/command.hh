/* ========================================================================== *
 *
 * @file nh/darwin/command.hh
 *
 * @brief The `nh darwin' command.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

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

namespace darwin {

/* -------------------------------------------------------------------------- */

/** @brief Manage a nix-darwin system. */
class DarwinCommand
  : public InstallableMixin
  , public RebuildArgsMixin
{

private:

  command::VerboseParser parser;  /**< `darwin'        parser */
  command::VerboseParser pSwitch; /**< `darwin switch' parser */
  command::VerboseParser pBuild;  /**< `darwin build'  parser */
  command::VerboseParser pRepl;   /**< `darwin repl'   parser */

  void
  addRebuildArgs( command::VerboseParser & parser );

  int
  runRebuild( command::CommandRunner & runner, rebuild_variant variant );

  int
  runRepl( command::CommandRunner & runner );


public:

  DarwinCommand();

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

  int
  run( command::CommandRunner & runner );


}; /* End class `DarwinCommand' */


/* -------------------------------------------------------------------------- */

}  // namespace darwin

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
