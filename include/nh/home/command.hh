/* ========================================================================== *
 *
 * @file nh/home/command.hh
 *
 * @brief The `nh home' command.
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

namespace home {

/* -------------------------------------------------------------------------- */

/** @brief Manage a Home-Manager configuration. */
class HomeCommand
  : public InstallableMixin
  , public RebuildArgsMixin
{

private:

  command::VerboseParser parser;  /**< `home'        parser */
  command::VerboseParser pSwitch; /**< `home switch' parser */
  command::VerboseParser pBuild;  /**< `home build'  parser */
  command::VerboseParser pRepl;   /**< `home repl'   parser */

  void
  addRebuildArgs( command::VerboseParser & parser );

  int
  runRebuild( command::CommandRunner & runner, rebuild_variant variant );

  int
  runRepl( command::CommandRunner & runner );


public:

  HomeCommand();

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


}; /* End class `HomeCommand' */


/* -------------------------------------------------------------------------- */

}  // namespace home

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
