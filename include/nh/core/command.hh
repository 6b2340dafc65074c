/* ========================================================================== *
 *
 * @file nh/core/command.hh
 *
 * @brief Executable command helpers, argument parsers, etc.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "nh/core/exceptions.hh"
#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

/** @brief Executable command helpers, argument parsers, etc. */
namespace nh::command {

/* -------------------------------------------------------------------------- */

/**
 * @brief Add verbosity flags to any parser and modify the global verbosity.
 *
 * Nix verbosity levels for reference:
 *   typedef enum {
 *     lvlError = 0   ( --quiet --quiet --quiet )
 *   , lvlWarn        ( --quiet --quiet )
 *   , lvlNotice      ( --quiet )
 *   , lvlInfo        ( **Default** )
 *   , lvlTalkative   ( -v )
 *   , lvlChatty      ( -vv )
 *   , lvlDebug       ( -vvv )
 *   , lvlVomit       ( -vvvv )
 *   } Verbosity;
 */
struct VerboseParser : public argparse::ArgumentParser
{
  explicit VerboseParser( const std::string & name,
                          const std::string & version = "4.1.0" );
}; /* End struct `VerboseParser' */


/**
 * @class nh::command::InvalidArgException
 * @brief An exception thrown when a command line argument is invalid.
 *
 * @{
 */
NH_DEFINE_EXCEPTION( InvalidArgException, EC_INVALID_ARG, "invalid argument" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief Command line split at the first `--`. */
struct SplitArgs
{
  /** Arguments for our own parser, including `argv[0]`. */
  std::vector<std::string> args;
  /** Everything after `--`, forwarded to `nix`. */
  Args trailing;
}; /* End struct `SplitArgs' */

[[nodiscard]] SplitArgs
splitTrailingArgs( int argc, char * argv[] );


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
