/* ========================================================================== *
 *
 * @file nh/core/logging.hh
 *
 * @brief Process wide `nix` logger setup.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once


/* -------------------------------------------------------------------------- */

/* Forward Declarations. */

namespace nix {
class Logger;
}


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @brief Create a custom `nix::Logger` which emits plain lines to `stderr`
 *        and answers confirmation prompts from `stdin`.
 */
nix::Logger *
makeFilteredLogger( bool printBuildLogs );


/* -------------------------------------------------------------------------- */

/**
 * @brief Perform one time `nix` global runtime setup.
 *
 * You may safely call this function multiple times, after the first invocation
 * it is effectively a no-op.
 *
 * This replaces the default `nix::Logger` with a @a nh::FilteredLogger.
 */
void
initNix();


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
