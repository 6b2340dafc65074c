/* ========================================================================== *
 *
 * @file nh/rollback.hh
 *
 * @brief Return the system profile to an earlier generation.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "nh/core/exceptions.hh"
#include "nh/rebuild.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @class nh::ProfileRevertException
 * @brief An exception thrown when activating a generation failed and the
 *        profile could not be pointed back at the previous one.
 *
 * The system is left pointing at the generation which failed to activate.
 * @{
 */
NH_DEFINE_EXCEPTION( ProfileRevertException,
                     EC_PROFILE_REVERT,
                     "failed to restore the system profile" )
/** @} */


/* -------------------------------------------------------------------------- */

struct RollbackRequest
{
  /** Generation to roll back to, the one before the current by default. */
  std::optional<uint64_t> to;

  bool dry = false;
  bool ask = false;

  diff_mode diff = DIFF_AUTO;

  std::optional<std::string> specialisation;
  bool                       noSpecialisation = false;

  bool elevate = true;
}; /* End struct `RollbackRequest' */


/* -------------------------------------------------------------------------- */

class RollbackOrchestrator
{

private:

  command::CommandRunner & runner;
  PlatformLayout           layout;
  ConfirmFn                confirm;


public:

  RollbackOrchestrator( command::CommandRunner & runner,
                        PlatformLayout           layout,
                        ConfirmFn                confirm );

  /**
   * @brief Point the system profile at the selected generation and
   *        activate it.
   *
   * If activation fails the profile is pointed back at the generation which
   * was current before.
   *
   * @throws GenerationException if the generation does not exist.
   * @throws UserRejectedException if the user declines.
   * @throws ActivationException if activation failed and the profile was
   *         restored.
   * @throws ProfileRevertException if activation failed and the profile
   *         could not be restored.
   */
  void
  run( const RollbackRequest & request );


}; /* End class `RollbackOrchestrator' */


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
