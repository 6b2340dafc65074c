/* ========================================================================== *
 *
 * @file core/exceptions.cc
 *
 * @brief Definitions of various `std::exception` children used for throwing
 *        errors with nice messages and typed discrimination.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "nh/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

void
to_json( nlohmann::json & jto, const NhException & err )
{
  jto = {
    { "exit_code", err.getErrorCode() },
    { "category_message", err.getCategoryMessage() },
  };
  auto contextMsg = err.getContextMessage();
  auto caughtMsg  = err.getCaughtMessage();
  if ( contextMsg.has_value() ) { jto["context_message"] = *contextMsg; };
  if ( caughtMsg.has_value() ) { jto["caught_message"] = *caughtMsg; };
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
