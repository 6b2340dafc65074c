/* ========================================================================== *
 *
 * @file nh/command/elevation.hh
 *
 * @brief Construct `sudo` wrappers for commands which need root.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh {
struct Context;
}


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

class Executor;


/* -------------------------------------------------------------------------- */

/** @brief What an elevated command needs from its wrapper. */
struct ElevationRequest
{
  /** Variables passed through from our environment, sorted. */
  std::vector<std::string> preserve;

  /** Variables set to literal values for the elevated command. */
  EnvMap set;

  /** Whether an askpass helper is configured ( adds `-A` ). */
  bool askpass = false;
}; /* End struct `ElevationRequest' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Builds the argument prefix which runs a command as `root`.
 *
 * The returned vector starts with the wrapper program ( `sudo` ); the
 * elevated program and its arguments are appended by the caller.
 */
class ElevationStrategy
{

public:

  virtual ~ElevationStrategy() = default;

  [[nodiscard]] virtual Args
  buildPrefix( const ElevationRequest & request ) const
    = 0;


}; /* End class `ElevationStrategy' */


/* -------------------------------------------------------------------------- */

/**
 * @brief `sudo [--preserve-env=A,B] [-A] [env K=V ...]`
 */
class LinuxElevation : public ElevationStrategy
{

public:

  [[nodiscard]] Args
  buildPrefix( const ElevationRequest & request ) const override;


}; /* End class `LinuxElevation' */


/* -------------------------------------------------------------------------- */

/**
 * @brief `sudo --set-home [--preserve-env=A,B] [-A] [env K=V ...]`
 *
 * Older `sudo` shipped with macOS lacks `--preserve-env`, in which case
 * nothing is preserved.
 */
class DarwinElevation : public ElevationStrategy
{

private:

  bool supportsPreserveEnv;


public:

  explicit DarwinElevation( bool supportsPreserveEnv )
    : supportsPreserveEnv( supportsPreserveEnv )
  {}

  [[nodiscard]] Args
  buildPrefix( const ElevationRequest & request ) const override;


}; /* End class `DarwinElevation' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Pick the strategy for the host we are running on.
 *
 * On Darwin this runs `sudo --help` once to detect `--preserve-env`.
 */
[[nodiscard]] std::unique_ptr<ElevationStrategy>
makeElevationStrategy( const Context & ctx, Executor & executor );


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
