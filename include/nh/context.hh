/* ========================================================================== *
 *
 * @file nh/context.hh
 *
 * @brief The process environment, captured once at startup.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <optional>
#include <string>

#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/** @brief Environment variables holding a default `ref#attr` installable. */
inline constexpr const char * ENV_FLAKE        = "NH_FLAKE";
inline constexpr const char * ENV_OS_FLAKE     = "NH_OS_FLAKE";
inline constexpr const char * ENV_HOME_FLAKE   = "NH_HOME_FLAKE";
inline constexpr const char * ENV_DARWIN_FLAKE = "NH_DARWIN_FLAKE";


/* -------------------------------------------------------------------------- */

/**
 * @brief Ambient values read from the process environment.
 *
 * Built once by `main` and passed down explicitly. Code below the CLI layer
 * never consults `getenv`; tests construct a @a Context by hand.
 */
struct Context
{

  /** `$USER`. */
  std::optional<std::string> user;

  /** `$HOME`. */
  std::optional<std::string> home;

  /** Local hostname as reported by `gethostname(2)`. */
  std::optional<std::string> hostname;

  /** `$NH_SUDO_ASKPASS`, a helper program for `sudo -A`. */
  std::optional<std::string> askpass;

  /** Snapshot of every environment variable at startup. */
  EnvMap environment;

  host_os hostOs = HOST_LINUX;

  /** Whether the effective user is `root`. */
  bool isRoot = false;

  /** Program used to compare two configurations. */
  std::string diffProgram = "dix";


  /** @brief Capture the current process environment. */
  [[nodiscard]] static Context
  fromEnvironment();


  /** @brief Return @a user or throw @a nh::EnvironmentException. */
  [[nodiscard]] const std::string &
  requireUser() const;

  /** @brief Return @a home or throw @a nh::EnvironmentException. */
  [[nodiscard]] const std::string &
  requireHome() const;

  /** @brief Return @a hostname or throw @a nh::EnvironmentException. */
  [[nodiscard]] const std::string &
  requireHostname() const;


  /** @brief Lookup a variable in the startup snapshot. */
  [[nodiscard]] std::optional<std::string>
  getEnv( const std::string & name ) const;

  /** @brief Every `NH_*` variable from the startup snapshot. */
  [[nodiscard]] EnvMap
  nhVariables() const;

  /**
   * @brief Get the installable override for a platform.
   *
   * The platform specific variable ( e.g. `NH_OS_FLAKE` ) is preferred,
   * falling back to `NH_FLAKE`. Empty values are ignored.
   */
  [[nodiscard]] std::optional<std::string>
  flakeOverride( const std::string & platformVar ) const;


}; /* End struct `Context' */


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
