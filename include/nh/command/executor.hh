/* ========================================================================== *
 *
 * @file nh/command/executor.hh
 *
 * @brief Spawn external programs.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <optional>
#include <string>

#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

/** @brief A fully rendered process invocation. */
struct Invocation
{

  /** Program name, looked up in `PATH` when it contains no `/`. */
  std::string program;

  Args args;

  /**
   * The complete environment of the child.
   * `std::nullopt` inherits the environment of this process.
   */
  std::optional<EnvMap> environment;

  /** Text written to the child's `stdin`. */
  std::optional<std::string> input;


  /** @brief Render as a shell command line. */
  [[nodiscard]] std::string
  toString() const;


}; /* End struct `Invocation' */


/* -------------------------------------------------------------------------- */

/** @brief The outcome of running an @a Invocation. */
struct ExecResult
{
  /** Raw wait status, zero on success. */
  int status = 0;

  /** Captured `stdout`, empty unless capture was requested. */
  std::string output;
}; /* End struct `ExecResult' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Capability to run external programs.
 *
 * Implementations must return non-zero exit statuses in the result rather
 * than throwing. Failing to spawn a child may throw a `nix::Error`.
 */
class Executor
{

public:

  virtual ~Executor() = default;

  /**
   * @brief Run @a invocation to completion.
   * @param capture Whether `stdout` is captured or inherited.
   */
  virtual ExecResult
  execute( const Invocation & invocation, bool capture )
    = 0;

  /**
   * @brief Run `head |& tail` and wait for both.
   *
   * `stdout` and `stderr` of @a head are fed to @a tail, which inherits
   * our `stdout`. The result is the status of @a tail.
   */
  virtual ExecResult
  executePipeline( const Invocation & head, const Invocation & tail )
    = 0;


}; /* End class `Executor' */


/* -------------------------------------------------------------------------- */

/** @brief Runs programs with `nix`'s process helpers. */
class ProcessExecutor : public Executor
{

public:

  ExecResult
  execute( const Invocation & invocation, bool capture ) override;

  ExecResult
  executePipeline( const Invocation & head, const Invocation & tail ) override;


}; /* End class `ProcessExecutor' */


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
