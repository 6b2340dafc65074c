/* ========================================================================== *
 *
 * @file nh/command/runner.hh
 *
 * @brief Describe and run local, remote, and elevated commands.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "nh/command/elevation.hh"
#include "nh/command/executor.hh"
#include "nh/core/exceptions.hh"
#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh {
struct Context;
}


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

/** @brief An exception thrown when an external program fails. */
class CommandFailedException : public NhException
{

private:

  /** Raw wait status of the program. */
  int status;


public:

  CommandFailedException( std::string_view description, int status );

  [[nodiscard]] error_category
  getErrorCode() const noexcept override
  {
    return EC_COMMAND_FAILURE;
  }

  [[nodiscard]] std::string_view
  getCategoryMessage() const noexcept override
  {
    return "command failed";
  }

  [[nodiscard]] int
  getStatus() const noexcept
  {
    return this->status;
  }


}; /* End class `CommandFailedException' */


/* -------------------------------------------------------------------------- */

/** @brief How a single environment variable is treated. */
struct EnvAction
{
  enum kind_t { SET, PRESERVE, UNSET };

  kind_t      kind = PRESERVE;
  std::string value;

  [[nodiscard]] static EnvAction
  set( std::string value )
  {
    return EnvAction { SET, std::move( value ) };
  }

  [[nodiscard]] static EnvAction
  preserve()
  {
    return EnvAction { PRESERVE, "" };
  }

  [[nodiscard]] static EnvAction
  unset()
  {
    return EnvAction { UNSET, "" };
  }

  [[nodiscard]] bool
  operator==( const EnvAction & other ) const = default;
}; /* End struct `EnvAction' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Description of an external program to run.
 *
 * Setters return `*this` so commands can be built in one expression:
 * `Command( "nix" ).arg( "build" ).elevate( true )`.
 */
class Command
{

private:

  std::string                      program;
  Args                             arguments;
  std::map<std::string, EnvAction> envPolicy;
  bool                             elevated = false;
  bool                             dryRun   = false;
  std::optional<std::string>       sshHost;
  std::optional<std::string>       msg;


public:

  explicit Command( std::string program ) : program( std::move( program ) ) {}

  Command &
  arg( std::string value );

  Command &
  args( const Args & values );

  /** @brief Set @a name to @a value for the child. */
  Command &
  env( const std::string & name, std::string value );

  /** @brief Pass @a name through from our environment. */
  Command &
  preserveEnv( const std::string & name );

  /** @brief Remove @a name from the child's environment. */
  Command &
  unsetEnv( const std::string & name );

  Command &
  elevate( bool value );

  Command &
  dry( bool value );

  /** @brief Run on @a host through `ssh -T` when set. */
  Command &
  ssh( std::optional<std::string> host );

  /** @brief Message logged at `info` level before running. */
  Command &
  message( std::string value );

  /**
   * @brief Set `HOME` and `USER` from @a ctx and preserve the variables
   *        `nix` reads ( `PATH`, `NIX_CONFIG`, `NIX_PATH`, ... ).
   */
  Command &
  withNixEnv( const Context & ctx );

  /** @brief Set every `NH_*` variable from @a ctx. */
  Command &
  withNhEnv( const Context & ctx );


  [[nodiscard]] const std::string &
  getProgram() const
  {
    return this->program;
  }

  [[nodiscard]] const Args &
  getArgs() const
  {
    return this->arguments;
  }

  [[nodiscard]] const std::map<std::string, EnvAction> &
  getEnvPolicy() const
  {
    return this->envPolicy;
  }

  [[nodiscard]] bool
  isElevated() const
  {
    return this->elevated;
  }

  [[nodiscard]] bool
  isDry() const
  {
    return this->dryRun;
  }

  [[nodiscard]] const std::optional<std::string> &
  getSshHost() const
  {
    return this->sshHost;
  }

  [[nodiscard]] const std::optional<std::string> &
  getMessage() const
  {
    return this->msg;
  }


}; /* End class `Command' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Turns @a Command descriptions into processes.
 *
 * Holds references to its collaborators; they must outlive the runner.
 */
class CommandRunner
{

private:

  const Context &           ctx;
  Executor &                executor;
  const ElevationStrategy & elevation;


public:

  CommandRunner( const Context &           ctx,
                 Executor &                executor,
                 const ElevationStrategy & elevation )
    : ctx( ctx ), executor( executor ), elevation( elevation )
  {}

  /** @brief Render @a cmd as the process which would be spawned. */
  [[nodiscard]] Invocation
  toInvocation( const Command & cmd ) const;

  /**
   * @brief Run @a cmd with inherited `stdout` and `stderr`.
   *
   * A dry command is only logged.
   * @throws CommandFailedException on a non-zero exit or spawn failure.
   */
  void
  run( const Command & cmd );

  /**
   * @brief Run @a cmd and return its `stdout`.
   * @return `std::nullopt` for a dry command.
   * @throws CommandFailedException on a non-zero exit or spawn failure.
   */
  std::optional<std::string>
  capture( const Command & cmd );

  /**
   * @brief Run `head |& tail`.
   * @throws CommandFailedException if @a tail exits non-zero.
   */
  void
  runPipeline( const Command & head, const Command & tail );


  [[nodiscard]] const Context &
  getContext() const
  {
    return this->ctx;
  }


}; /* End class `CommandRunner' */


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
