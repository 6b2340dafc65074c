/* ========================================================================== *
 *
 * @file recording-executor.hh
 *
 * @brief An @a nh::command::Executor which records instead of running.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <nix/file-system.hh>

#include "nh/command/elevation.hh"
#include "nh/command/executor.hh"
#include "nh/context.hh"


/* -------------------------------------------------------------------------- */

/** @brief A wait status for a program which exited with @a code. */
static inline int
exitStatus( int code )
{
  return code << 8;
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Records every invocation and answers with scripted results.
 *
 * A response applies to the first invocation whose @a plainLine contains
 * its key. Unmatched invocations succeed with empty output.
 */
class RecordingExecutor : public nh::command::Executor
{

public:

  struct Response
  {
    std::string             key;
    nh::command::ExecResult result;
    /** Only match once. */
    bool once = false;
    bool used = false;
  };

  /** @brief `program arg...`, unquoted, followed by `<<< input`. */
  static std::string
  plainLine( const nh::command::Invocation & invocation )
  {
    std::string line = invocation.program;
    for ( const auto & arg : invocation.args ) { line += " " + arg; }
    if ( invocation.input.has_value() )
      {
        line += " <<< " + *invocation.input;
      }
    return line;
  }

  std::vector<nh::command::Invocation> invocations;
  std::vector<Response>                responses;

  /** Called before answering, e.g. to create a `--out-link`. */
  std::function<void( const nh::command::Invocation & )> onExecute;


  void
  respond( std::string key, int status, std::string output = "" )
  {
    this->responses.push_back(
      Response { std::move( key ),
                 nh::command::ExecResult { status, std::move( output ) },
                 false,
                 false } );
  }

  void
  respondOnce( std::string key, int status, std::string output = "" )
  {
    this->responses.push_back(
      Response { std::move( key ),
                 nh::command::ExecResult { status, std::move( output ) },
                 true,
                 false } );
  }

  nh::command::ExecResult
  answer( const nh::command::Invocation & invocation )
  {
    if ( this->onExecute ) { this->onExecute( invocation ); }
    std::string line = plainLine( invocation );
    for ( auto & response : this->responses )
      {
        if ( response.once && response.used ) { continue; }
        if ( line.find( response.key ) != std::string::npos )
          {
            response.used = true;
            return response.result;
          }
      }
    return nh::command::ExecResult {};
  }

  nh::command::ExecResult
  execute( const nh::command::Invocation & invocation, bool ) override
  {
    this->invocations.push_back( invocation );
    return this->answer( invocation );
  }

  nh::command::ExecResult
  executePipeline( const nh::command::Invocation & head,
                   const nh::command::Invocation & tail ) override
  {
    this->invocations.push_back( head );
    this->invocations.push_back( tail );
    this->answer( head );
    /* The tail decides. */
    return this->answer( tail );
  }

  /** @brief Command lines of every recorded invocation, in order. */
  [[nodiscard]] std::vector<std::string>
  commandLines() const
  {
    std::vector<std::string> rsl;
    for ( const auto & invocation : this->invocations )
      {
        rsl.emplace_back( plainLine( invocation ) );
      }
    return rsl;
  }

  /** @brief Index of the first invocation containing @a needle, or -1. */
  [[nodiscard]] long
  indexOf( const std::string & needle ) const
  {
    std::vector<std::string> lines = this->commandLines();
    for ( size_t idx = 0; idx < lines.size(); ++idx )
      {
        if ( lines[idx].find( needle ) != std::string::npos )
          {
            return static_cast<long>( idx );
          }
      }
    return -1;
  }


}; /* End class `RecordingExecutor' */


/* -------------------------------------------------------------------------- */

/** @brief A context which does not depend on the host running the tests. */
static inline nh::Context
makeTestContext()
{
  nh::Context ctx;
  ctx.user        = "alice";
  ctx.home        = "/home/alice";
  ctx.hostname    = "laptop";
  ctx.environment = { { "PATH", "/run/current-system/sw/bin" },
                      { "HOME", "/home/alice" },
                      { "USER", "alice" },
                      { "NH_FLAKE", "/etc/nixos" } };
  ctx.hostOs      = nh::HOST_LINUX;
  ctx.isRoot      = false;
  return ctx;
}


/* -------------------------------------------------------------------------- */

/** @brief A fresh temporary directory deleted at scope exit. */
struct TempDir
{
  std::filesystem::path path;
  nix::AutoDelete       cleanup;

  TempDir()
    : path( nix::createTempDir( "", "nh-test" ) ), cleanup( this->path, true )
  {}
}; /* End struct `TempDir' */


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
