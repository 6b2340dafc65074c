/* ========================================================================== *
 *
 * @file command/executor.cc
 *
 * @brief Spawn external programs.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <unistd.h>
#include <vector>

#include <nix/environment-variables.hh>
#include <nix/error.hh>
#include <nix/file-descriptor.hh>
#include <nix/processes.hh>
#include <nix/serialise.hh>
#include <nix/util.hh>

#include "nh/command/executor.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh::command {

/* -------------------------------------------------------------------------- */

std::string
Invocation::toString() const
{
  return toCommandLine( this->program, this->args );
}


/* -------------------------------------------------------------------------- */

ExecResult
ProcessExecutor::execute( const Invocation & invocation, bool capture )
{
  nix::StringSink sink;
  nix::RunOptions options {
    .program    = invocation.program,
    .searchPath = true,
    .args = nix::Strings( invocation.args.begin(), invocation.args.end() ),
  };
  options.environment   = invocation.environment;
  options.input         = invocation.input;
  options.isInteractive = ! capture;
  if ( capture ) { options.standardOut = &sink; }

  try
    {
      nix::runProgram2( options );
    }
  catch ( const nix::ExecError & err )
    {
      debugLog( nix::fmt( "`%s' %s",
                          invocation.program,
                          nix::statusToString( err.status ) ) );
      return ExecResult { err.status, std::move( sink.s ) };
    }
  return ExecResult { 0, std::move( sink.s ) };
}


/* -------------------------------------------------------------------------- */

/** @brief Replace the current ( child ) process with @a invocation. */
[[noreturn]] static void
execInvocation( const Invocation & invocation )
{
  if ( invocation.environment.has_value() )
    {
      nix::replaceEnv( *invocation.environment );
    }
  nix::Strings argv = { invocation.program };
  argv.insert( argv.end(), invocation.args.begin(), invocation.args.end() );
  auto ptrs = nix::stringsToCharPtrs( argv );
  execvp( invocation.program.c_str(), ptrs.data() );
  throw nix::SysError( "executing '%1%'", invocation.program );
}


ExecResult
ProcessExecutor::executePipeline( const Invocation & head,
                                  const Invocation & tail )
{
  nix::Pipe pipe;
  pipe.create();

  nix::Pid headPid( nix::startProcess(
    [&]()
    {
      if ( dup2( pipe.writeSide.get(), STDOUT_FILENO ) == -1 )
        {
          throw nix::SysError( "dupping stdout" );
        }
      if ( dup2( pipe.writeSide.get(), STDERR_FILENO ) == -1 )
        {
          throw nix::SysError( "dupping stderr" );
        }
      pipe.readSide.close();
      pipe.writeSide.close();
      execInvocation( head );
    } ) );

  nix::Pid tailPid( nix::startProcess(
    [&]()
    {
      if ( dup2( pipe.readSide.get(), STDIN_FILENO ) == -1 )
        {
          throw nix::SysError( "dupping stdin" );
        }
      pipe.readSide.close();
      pipe.writeSide.close();
      execInvocation( tail );
    } ) );

  /* Our copies must be closed so `tail' sees EOF once `head' exits. */
  pipe.readSide.close();
  pipe.writeSide.close();

  int tailStatus = tailPid.wait();
  int headStatus = headPid.wait();
  if ( headStatus != 0 )
    {
      debugLog( nix::fmt( "`%s' %s",
                          head.program,
                          nix::statusToString( headStatus ) ) );
    }
  return ExecResult { tailStatus, "" };
}


/* -------------------------------------------------------------------------- */

}  // namespace nh::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
