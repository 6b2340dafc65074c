/* ========================================================================== *
 *
 * @file core/logger.cc
 *
 * @brief Custom `nix::Logger` implementation used by `nh`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unistd.h>

#include <nix/environment-variables.hh>
#include <nix/error.hh>
#include <nix/logging.hh>
#include <nix/shared.hh>
#include <nix/util.hh>

#include "nh/core/logging.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @brief determine if we should use ANSI escape sequences.
 *
 * This is `nix::shouldANSI` with the addition of checking the
 * `NOCOLOR` environment variable ( `nix::shouldANSI` only checks `NO_COLOR` ).
 */
static bool
shouldANSI()
{
  return isatty( STDERR_FILENO )
         && ( nix::getEnv( "TERM" ).value_or( "dumb" ) != "dumb" )
         && ( ! ( nix::getEnv( "NO_COLOR" ).has_value()
                  || nix::getEnv( "NOCOLOR" ).has_value() ) );
}


/* -------------------------------------------------------------------------- */

/**
 * @brief `nix::Logger` which writes plain lines to `stderr`.
 *
 * Child processes ( `nix build`, `nom`, activation scripts ) share our
 * `stderr`, so nothing here redraws or clears lines.
 */
class FilteredLogger : public nix::Logger
{

protected:

  /** @brief Detect ignored warnings. */
  bool
  shouldIgnoreWarning( const std::string & str )
  {
    /* Activation programs print these for every unchanged unit which
     * buries the interesting output. */
    if ( str.find( "the following units were not restarted" )
         != std::string::npos )
      {
        return nix::verbosity < nix::lvlTalkative;
      }
    return false;
  }


public:

  bool systemd;        /**< Whether we should emit `systemd` style logs. */
  bool tty;            /**< Whether we are connected to a TTY. */
  bool color;          /**< Whether we should emit colors in logs. */
  bool printBuildLogs; /**< Whether we should emit build logs. */

  explicit FilteredLogger( bool printBuildLogs )
    : systemd( nix::getEnv( "IN_SYSTEMD" ) == "1" )
    , tty( isatty( STDERR_FILENO ) )
    , color( shouldANSI() )
    , printBuildLogs( printBuildLogs )
  {}


  bool
  isVerbose() override
  {
    return this->printBuildLogs;
  }


  /** @brief Emit a log message with a colored "warning:" prefix. */
  void
  warn( const std::string & msg ) override
  {
    if ( this->shouldIgnoreWarning( msg ) ) { return; }
    this->log( nix::lvlWarn,
               /* ANSI_WARNING */ "\033[35;1m"
                                  "warning:"
                                  /* ANSI_NORMAL */ "\033[0m"
                                  " "
                 + msg );
  }


  /**
   * @brief Emit a log line depending on verbosity setting.
   * @param lvl Minimum required verbosity level to emit the message.
   * @param str The message to emit.
   */
  void
  log( nix::Verbosity lvl, std::string_view str ) override
  {
    if ( nix::verbosity < lvl ) { return; }

    std::string prefix;
    if ( this->systemd )
      {
        char levelChar;
        switch ( lvl )
          {
            case nix::lvlError: levelChar = '3'; break;

            case nix::lvlWarn: levelChar = '4'; break;

            case nix::lvlNotice:
            case nix::lvlInfo: levelChar = '5'; break;

            case nix::lvlTalkative:
            case nix::lvlChatty: levelChar = '6'; break;

            case nix::lvlDebug:
            case nix::lvlVomit: levelChar = '7'; break;

            default: levelChar = '7'; break;
          }
        prefix = std::string( "<" ) + levelChar + ">";
      }

    nix::writeToStderr( prefix + nix::filterANSIEscapes( str, ! this->color )
                        + "\n" );
  }


  void
  logEI( const nix::ErrorInfo & einfo ) override
  {
    std::stringstream oss;
    showErrorInfo( oss, einfo, nix::loggerSettings.showTrace.get() );
    this->log( einfo.level, oss.str() );
  }


  void
  startActivity( nix::ActivityId /* act ( unused ) */
                 ,
                 nix::Verbosity lvl,
                 nix::ActivityType /* type ( unused ) */
                 ,
                 const std::string & str,
                 const Fields & /* fields ( unused ) */
                 ,
                 nix::ActivityId /* parent ( unused ) */
                 ) override
  {
    if ( ( lvl <= nix::verbosity ) && ( ! str.empty() ) )
      {
        this->log( lvl, str + "..." );
      }
  }


  void
  result( nix::ActivityId /* act ( unused ) */
          ,
          nix::ResultType type,
          const Fields &  fields ) override
  {
    if ( ! this->printBuildLogs ) { return; }
    if ( type == nix::resBuildLogLine )
      {
        this->log( nix::lvlError, fields[0].s );
      }
  }


  /**
   * @brief Ask the user a yes/no question.
   *
   * The question is printed to `stderr` followed by a `[y/N]` hint, and the
   * first non-blank character of the next line of `stdin` is returned.
   * An empty line or EOF yields `std::nullopt`.
   */
  std::optional<char>
  ask( std::string_view msg ) override
  {
    nix::writeToStderr( std::string( msg ) + " [y/N] " );
    std::string line;
    if ( ! std::getline( std::cin, line ) ) { return std::nullopt; }
    trim( line );
    if ( line.empty() ) { return std::nullopt; }
    return line.front();
  }


}; /* End class `FilteredLogger' */


/* -------------------------------------------------------------------------- */

nix::Logger *
makeFilteredLogger( bool printBuildLogs )
{
  return new FilteredLogger( printBuildLogs );
}


/* -------------------------------------------------------------------------- */

void
initNix()
{
  static bool didNixInit = false;
  if ( didNixInit ) { return; }

  /* Suppress benign warnings about `nix.conf'. */
  nix::Verbosity oldVerbosity = nix::verbosity;
  nix::verbosity              = nix::lvlError;
  nix::initNix();
  nix::verbosity = oldVerbosity;

  bool printBuildLogs = nix::logger->isVerbose();
  delete nix::logger;
  nix::logger = makeFilteredLogger( printBuildLogs );

  didNixInit = true;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
