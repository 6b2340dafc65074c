/* ========================================================================== *
 *
 * @file nh/core/util.hh
 *
 * @brief Miscellaneous helper functions.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nix/error.hh>
#include <nix/logging.hh>

#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

/**
 * @brief Helper type for `std::visit( overloaded { ... }, x );` pattern.
 *
 * This is a _quality of life_ helper that shortens boilerplate required for
 * creating type matching statements.
 */
template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};

template<class... Ts>
overloaded( Ts... ) -> overloaded<Ts...>;


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @brief Is the string @str a positive natural number?
 * @param str String to test.
 * @return `true` iff @a str is a stringized unsigned integer.
 */
[[nodiscard]] bool
isUInt( std::string_view str );

/**
 * @brief Parse a stringized unsigned integer.
 * @return `std::nullopt` if @a str is not a natural number or overflows.
 */
[[nodiscard]] std::optional<uint64_t>
parseUInt( std::string_view str );


/* -------------------------------------------------------------------------- */

/**
 * @brief Does the string @a str have the prefix @a prefix?
 * @param prefix The prefix to check for.
 * @param str String to test.
 * @return `true` iff @a str has the prefix @a prefix.
 */
[[nodiscard]] bool
hasPrefix( std::string_view prefix, std::string_view str );

/**
 * @brief Does the string @a str have the suffix @a suffix?
 * @param suffix The suffix to check for.
 * @param str String to test.
 * @return `true` iff @a str has the suffix @a suffix.
 */
[[nodiscard]] bool
hasSuffix( std::string_view suffix, std::string_view str );


/* -------------------------------------------------------------------------- */

/** @brief trim from start ( in place ). */
std::string &
ltrim( std::string & str );

/** @brief trim from end ( in place ). */
std::string &
rtrim( std::string & str );

/** @brief trim from both ends ( in place ). */
std::string &
trim( std::string & str );


/** @brief trim from start ( copying ). */
[[nodiscard]] std::string
ltrim_copy( std::string_view str );

/** @brief trim from end ( copying ). */
[[nodiscard]] std::string
rtrim_copy( std::string_view str );

/** @brief trim from both ends ( copying ). */
[[nodiscard]] std::string
trim_copy( std::string_view str );


/* -------------------------------------------------------------------------- */

/**
 * @brief Render an argument vector as a single shell command line.
 *
 * Every element is escaped with `nix::shellEscape` so the result can be fed
 * to `sh -c` or to a remote shell's stdin.
 */
[[nodiscard]] std::string
toCommandLine( std::string_view program, const Args & args );


/* -------------------------------------------------------------------------- */

/**
 * @brief Concatenate the given strings with a separator between
 *        the elements.
 */
template<class Container>
[[nodiscard]] std::string
concatStringsSep( const std::string_view sep, const Container & strings )
{
  size_t size = 0;
  for ( const auto & str : strings )
    {
      size += sep.size() + std::string_view( str ).size();
    }
  std::string rsl;
  rsl.reserve( size );
  for ( auto & idx : strings )
    {
      if ( ! rsl.empty() ) { rsl += sep; }
      rsl += idx;
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

/** @brief Print a log message with the provided log level.
 *
 * This is a macro so that any allocations needed for msg can be optimized out.
 */
#define printLog( lvl, msg ) \
  if ( ! ( ( lvl ) > nix::verbosity ) ) { nix::logger->log( lvl, msg ); }

/** @brief Prints a log message to `stderr` when called with `-vvvv`. */
#define traceLog( msg ) printLog( nix::Verbosity::lvlVomit, msg )

/**
 * @brief Prints a log message to `stderr` when called with `-vvv`.
 */
#define debugLog( msg ) printLog( nix::Verbosity::lvlDebug, msg )

/**
 * @brief Prints a log message to `stderr` when called with `--verbose` or `-v`.
 */
#define verboseLog( msg ) printLog( nix::Verbosity::lvlTalkative, msg )

/** @brief Prints a log message to `stderr` at default verbosity. */
#define infoLog( msg ) printLog( nix::Verbosity::lvlInfo, msg )

/** @brief Prints a warning to `stderr` when verbosity is at least `-q`. */
#define warningLog( msg ) nix::logger->warn( msg )

/** @brief Prints a log message to `stderr` when verbosity is at least `-qq`. */
#define errorLog( msg ) printLog( nix::Verbosity::lvlError, msg )


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
