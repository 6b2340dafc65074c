/* ========================================================================== *
 *
 * @file nh/core/exceptions.hh
 *
 * @brief Definitions of various `std::exception` children used for throwing
 *        errors with nice messages and typed discrimination.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

enum error_category {
  /** Indicates success or _not an error_. */
  EC_OKAY = 0,
  /**
   * Returned for any exception that doesn't have `getErrorCode()`, i.e.
   * exceptions we haven't wrapped in a custom exception.
   */
  EC_FAILURE = 1,
  /** Generic exception emitted by `nh` routines. */
  EC_NH_EXCEPTION = 100,
  /** A command line argument is invalid. */
  EC_INVALID_ARG,
  /** `nix::Error` that was not caught closer to where it was thrown. */
  EC_NIX,
  /** An attribute path string could not be parsed. */
  EC_ATTR_PATH_PARSE,
  /** An installable was used where its variant is not supported. */
  EC_INVALID_INSTALLABLE,
  /** A configuration could not be located inside a configuration tree. */
  EC_RESOLUTION_FAILURE,
  /** An external program exited with a non-zero status. */
  EC_COMMAND_FAILURE,
  /** Building a configuration failed. */
  EC_BUILD_FAILURE,
  /** The user answered "no" to a confirmation prompt. */
  EC_USER_REJECTED,
  /** Errors while discovering or selecting generations of a profile. */
  EC_GENERATION,
  /** Running a configuration's activation program failed. */
  EC_ACTIVATION_FAILURE,
  /**
   * Restoring a profile symlink after a failed activation failed.
   * The profile may point at a generation which was never activated.
   */
  EC_PROFILE_REVERT,
  /** A required ambient value ( user, home, hostname ) is unavailable. */
  EC_ENVIRONMENT,
}; /* End enum `error_category' */


/* -------------------------------------------------------------------------- */

/** Typed exception wrapper used for misc errors. */
class NhException : public std::exception
{

private:

  /** Additional context added when the error is thrown. */
  std::optional<std::string> contextMsg;

  /**
   * If some other exception was caught before throwing this one, @a caughtMsg
   * contains what() of that exception.
   */
  std::optional<std::string> caughtMsg;

  /** The final what() message. */
  std::string whatMsg;


public:

  /**
   * @brief Create a generic exception with a custom message.
   *
   * This constructor is NOT suitable for use by _child classes_.
   */
  explicit NhException( std::string_view contextMsg )
    : contextMsg( contextMsg )
    , whatMsg( "general error: " + std::string( contextMsg ) )
  {}

  /**
   * @brief Create a generic exception with a custom message and information
   *        from a child error.
   *
   * This constructor is NOT suitable for use by _child classes_.
   */
  explicit NhException( std::string_view contextMsg,
                        std::string_view caughtMsg )
    : contextMsg( contextMsg )
    , caughtMsg( caughtMsg )
    , whatMsg( "general error: " + std::string( contextMsg ) + ": "
               + std::string( caughtMsg ) )
  {}

  /**
   * @brief Directly initialize a NhException with a custom category message,
   *        (optional) _context_, and (optional) information from a child error.
   *
   * This form is recommended for use by _child classes_ which
   * extend @a nh::NhException.
   *
   * @see NH_DEFINE_EXCEPTION
   */
  explicit NhException( std::string_view           categoryMsg,
                        std::optional<std::string> contextMsg,
                        std::optional<std::string> caughtMsg )
    : contextMsg( contextMsg ), caughtMsg( caughtMsg ), whatMsg( categoryMsg )
  {
    if ( contextMsg.has_value() ) { this->whatMsg += ": " + ( *contextMsg ); }
    if ( caughtMsg.has_value() ) { this->whatMsg += ": " + ( *caughtMsg ); }
  }


  [[nodiscard]] virtual error_category
  getErrorCode() const noexcept
  {
    return EC_NH_EXCEPTION;
  }

  [[nodiscard]] std::optional<std::string>
  getContextMessage() const noexcept
  {
    return this->contextMsg;
  }

  [[nodiscard]] std::optional<std::string>
  getCaughtMessage() const noexcept
  {
    return this->caughtMsg;
  }

  [[nodiscard]] virtual std::string_view
  getCategoryMessage() const noexcept
  {
    return "general error";
  }

  /** @brief Produces an explanatory string about an exception. */
  [[nodiscard]] const char *
  what() const noexcept override
  {
    return this->whatMsg.c_str();
  }


}; /* End class `NhException' */


/* -------------------------------------------------------------------------- */

/** @brief Convert a @a nh::NhException to a JSON object. */
void
to_json( nlohmann::json & jto, const NhException & err );


/* -------------------------------------------------------------------------- */

// NOLINTBEGIN(bugprone-macro-parentheses)
//  Disable macro parentheses lint so we can use `NAME' symbol directly.

/**
 * @brief Generate a class definition with an error code and
 *        _category message_.
 *
 * The resulting class will have `NAME()`, `NAME( contextMsg )`,
 * and `NAME( contextMsg, caughtMsg )` constructors available.
 */
#define NH_DEFINE_EXCEPTION( NAME, ERROR_CODE, CATEGORY_MSG )                \
  class NAME : public NhException                                            \
  {                                                                          \
  public:                                                                    \
                                                                             \
    NAME() : NhException( CATEGORY_MSG, std::nullopt, std::nullopt ) {}      \
                                                                             \
    explicit NAME( std::string_view contextMsg )                             \
      : NhException( ( CATEGORY_MSG ),                                       \
                     std::string( contextMsg ),                              \
                     std::nullopt )                                          \
    {}                                                                       \
                                                                             \
    explicit NAME( std::string_view contextMsg, std::string_view caughtMsg ) \
      : NhException( ( CATEGORY_MSG ),                                       \
                     std::string( contextMsg ),                              \
                     std::string( caughtMsg ) )                              \
    {}                                                                       \
                                                                             \
    [[nodiscard]] error_category                                             \
    getErrorCode() const noexcept override                                   \
    {                                                                        \
      return ( ERROR_CODE );                                                 \
    }                                                                        \
                                                                             \
    [[nodiscard]] std::string_view                                           \
    getCategoryMessage() const noexcept override                             \
    {                                                                        \
      return ( CATEGORY_MSG );                                               \
    }                                                                        \
  };
// NOLINTEND(bugprone-macro-parentheses)


/* -------------------------------------------------------------------------- */

/**
 * @class nh::EnvironmentException
 * @brief An exception thrown when a required value from the process
 *        environment is missing or unusable.
 * @{
 */
NH_DEFINE_EXCEPTION( EnvironmentException,
                     EC_ENVIRONMENT,
                     "invalid environment" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @class nh::UserRejectedException
 * @brief An exception thrown when the user declines to apply a configuration.
 * @{
 */
NH_DEFINE_EXCEPTION( UserRejectedException,
                     EC_USER_REJECTED,
                     "user rejected the new configuration" )
/** @} */


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
