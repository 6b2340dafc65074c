/* ========================================================================== *
 *
 * @file nh/attr-path.hh
 *
 * @brief Parse and render dotted attribute paths such as
 *        `nixosConfigurations."my.host".config`.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>
#include <string_view>

#include "nh/core/exceptions.hh"
#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @class nh::AttrPathParseException
 * @brief An exception thrown when an attribute path string is malformed.
 * @{
 */
NH_DEFINE_EXCEPTION( AttrPathParseException,
                     EC_ATTR_PATH_PARSE,
                     "error parsing attribute path" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief Split a dotted attribute path into its segments.
 *
 * Segments are separated by `.` outside of double quotes. Quotes are removed
 * and their contents kept verbatim, so `foo."bar.baz"` parses as
 * `[ "foo", "bar.baz" ]`. Whitespace surrounding each segment is ignored.
 * An empty or all-whitespace string is the empty path.
 *
 * @throws AttrPathParseException if a quote is never closed.
 */
[[nodiscard]] AttrPath
parseAttrPath( std::string_view input );

/**
 * @brief Render @a path in the syntax read by @a nh::parseAttrPath.
 *
 * Segments which contain `.`, are empty, or have surrounding whitespace are
 * wrapped in double quotes.
 */
[[nodiscard]] std::string
joinAttrPath( const AttrPath & path );

/** @brief Render @a str as a `nix` string literal. */
[[nodiscard]] std::string
quoteNixString( std::string_view str );


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
