/* ========================================================================== *
 *
 * @file nh/installable.hh
 *
 * @brief A reference to a configuration expression and its rendering as
 *        `nix` command line arguments.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "nh/core/exceptions.hh"
#include "nh/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

struct Context;


/* -------------------------------------------------------------------------- */

/** @brief A flake reference with an attribute path, `ref#attr`. */
struct FlakeInstallable
{
  std::string reference;
  AttrPath    attribute;
}; /* End struct `FlakeInstallable' */


/** @brief A `nix` file with an attribute path, `--file <path> attr`. */
struct FileInstallable
{
  std::string path;
  AttrPath    attribute;
}; /* End struct `FileInstallable' */


/** @brief An inline `nix` expression, `--expr <expr> attr`. */
struct ExpressionInstallable
{
  std::string expression;
  AttrPath    attribute;
}; /* End struct `ExpressionInstallable' */


/** @brief A path in the `nix` store. */
struct StoreInstallable
{
  std::string path;
}; /* End struct `StoreInstallable' */


/** @brief An already resolved system identifier. */
struct SystemInstallable
{
  std::string system;
}; /* End struct `SystemInstallable' */


/** @brief Where a configuration lives. */
using Installable = std::variant<FlakeInstallable,
                                 FileInstallable,
                                 ExpressionInstallable,
                                 StoreInstallable,
                                 SystemInstallable>;


/* -------------------------------------------------------------------------- */

/**
 * @class nh::ResolutionException
 * @brief An exception thrown when a configuration cannot be located in its
 *        configuration tree.
 * @{
 */
NH_DEFINE_EXCEPTION( ResolutionException,
                     EC_RESOLUTION_FAILURE,
                     "unable to locate configuration" )
/** @} */


/**
 * @class nh::InvalidInstallableException
 * @brief An exception thrown when an installable is used where its kind is
 *        not supported.
 * @{
 */
NH_DEFINE_EXCEPTION( InvalidInstallableException,
                     EC_INVALID_INSTALLABLE,
                     "invalid installable" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief Render @a installable as arguments to `nix build`, `nix eval`,
 *        or `nix repl`.
 *
 * - flake: `[ "<ref>#<attr>" ]`, the `#` is emitted even for an empty path.
 * - file: `[ "--file", <path>, <attr>? ]`.
 * - expression: `[ "--expr", <expr>, <attr>? ]`.
 * - store: `[ <path> ]`.
 * - system: `[ <system> ]`.
 *
 * The attribute argument is omitted entirely when the path is empty.
 */
[[nodiscard]] Args
toBuildArgs( const Installable & installable );

/** @brief Render @a installable for messages, e.g. `.#nixosConfigurations`. */
[[nodiscard]] std::string
displayInstallable( const Installable & installable );

/**
 * @brief The attribute path of @a installable, if its kind carries one.
 *
 * Store and system installables return `std::nullopt`.
 */
[[nodiscard]] std::optional<AttrPath>
getAttribute( const Installable & installable );

/** @brief Parse `<ref>#<attr>` into a flake installable. */
[[nodiscard]] Installable
installableFromEnvOverride( const std::string & value );

void
to_json( nlohmann::json & jto, const Installable & installable );


/* -------------------------------------------------------------------------- */

/**
 * @brief Asks whether an attribute set contains a name.
 *
 * The first argument addresses the attribute set, the second is the name
 * being looked up. Failures to evaluate count as "absent".
 */
using TreeProbe
  = std::function<bool( const Installable & tree, const std::string & name )>;


/**
 * @brief Locate a configuration inside a tree of named configurations.
 *
 * Flake, file, and expression installables with an empty attribute path get
 * @a configType appended, followed by the first name which @a probe finds:
 * @a explicitName when given, otherwise `<user>@<host>` then `<user>`.
 * When @a pushExtraPath is set @a extraPath is appended after the name.
 *
 * Installables with an explicit attribute path, store paths, and system
 * identifiers are returned unchanged.
 *
 * @throws ResolutionException naming every attempted path when no
 *         candidate exists.
 */
[[nodiscard]] Installable
resolveAgainstTree( const Installable &               installable,
                    const std::string &               configType,
                    const AttrPath &                  extraPath,
                    const std::optional<std::string> & explicitName,
                    bool                              pushExtraPath,
                    const TreeProbe &                 probe,
                    const Context &                   ctx );


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
