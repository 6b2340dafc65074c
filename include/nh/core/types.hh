/* ========================================================================== *
 *
 * @file nh/core/types.hh
 *
 * @brief Miscellaneous typedefs and aliases
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <map>
#include <string>
#include <vector>


/* -------------------------------------------------------------------------- */

/** @brief Interfaces for use by `nh`. */
namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @brief A list of attribute names addressing a location in a configuration
 *        tree, e.g. `nixosConfigurations.myhost.config.system.build.toplevel`.
 *
 * Order is significant.
 */
using AttrPath = std::vector<std::string>;

/** @brief An argument vector passed to an external program. */
using Args = std::vector<std::string>;

/** @brief A set of environment variables for a child process. */
using EnvMap = std::map<std::string, std::string>;


/* -------------------------------------------------------------------------- */

/** @brief The kind of host we are running on. */
enum host_os { HOST_LINUX = 0, HOST_DARWIN = 1 };


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
