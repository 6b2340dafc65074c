/* ========================================================================== *
 *
 * @file nh/generations.hh
 *
 * @brief Discover and select the generations recorded by a profile.
 *
 * A profile `<dir>/<name>` is a symlink to one of its generation links
 * `<dir>/<name>-<N>-link`, which in turn point at built configurations.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nh/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

namespace command {
class CommandRunner;
}


/* -------------------------------------------------------------------------- */

/**
 * @class nh::GenerationException
 * @brief An exception thrown when generations cannot be listed or a
 *        requested generation does not exist.
 * @{
 */
NH_DEFINE_EXCEPTION( GenerationException,
                     EC_GENERATION,
                     "error reading generations" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief A single generation of a profile. */
struct GenerationInfo
{

  uint64_t number = 0;

  /** The generation link, `<dir>/<name>-<number>-link`. */
  std::filesystem::path path;

  /** Whether the profile currently points at this generation. */
  bool current = false;

  /** Modification time of the generation link. */
  std::time_t creationTime = 0;

  std::optional<std::string> kernelVersion;
  std::optional<std::string> nixosVersion;
  std::optional<std::string> configurationRevision;


}; /* End struct `GenerationInfo' */


void
to_json( nlohmann::json & jto, const GenerationInfo & generation );


/* -------------------------------------------------------------------------- */

/** @brief `<dir>/<name>-<number>-link` for the profile `<dir>/<name>`. */
[[nodiscard]] std::filesystem::path
generationLinkPath( const std::filesystem::path & profile, uint64_t number );

/**
 * @brief List the generations of @a profile in directory order.
 *
 * At most one entry is flagged `current`. A missing profile symlink yields
 * generations with none flagged.
 *
 * @throws GenerationException if the profile's directory cannot be read.
 */
[[nodiscard]] std::vector<GenerationInfo>
listGenerations( const std::filesystem::path & profile );

/**
 * @brief The generation immediately older than the current one.
 * @throws GenerationException if there are no generations, none is current,
 *         or the current generation is the oldest.
 */
[[nodiscard]] GenerationInfo
findPreviousGeneration( const std::filesystem::path & profile );

/** @throws GenerationException if generation @a number does not exist. */
[[nodiscard]] GenerationInfo
findGenerationByNumber( const std::filesystem::path & profile,
                        uint64_t                      number );

/** @throws GenerationException if no generation is current. */
[[nodiscard]] uint64_t
currentGenerationNumber( const std::filesystem::path & profile );


/* -------------------------------------------------------------------------- */

/**
 * @brief Atomically point @a profile at @a target.
 *
 * A temporary link is created next to the profile and renamed over it.
 * With @a elevate the link and rename are performed through @a runner with
 * `ln` and `mv`, otherwise directly.
 */
void
repointProfile( const std::filesystem::path & profile,
                const std::filesystem::path & target,
                command::CommandRunner &      runner,
                bool                          elevate );


/* -------------------------------------------------------------------------- */

/** @brief Print a table of @a generations, oldest first. */
void
printGenerations( std::ostream & oss, std::vector<GenerationInfo> generations );


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
