/* ========================================================================== *
 *
 * @file nh/workflow.hh
 *
 * @brief Steps shared by the rebuild and rollback workflows.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nh/core/exceptions.hh"
#include "nh/core/types.hh"
#include "nh/installable.hh"


/* -------------------------------------------------------------------------- */

namespace nix {
class AutoDelete;
}


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

struct Context;

namespace command {
class CommandRunner;
}


/* -------------------------------------------------------------------------- */

/**
 * @class nh::BuildException
 * @brief An exception thrown when building a configuration fails.
 * @{
 */
NH_DEFINE_EXCEPTION( BuildException,
                     EC_BUILD_FAILURE,
                     "failed to build configuration" )
/** @} */


/**
 * @class nh::ActivationException
 * @brief An exception thrown when a configuration's activation program fails.
 * @{
 */
NH_DEFINE_EXCEPTION( ActivationException,
                     EC_ACTIVATION_FAILURE,
                     "failed to activate configuration" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief Where `nix build` leaves its result link.
 *
 * Either a path chosen by the user or `<tmpdir>/result`, in which case the
 * temporary directory is owned by this object and deleted with it.
 * Keep the object alive until the last step which reads the path.
 */
class OutputPath
{

private:

  std::filesystem::path            path;
  std::unique_ptr<nix::AutoDelete> tempDir;


public:

  explicit OutputPath( std::filesystem::path path );

  OutputPath( std::filesystem::path path, std::unique_ptr<nix::AutoDelete> dir );

  OutputPath( OutputPath && ) noexcept;
  OutputPath &
  operator=( OutputPath && ) noexcept;
  ~OutputPath();

  OutputPath( const OutputPath & ) = delete;
  OutputPath &
  operator=( const OutputPath & )
    = delete;

  /**
   * @brief Use @a outLink when given, otherwise a fresh temporary directory
   *        named after @a prefix.
   */
  [[nodiscard]] static OutputPath
  create( const std::optional<std::filesystem::path> & outLink,
          const std::string &                          prefix );

  [[nodiscard]] const std::filesystem::path &
  get() const
  {
    return this->path;
  }

  [[nodiscard]] bool
  isTemporary() const
  {
    return this->tempDir != nullptr;
  }


}; /* End class `OutputPath' */


/* -------------------------------------------------------------------------- */

/** @brief Arguments to `nix build`. */
struct BuildRequest
{
  Installable                installable;
  std::filesystem::path      outLink;
  Args                       extraArgs;
  std::optional<std::string> builder; /**< Remote builder host. */
  std::string                message = "Building configuration";
  bool                       nom     = true; /**< Pipe logs through `nom`. */
}; /* End struct `BuildRequest' */


/**
 * @brief Run `nix build`, optionally as `nix build ... |& nom --json`.
 * @throws BuildException if the build ( or `nom` ) fails.
 */
void
buildConfiguration( command::CommandRunner & runner,
                    const BuildRequest &     request );


/* -------------------------------------------------------------------------- */

/**
 * @brief Decide which specialisation to activate.
 *
 * @a explicitName wins, then the contents of @a markerFile. A missing or
 * empty marker means no specialisation.
 */
[[nodiscard]] std::optional<std::string>
resolveSpecialisation( bool                               noSpecialisation,
                       const std::optional<std::string> & explicitName,
                       const std::filesystem::path &      markerFile );

/** @brief `<out>/specialisation/<name>`, or @a out itself. */
[[nodiscard]] std::filesystem::path
targetProfilePath( const std::filesystem::path &      out,
                   const std::optional<std::string> & specialisation );


/* -------------------------------------------------------------------------- */

enum diff_mode {
  /** Diff unless the target belongs to another host. */
  DIFF_AUTO = 0,
  /** Diff even when the target belongs to another host. */
  DIFF_ALWAYS = 1,
  DIFF_NEVER  = 2
}; /* End enum `diff_mode' */

/** @throws command::InvalidArgException for unknown names. */
[[nodiscard]] diff_mode
parseDiffMode( const std::string & str );


/** @brief What a failed diff means to the caller. */
enum diff_strictness {
  /** A failing diff tool aborts the workflow. */
  DIFF_STRICT = 0,
  /** A failing diff tool is logged and ignored. */
  DIFF_LENIENT = 1
}; /* End enum `diff_strictness' */


/**
 * @brief Show the changes between @a current and @a target with the
 *        context's diff program.
 */
void
compareConfigurations( command::CommandRunner &      runner,
                       const std::filesystem::path & current,
                       const std::filesystem::path & target,
                       diff_strictness               strictness );


/* -------------------------------------------------------------------------- */

/** @brief Asks the user a yes/no question. */
using ConfirmFn = std::function<bool( const std::string & question )>;

/** @brief Ask through `nix::logger`, only `y` or `Y` count as "yes". */
bool
defaultPrompt( const std::string & question );

/** @throws UserRejectedException if the user declines. */
void
confirmAction( const ConfirmFn & confirm );


/* -------------------------------------------------------------------------- */

/**
 * @brief A @a nh::TreeProbe which asks `nix eval --apply 'x: x ? "name"'`.
 *
 * The returned probe refers to @a runner, which must outlive it.
 */
[[nodiscard]] TreeProbe
makeEvalProbe( command::CommandRunner & runner, Args extraArgs );


/* -------------------------------------------------------------------------- */

/** @brief The hostname a configuration is built for. */
struct TargetHostname
{
  std::string name;
  /** Whether @a name differs from the local hostname. */
  bool mismatch = false;
}; /* End struct `TargetHostname' */

/** @throws EnvironmentException if no hostname is given or detectable. */
[[nodiscard]] TargetHostname
resolveTargetHostname( const std::optional<std::string> & explicitName,
                       const Context &                    ctx );


/**
 * @brief Refuse to run as `root` unless bypassed.
 * @return Whether privileged steps should be elevated with `sudo`.
 * @throws EnvironmentException when running as `root` without @a bypass.
 */
[[nodiscard]] bool
checkNotRoot( bool bypass, const Context & ctx );


/* -------------------------------------------------------------------------- */

/** @brief The first of @a candidates which exists. */
[[nodiscard]] std::optional<std::filesystem::path>
firstExisting( const std::vector<std::filesystem::path> & candidates );


/* -------------------------------------------------------------------------- */

/**
 * @brief Open `nix repl` on a configuration.
 *
 * @throws InvalidInstallableException for store paths.
 */
void
runRepl( command::CommandRunner &           runner,
         const Installable &                installable,
         const std::string &                configType,
         const std::optional<std::string> & configName,
         const TreeProbe &                  probe,
         const Args &                       extraArgs );


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
