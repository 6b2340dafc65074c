/* ========================================================================== *
 *
 * @file nh/mixins.hh
 *
 * @brief Argument groups shared by the `os`, `home` and `darwin` commands.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "nh/core/types.hh"
#include "nh/installable.hh"
#include "nh/rebuild.hh"
#include "nh/workflow.hh"


/* -------------------------------------------------------------------------- */

/* Forward Declarations */

namespace argparse {

class Argument;
class ArgumentParser;

}  // namespace argparse


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

struct Context;


/* -------------------------------------------------------------------------- */

/**
 * @brief Selects the configuration tree to operate on.
 *
 * The positional argument is a flake reference `REF[#ATTRS]` unless one of
 * `--file`, `--expr` or `--store-path` is given, in which case it holds the
 * attribute path ( or the store path ).
 * Without any of these the platform's environment override is used, and
 * finally the flake in the current directory.
 */
struct InstallableMixin
{

  std::optional<std::string> positional;
  std::optional<std::string> file;
  std::optional<std::string> expr;
  bool                       storePath = false;

  /** @brief Add the installable arguments to @a parser. */
  void
  addInstallableArgs( argparse::ArgumentParser & parser );

  /**
   * @brief Build the installable from the parsed arguments.
   * @param platformVar e.g. `NH_OS_FLAKE`.
   * @throws command::InvalidArgException for conflicting arguments.
   */
  [[nodiscard]] Installable
  getInstallable( const Context & ctx, const std::string & platformVar ) const;


}; /* End struct `InstallableMixin' */


/* -------------------------------------------------------------------------- */

/** @brief Flags of the rebuild subcommands. */
struct RebuildArgsMixin
{

  bool                                 dry              = false;
  bool                                 ask              = false;
  bool                                 noNom            = false;
  bool                                 bypassRootCheck  = false;
  bool                                 withBootloader   = false;
  bool                                 noSpecialisation = false;
  std::optional<std::filesystem::path> outLink;
  diff_mode                            diff = DIFF_AUTO;
  std::optional<std::string>           configName;
  std::optional<std::string>           specialisation;
  std::optional<std::string>           buildHost;
  std::optional<std::string>           targetHost;
  std::optional<std::string>           backupExtension;

  /** Arguments after `--`, passed on to `nix`. */
  Args extraArgs;


  /** `--dry`, `--ask`, `--no-nom`, `--out-link` and `--diff`. */
  void
  addCommonArgs( argparse::ArgumentParser & parser );

  /** `-H,--hostname NAME`. */
  argparse::Argument &
  addHostnameArg( argparse::ArgumentParser & parser );

  /** `-c,--configuration NAME`. */
  argparse::Argument &
  addConfigurationArg( argparse::ArgumentParser & parser );

  /** `-s,--specialisation NAME` and `-S,--no-specialisation`. */
  void
  addSpecialisationArgs( argparse::ArgumentParser & parser );

  /** `--build-host HOST` and `--target-host HOST`. */
  void
  addRemoteArgs( argparse::ArgumentParser & parser );

  /** `-R,--bypass-root-check`. */
  argparse::Argument &
  addBypassRootCheckArg( argparse::ArgumentParser & parser );

  /** `--with-bootloader`. */
  argparse::Argument &
  addWithBootloaderArg( argparse::ArgumentParser & parser );

  /** `-b,--backup-extension EXT`. */
  argparse::Argument &
  addBackupExtensionArg( argparse::ArgumentParser & parser );


  /** @brief Warn about and drop `--ask` and `--dry` for build-only runs. */
  void
  ignoreDryAndAsk( const std::string & commandName );

  [[nodiscard]] RebuildRequest
  toRebuildRequest( platform_kind   platform,
                    rebuild_variant variant,
                    Installable     installable ) const;


}; /* End struct `RebuildArgsMixin' */


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
