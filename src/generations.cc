/* ========================================================================== *
 *
 * @file generations.cc
 *
 * @brief Discover and select the generations recorded by a profile.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

#include <nix/error.hh>
#include <nix/file-system.hh>
#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "nh/command/runner.hh"
#include "nh/core/util.hh"
#include "nh/generations.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/**
 * @brief Parse the number out of `<name>-<number>-link`.
 * @return `std::nullopt` if @a filename does not belong to the profile.
 */
static std::optional<uint64_t>
parseGenerationNumber( const std::string & name, const std::string & filename )
{
  const std::string prefix = name + "-";
  const std::string suffix = "-link";
  if ( filename.size() <= ( prefix.size() + suffix.size() ) )
    {
      return std::nullopt;
    }
  if ( ! ( hasPrefix( prefix, filename ) && hasSuffix( suffix, filename ) ) )
    {
      return std::nullopt;
    }
  return parseUInt( std::string_view( filename ).substr(
    prefix.size(),
    filename.size() - prefix.size() - suffix.size() ) );
}


/** @brief Read a small metadata file, ignoring a missing or empty one. */
static std::optional<std::string>
readMetadataFile( const std::filesystem::path & path )
{
  std::error_code err;
  if ( ! std::filesystem::is_regular_file( path, err ) ) { return std::nullopt; }
  try
    {
      std::string contents = trim_copy( nix::readFile( path.string() ) );
      if ( contents.empty() ) { return std::nullopt; }
      return contents;
    }
  catch ( const nix::Error & readErr )
    {
      debugLog( nix::fmt( "unable to read `%s': %s",
                          path.string(),
                          readErr.what() ) );
      return std::nullopt;
    }
}


/** @brief The first directory under `kernel-modules/lib/modules`. */
static std::optional<std::string>
readKernelVersion( const std::filesystem::path & generation )
{
  std::error_code                     err;
  std::filesystem::directory_iterator modules(
    generation / "kernel-modules" / "lib" / "modules",
    err );
  if ( err ) { return std::nullopt; }
  for ( const auto & entry : modules )
    {
      return entry.path().filename().string();
    }
  return std::nullopt;
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
generationLinkPath( const std::filesystem::path & profile, uint64_t number )
{
  return profile.parent_path()
         / nix::fmt( "%s-%d-link", profile.filename().string(), number );
}


/* -------------------------------------------------------------------------- */

std::vector<GenerationInfo>
listGenerations( const std::filesystem::path & profile )
{
  const std::filesystem::path dir
    = profile.has_parent_path() ? profile.parent_path()
                                : std::filesystem::path( "." );
  const std::string name = profile.filename().string();

  /* Which generation does the profile name directly? */
  std::optional<uint64_t>              linkedNumber;
  std::optional<std::filesystem::path> profileTarget;
  std::error_code                      err;
  if ( std::filesystem::is_symlink( profile, err ) )
    {
      std::filesystem::path immediate
        = std::filesystem::read_symlink( profile, err );
      if ( ! err )
        {
          std::filesystem::path resolved
            = immediate.is_absolute() ? immediate : ( dir / immediate );
          std::error_code dirErr;
          if ( std::filesystem::weakly_canonical( resolved.parent_path(),
                                                  dirErr )
               == std::filesystem::weakly_canonical( dir, dirErr ) )
            {
              linkedNumber
                = parseGenerationNumber( name,
                                         resolved.filename().string() );
            }
        }
      std::error_code canonErr;
      auto            target = std::filesystem::canonical( profile, canonErr );
      if ( ! canonErr ) { profileTarget = target; }
    }

  std::vector<GenerationInfo> generations;
  std::error_code             iterErr;
  std::filesystem::directory_iterator entries( dir, iterErr );
  if ( iterErr )
    {
      throw GenerationException( "unable to read profile directory `"
                                   + dir.string() + "'",
                                 iterErr.message() );
    }

  for ( const auto & entry : entries )
    {
      auto number
        = parseGenerationNumber( name, entry.path().filename().string() );
      if ( ! number.has_value() ) { continue; }

      GenerationInfo info;
      info.number = *number;
      info.path   = entry.path();
      try
        {
          info.creationTime = nix::lstat( info.path.string() ).st_mtime;
        }
      catch ( const nix::Error & statErr )
        {
          throw GenerationException( "unable to stat `" + info.path.string()
                                       + "'",
                                     statErr.what() );
        }
      info.kernelVersion = readKernelVersion( info.path );
      info.nixosVersion  = readMetadataFile( info.path / "nixos-version" );
      info.configurationRevision
        = readMetadataFile( info.path / "configuration-revision" );
      generations.emplace_back( std::move( info ) );
    }

  if ( linkedNumber.has_value() )
    {
      for ( auto & generation : generations )
        {
          generation.current = generation.number == *linkedNumber;
        }
    }
  else if ( profileTarget.has_value() )
    {
      /* Several generations may share a target, the newest one wins. */
      GenerationInfo * newest = nullptr;
      for ( auto & generation : generations )
        {
          std::error_code canonErr;
          auto target = std::filesystem::canonical( generation.path, canonErr );
          if ( ( ! canonErr ) && ( target == *profileTarget )
               && ( ( newest == nullptr )
                    || ( newest->number < generation.number ) ) )
            {
              newest = &generation;
            }
        }
      if ( newest != nullptr ) { newest->current = true; }
    }

  return generations;
}


/* -------------------------------------------------------------------------- */

GenerationInfo
findPreviousGeneration( const std::filesystem::path & profile )
{
  std::vector<GenerationInfo> generations = listGenerations( profile );
  if ( generations.empty() )
    {
      throw GenerationException( "no generations found for profile `"
                                 + profile.string() + "'" );
    }

  std::sort( generations.begin(),
             generations.end(),
             []( const GenerationInfo & lhs, const GenerationInfo & rhs )
             { return lhs.number < rhs.number; } );

  auto current = std::find_if( generations.begin(),
                               generations.end(),
                               []( const GenerationInfo & generation )
                               { return generation.current; } );
  if ( current == generations.end() )
    {
      throw GenerationException( "current generation not found" );
    }
  if ( current == generations.begin() )
    {
      throw GenerationException(
        "no generation older than the current one exists" );
    }
  return *( current - 1 );
}


GenerationInfo
findGenerationByNumber( const std::filesystem::path & profile,
                        uint64_t                      number )
{
  for ( auto & generation : listGenerations( profile ) )
    {
      if ( generation.number == number ) { return generation; }
    }
  throw GenerationException( nix::fmt( "generation %d not found", number ) );
}


uint64_t
currentGenerationNumber( const std::filesystem::path & profile )
{
  for ( const auto & generation : listGenerations( profile ) )
    {
      if ( generation.current ) { return generation.number; }
    }
  throw GenerationException( "current generation not found" );
}


/* -------------------------------------------------------------------------- */

void
repointProfile( const std::filesystem::path & profile,
                const std::filesystem::path & target,
                command::CommandRunner &      runner,
                bool                          elevate )
{
  /* Generation links next to the profile are referenced relatively, the way
   * `nix-env' creates them. */
  std::filesystem::path linkTarget
    = ( target.parent_path() == profile.parent_path() ) ? target.filename()
                                                        : target;

  if ( ! elevate )
    {
      try
        {
          nix::replaceSymlink( linkTarget.string(), profile.string() );
        }
      catch ( const nix::Error & err )
        {
          throw GenerationException( "failed to point `" + profile.string()
                                       + "' at `" + target.string() + "'",
                                     err.what() );
        }
      return;
    }

  std::filesystem::path tmp = profile;
  tmp += nix::fmt( ".tmp-%d", getpid() );
  runner.run( command::Command( "ln" )
                .args( { "-sfn", linkTarget.string(), tmp.string() } )
                .elevate( true ) );
  try
    {
      runner.run( command::Command( "mv" )
                    .args( { "-Tf", tmp.string(), profile.string() } )
                    .elevate( true ) );
    }
  catch ( const command::CommandFailedException & )
    {
      try
        {
          runner.run( command::Command( "rm" )
                        .args( { "-f", tmp.string() } )
                        .elevate( true ) );
        }
      catch ( const command::CommandFailedException & cleanupErr )
        {
          warningLog( nix::fmt( "failed to remove temporary link `%s': %s",
                                tmp.string(),
                                cleanupErr.what() ) );
        }
      throw;
    }
}


/* -------------------------------------------------------------------------- */

/** @brief Format @a time as local `YYYY-MM-DD HH:MM:SS`. */
static std::string
formatTime( std::time_t time )
{
  std::tm tmBuf {};
  localtime_r( &time, &tmBuf );
  char buffer[32];  // NOLINT
  if ( std::strftime( &buffer[0], sizeof( buffer ), "%Y-%m-%d %H:%M:%S", &tmBuf )
       == 0 )
    {
      return std::to_string( time );
    }
  return std::string( &buffer[0] );
}


void
to_json( nlohmann::json & jto, const GenerationInfo & generation )
{
  jto = {
    { "number", generation.number },
    { "path", generation.path.string() },
    { "current", generation.current },
    { "date", formatTime( generation.creationTime ) },
    { "kernelVersion", nullptr },
    { "nixosVersion", nullptr },
    { "configurationRevision", nullptr },
  };
  if ( generation.kernelVersion.has_value() )
    {
      jto["kernelVersion"] = *generation.kernelVersion;
    }
  if ( generation.nixosVersion.has_value() )
    {
      jto["nixosVersion"] = *generation.nixosVersion;
    }
  if ( generation.configurationRevision.has_value() )
    {
      jto["configurationRevision"] = *generation.configurationRevision;
    }
}


void
printGenerations( std::ostream & oss, std::vector<GenerationInfo> generations )
{
  std::sort( generations.begin(),
             generations.end(),
             []( const GenerationInfo & lhs, const GenerationInfo & rhs )
             { return lhs.number < rhs.number; } );

  oss << std::left << std::setw( 22 ) << "Generation" << std::setw( 21 )
      << "Build date" << std::setw( 30 ) << "NixOS version" << std::setw( 20 )
      << "Kernel"
      << "Configuration revision" << std::endl;

  for ( const auto & generation : generations )
    {
      std::string number = std::to_string( generation.number );
      if ( generation.current ) { number += " (current)"; }
      oss << std::left << std::setw( 22 ) << number << std::setw( 21 )
          << formatTime( generation.creationTime ) << std::setw( 30 )
          << generation.nixosVersion.value_or( "-" ) << std::setw( 20 )
          << generation.kernelVersion.value_or( "-" )
          << generation.configurationRevision.value_or( "-" ) << std::endl;
    }
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
