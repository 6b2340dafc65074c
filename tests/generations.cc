/* ========================================================================== *
 *
 * @file generations.cc
 *
 * @brief Tests for listing generations and repointing profiles.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nh/command/elevation.hh"
#include "nh/command/runner.hh"
#include "nh/core/util.hh"
#include "nh/generations.hh"
#include "recording-executor.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nh;

/* -------------------------------------------------------------------------- */

/**
 * @brief Create `<dir>/system-<N>-link -> <dir>/store/system-<N>` for every
 *        number, and point `<dir>/system` at generation @a current.
 * @return The profile path.
 */
static std::filesystem::path
makeProfile( const std::filesystem::path & dir,
             const std::vector<uint64_t> & numbers,
             uint64_t                      current )
{
  std::filesystem::create_directories( dir / "store" );
  for ( uint64_t number : numbers )
    {
      std::filesystem::path out
        = dir / "store" / ( "system-" + std::to_string( number ) );
      std::filesystem::create_directories( out / "bin" );
      std::filesystem::create_directory_symlink(
        out,
        generationLinkPath( dir / "system", number ) );
    }
  std::filesystem::create_directory_symlink(
    generationLinkPath( dir / "system", current ).filename(),
    dir / "system" );
  return dir / "system";
}


static const GenerationInfo *
findNumber( const std::vector<GenerationInfo> & generations, uint64_t number )
{
  for ( const auto & generation : generations )
    {
      if ( generation.number == number ) { return &generation; }
    }
  return nullptr;
}


/* -------------------------------------------------------------------------- */

bool
test_linkPath()
{
  EXPECT_EQ( generationLinkPath( "/nix/var/nix/profiles/system", 42 ),
             std::filesystem::path( "/nix/var/nix/profiles/system-42-link" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Only `<name>-<N>-link` entries count, one of them is current. */
bool
test_list()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1, 2, 3, 4, 5 }, 3 );
  /* Noise which must be ignored. */
  std::filesystem::create_directory( tmp.path / "system-x-link" );
  std::filesystem::create_directory( tmp.path / "other-1-link" );

  std::vector<GenerationInfo> generations = listGenerations( profile );
  EXPECT_EQ( generations.size(), static_cast<size_t>( 5 ) );

  size_t currentCount = 0;
  for ( const auto & generation : generations )
    {
      if ( generation.current ) { ++currentCount; }
    }
  EXPECT_EQ( currentCount, static_cast<size_t>( 1 ) );
  EXPECT( findNumber( generations, 3 ) != nullptr );
  EXPECT( findNumber( generations, 3 )->current );
  EXPECT_EQ( currentGenerationNumber( profile ), static_cast<uint64_t>( 3 ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_findPrevious()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1, 2, 3, 4, 5 }, 3 );
  EXPECT_EQ( findPreviousGeneration( profile ).number,
             static_cast<uint64_t>( 2 ) );
  return true;
}


/** @brief There is nothing before the only generation. */
bool
test_findPreviousOldest()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1 }, 1 );
  EXPECT_THROWS( findPreviousGeneration( profile ), GenerationException );
  return true;
}


/** @brief Gaps in numbering are skipped over. */
bool
test_findPreviousGap()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 2, 7, 9 }, 9 );
  EXPECT_EQ( findPreviousGeneration( profile ).number,
             static_cast<uint64_t>( 7 ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_findByNumber()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1, 2, 3 }, 3 );
  EXPECT_EQ( findGenerationByNumber( profile, 1 ).path,
             generationLinkPath( profile, 1 ) );
  EXPECT_THROWS( findGenerationByNumber( profile, 9 ), GenerationException );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A profile pointing straight at a store path is matched by target. */
bool
test_currentByTarget()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1, 2 }, 1 );
  std::filesystem::remove( profile );
  std::filesystem::create_directory_symlink( tmp.path / "store" / "system-2",
                                             profile );
  EXPECT_EQ( currentGenerationNumber( profile ), static_cast<uint64_t>( 2 ) );
  return true;
}


/** @brief Without a profile link nothing is current. */
bool
test_noCurrent()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1, 2 }, 2 );
  std::filesystem::remove( profile );
  EXPECT_EQ( listGenerations( profile ).size(), static_cast<size_t>( 2 ) );
  EXPECT_THROWS( currentGenerationNumber( profile ), GenerationException );
  EXPECT_THROWS( findPreviousGeneration( profile ), GenerationException );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_metadata()
{
  TempDir tmp;
  auto    profile = makeProfile( tmp.path, { 1 }, 1 );
  std::filesystem::path out = tmp.path / "store" / "system-1";
  std::filesystem::create_directories( out / "kernel-modules" / "lib"
                                       / "modules" / "6.6.30" );
  {
    std::ofstream version( out / "nixos-version" );
    version << "24.05.20240601.abcdef\n";
  }

  std::vector<GenerationInfo> generations = listGenerations( profile );
  EXPECT_EQ( generations.size(), static_cast<size_t>( 1 ) );
  EXPECT( generations[0].kernelVersion.has_value() );
  EXPECT_EQ( *generations[0].kernelVersion, std::string( "6.6.30" ) );
  EXPECT_EQ( generations[0].nixosVersion.value_or( "" ),
             std::string( "24.05.20240601.abcdef" ) );
  EXPECT( ! generations[0].configurationRevision.has_value() );

  nlohmann::json jto = generations[0];
  EXPECT_EQ( jto["number"].get<uint64_t>(), static_cast<uint64_t>( 1 ) );
  EXPECT( jto["current"].get<bool>() );
  EXPECT( jto["configurationRevision"].is_null() );

  std::stringstream oss;
  printGenerations( oss, generations );
  EXPECT( oss.str().find( "1 (current)" ) != std::string::npos );
  EXPECT( oss.str().find( "6.6.30" ) != std::string::npos );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_repointUnelevated()
{
  TempDir                 tmp;
  auto                    profile = makeProfile( tmp.path, { 1, 2, 3 }, 3 );
  Context                 ctx     = makeTestContext();
  RecordingExecutor       executor;
  command::LinuxElevation elevation;
  command::CommandRunner  runner( ctx, executor, elevation );

  repointProfile( profile, generationLinkPath( profile, 1 ), runner, false );
  EXPECT( executor.invocations.empty() );
  EXPECT_EQ( std::filesystem::read_symlink( profile ),
             std::filesystem::path( "system-1-link" ) );
  EXPECT_EQ( currentGenerationNumber( profile ), static_cast<uint64_t>( 1 ) );
  return true;
}


/** @brief Elevated repoints link to a temporary name and rename it over. */
bool
test_repointElevated()
{
  Context                 ctx = makeTestContext();
  RecordingExecutor       executor;
  command::LinuxElevation elevation;
  command::CommandRunner  runner( ctx, executor, elevation );

  std::filesystem::path profile = "/nix/var/nix/profiles/system";
  repointProfile( profile, generationLinkPath( profile, 7 ), runner, true );

  std::vector<std::string> lines = executor.commandLines();
  EXPECT_EQ( lines.size(), static_cast<size_t>( 2 ) );
  EXPECT( lines[0].find( "sudo ln -sfn system-7-link "
                         "/nix/var/nix/profiles/system.tmp-" )
          == 0 );
  EXPECT( lines[1].find( "sudo mv -Tf /nix/var/nix/profiles/system.tmp-" )
          == 0 );
  EXPECT( hasSuffix( " /nix/var/nix/profiles/system", lines[1] ) );
  return true;
}


/** @brief A failed rename removes the temporary link and reports failure. */
bool
test_repointElevatedFailure()
{
  Context                 ctx = makeTestContext();
  RecordingExecutor       executor;
  command::LinuxElevation elevation;
  command::CommandRunner  runner( ctx, executor, elevation );
  executor.respond( "mv -Tf", exitStatus( 1 ) );

  std::filesystem::path profile = "/nix/var/nix/profiles/system";
  EXPECT_THROWS( repointProfile( profile,
                                 generationLinkPath( profile, 7 ),
                                 runner,
                                 true ),
                 command::CommandFailedException );
  EXPECT( executor.indexOf( "sudo rm -f /nix/var/nix/profiles/system.tmp-" )
          == 2 );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int exitCode = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( exitCode, __VA_ARGS__ )

  RUN_TEST( linkPath );
  RUN_TEST( list );
  RUN_TEST( findPrevious );
  RUN_TEST( findPreviousOldest );
  RUN_TEST( findPreviousGap );
  RUN_TEST( findByNumber );
  RUN_TEST( currentByTarget );
  RUN_TEST( noCurrent );
  RUN_TEST( metadata );
  RUN_TEST( repointUnelevated );
  RUN_TEST( repointElevated );
  RUN_TEST( repointElevatedFailure );

  return exitCode;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
