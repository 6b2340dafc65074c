/* ========================================================================== *
 *
 * @file rollback.cc
 *
 * @brief Return the system profile to an earlier generation.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <nix/util.hh>

#include "nh/command/runner.hh"
#include "nh/core/util.hh"
#include "nh/generations.hh"
#include "nh/rollback.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

RollbackOrchestrator::RollbackOrchestrator( command::CommandRunner & runner,
                                            PlatformLayout           layout,
                                            ConfirmFn                confirm )
  : runner( runner ), layout( std::move( layout ) ), confirm( std::move( confirm ) )
{}


/* -------------------------------------------------------------------------- */

void
RollbackOrchestrator::run( const RollbackRequest & request )
{
  const std::filesystem::path & profile = this->layout.systemProfile;

  GenerationInfo generation
    = request.to.has_value() ? findGenerationByNumber( profile, *request.to )
                             : findPreviousGeneration( profile );
  infoLog( nix::fmt( "Rolling back to generation %d", generation.number ) );

  std::optional<std::string> specialisation
    = resolveSpecialisation( request.noSpecialisation,
                             request.specialisation,
                             this->layout.specialisationMarker );
  std::filesystem::path target
    = targetProfilePath( generation.path, specialisation );
  if ( specialisation.has_value() )
    {
      std::error_code err;
      if ( ! std::filesystem::exists( target, err ) )
        {
          warningLog( nix::fmt( "generation %d has no specialisation `%s', "
                                "activating the base configuration",
                                generation.number,
                                *specialisation ) );
          target = generation.path;
        }
    }

  if ( request.diff != DIFF_NEVER )
    {
      std::optional<std::filesystem::path> current
        = firstExisting( this->layout.currentProfiles );
      if ( current.has_value() )
        {
          compareConfigurations( this->runner,
                                 *current,
                                 generation.path,
                                 DIFF_STRICT );
        }
    }

  if ( request.dry )
    {
      if ( request.ask )
        {
          warningLog( "`--ask' has no effect as dry run was requested" );
        }
      infoLog( nix::fmt( "Dry run: would roll back to generation %d",
                         generation.number ) );
      return;
    }

  if ( request.ask ) { confirmAction( this->confirm ); }

  std::optional<uint64_t> previous;
  try
    {
      previous = currentGenerationNumber( profile );
    }
  catch ( const GenerationException & err )
    {
      warningLog( nix::fmt( "unable to determine the current generation, "
                            "it cannot be restored if activation fails: %s",
                            err.what() ) );
    }

  repointProfile( profile, generation.path, this->runner, request.elevate );

  try
    {
      this->runner.run(
        command::Command(
          ( target / "bin" / "switch-to-configuration" ).string() )
          .arg( "switch" )
          .elevate( request.elevate )
          .message( "Activating configuration" ) );
    }
  catch ( const command::CommandFailedException & activationErr )
    {
      errorLog( nix::fmt( "activation of generation %d failed",
                          generation.number ) );
      if ( previous.has_value() )
        {
          infoLog( nix::fmt( "Restoring generation %d", *previous ) );
          try
            {
              repointProfile( profile,
                              generationLinkPath( profile, *previous ),
                              this->runner,
                              request.elevate );
            }
          catch ( const NhException & revertErr )
            {
              throw ProfileRevertException(
                nix::fmt( "unable to restore generation %d after "
                          "activation failed with: %s",
                          *previous,
                          activationErr.what() ),
                revertErr.what() );
            }
        }
      throw ActivationException(
        nix::fmt( "failed to activate generation %d", generation.number ),
        activationErr.what() );
    }
  infoLog( nix::fmt( "Rolled back to generation %d", generation.number ) );
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
