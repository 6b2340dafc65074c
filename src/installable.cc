/* ========================================================================== *
 *
 * @file installable.cc
 *
 * @brief A reference to a configuration expression and its rendering as
 *        `nix` command line arguments.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "nh/attr-path.hh"
#include "nh/context.hh"
#include "nh/core/util.hh"
#include "nh/installable.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

Args
toBuildArgs( const Installable & installable )
{
  return std::visit(
    overloaded {
      []( const FlakeInstallable & flake ) -> Args
      { return { flake.reference + "#" + joinAttrPath( flake.attribute ) }; },
      []( const FileInstallable & file ) -> Args
      {
        Args args = { "--file", file.path };
        if ( ! file.attribute.empty() )
          {
            args.emplace_back( joinAttrPath( file.attribute ) );
          }
        return args;
      },
      []( const ExpressionInstallable & expr ) -> Args
      {
        Args args = { "--expr", expr.expression };
        if ( ! expr.attribute.empty() )
          {
            args.emplace_back( joinAttrPath( expr.attribute ) );
          }
        return args;
      },
      []( const StoreInstallable & store ) -> Args { return { store.path }; },
      []( const SystemInstallable & system ) -> Args
      { return { system.system }; } },
    installable );
}


/* -------------------------------------------------------------------------- */

std::string
displayInstallable( const Installable & installable )
{
  return concatStringsSep( " ", toBuildArgs( installable ) );
}


/* -------------------------------------------------------------------------- */

std::optional<AttrPath>
getAttribute( const Installable & installable )
{
  return std::visit(
    overloaded {
      []( const FlakeInstallable & flake ) -> std::optional<AttrPath>
      { return flake.attribute; },
      []( const FileInstallable & file ) -> std::optional<AttrPath>
      { return file.attribute; },
      []( const ExpressionInstallable & expr ) -> std::optional<AttrPath>
      { return expr.attribute; },
      []( const StoreInstallable & ) -> std::optional<AttrPath>
      { return std::nullopt; },
      []( const SystemInstallable & ) -> std::optional<AttrPath>
      { return std::nullopt; } },
    installable );
}


/** @brief Copy @a installable, replacing its attribute path. */
static Installable
withAttribute( const Installable & installable, const AttrPath & attribute )
{
  return std::visit(
    overloaded {
      [&]( const FlakeInstallable & flake ) -> Installable
      { return FlakeInstallable { flake.reference, attribute }; },
      [&]( const FileInstallable & file ) -> Installable
      { return FileInstallable { file.path, attribute }; },
      [&]( const ExpressionInstallable & expr ) -> Installable
      { return ExpressionInstallable { expr.expression, attribute }; },
      []( const StoreInstallable & store ) -> Installable { return store; },
      []( const SystemInstallable & system ) -> Installable
      { return system; } },
    installable );
}


/* -------------------------------------------------------------------------- */

Installable
installableFromEnvOverride( const std::string & value )
{
  auto hash = value.find( '#' );
  if ( hash == std::string::npos )
    {
      return FlakeInstallable { value, {} };
    }
  return FlakeInstallable { value.substr( 0, hash ),
                            parseAttrPath( value.substr( hash + 1 ) ) };
}


/* -------------------------------------------------------------------------- */

void
to_json( nlohmann::json & jto, const Installable & installable )
{
  std::visit(
    overloaded {
      [&]( const FlakeInstallable & flake )
      {
        jto = { { "type", "flake" },
                { "reference", flake.reference },
                { "attribute", flake.attribute } };
      },
      [&]( const FileInstallable & file )
      {
        jto = { { "type", "file" },
                { "path", file.path },
                { "attribute", file.attribute } };
      },
      [&]( const ExpressionInstallable & expr )
      {
        jto = { { "type", "expression" },
                { "expression", expr.expression },
                { "attribute", expr.attribute } };
      },
      [&]( const StoreInstallable & store )
      { jto = { { "type", "store" }, { "path", store.path } }; },
      [&]( const SystemInstallable & system )
      { jto = { { "type", "system" }, { "system", system.system } }; } },
    installable );
}


/* -------------------------------------------------------------------------- */

Installable
resolveAgainstTree( const Installable &                installable,
                    const std::string &                configType,
                    const AttrPath &                   extraPath,
                    const std::optional<std::string> & explicitName,
                    bool                               pushExtraPath,
                    const TreeProbe &                  probe,
                    const Context &                    ctx )
{
  auto attribute = getAttribute( installable );
  if ( ! attribute.has_value() ) { return installable; }
  if ( ! attribute->empty() )
    {
      debugLog( nix::fmt( "using explicit attribute path from installable: %s",
                          joinAttrPath( *attribute ) ) );
      return installable;
    }

  AttrPath    root = { configType };
  Installable tree = withAttribute( installable, root );

  auto finish = [&]( const std::string & name ) -> Installable
  {
    AttrPath resolved = root;
    resolved.emplace_back( name );
    if ( pushExtraPath )
      {
        resolved.insert( resolved.end(), extraPath.begin(), extraPath.end() );
      }
    return withAttribute( installable, resolved );
  };

  auto attempted = [&]( const std::string & name ) -> std::string
  {
    AttrPath tried = root;
    tried.emplace_back( name );
    return displayInstallable( withAttribute( installable, tried ) );
  };

  if ( explicitName.has_value() )
    {
      if ( probe( tree, *explicitName ) )
        {
          debugLog( nix::fmt( "using explicit configuration: %s",
                              *explicitName ) );
          return finish( *explicitName );
        }
      throw ResolutionException(
        "explicitly specified configuration not found",
        nix::fmt( "tried %s", attempted( *explicitName ) ) );
    }

  const std::string &      user = ctx.requireUser();
  std::vector<std::string> candidates
    = { user + "@" + ctx.requireHostname(), user };
  std::vector<std::string> tried;
  for ( const auto & name : candidates )
    {
      tried.emplace_back( attempted( name ) );
      if ( probe( tree, name ) )
        {
          debugLog(
            nix::fmt( "using automatically detected configuration: %s",
                      name ) );
          return finish( name );
        }
    }

  throw ResolutionException( "couldn't find configuration automatically",
                             "tried " + concatStringsSep( ", ", tried ) );
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
