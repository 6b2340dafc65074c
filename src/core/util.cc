/* ========================================================================== *
 *
 * @file core/util.cc
 *
 * @brief Miscellaneous helper functions.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <nix/util.hh>

#include "nh/core/types.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

bool
isUInt( std::string_view str )
{
  return ( ! str.empty() )
         && ( std::find_if( str.begin(),
                            str.end(),
                            []( unsigned char chr )
                            { return std::isdigit( chr ) == 0; } )
              == str.end() );
}


std::optional<uint64_t>
parseUInt( std::string_view str )
{
  if ( ! isUInt( str ) ) { return std::nullopt; }
  uint64_t rsl = 0;
  for ( const char chr : str )
    {
      const uint64_t digit = static_cast<uint64_t>( chr - '0' );
      if ( ( std::numeric_limits<uint64_t>::max() - digit ) / 10 < rsl )
        {
          return std::nullopt;
        }
      rsl = ( rsl * 10 ) + digit;
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

bool
hasPrefix( std::string_view prefix, std::string_view str )
{
  if ( str.size() < prefix.size() ) { return false; }
  return str.substr( 0, prefix.size() ) == prefix;
}


bool
hasSuffix( std::string_view suffix, std::string_view str )
{
  if ( str.size() < suffix.size() ) { return false; }
  return str.substr( str.size() - suffix.size() ) == suffix;
}


/* -------------------------------------------------------------------------- */

std::string &
ltrim( std::string & str )
{
  str.erase( str.begin(),
             std::find_if( str.begin(),
                           str.end(),
                           []( unsigned char chr )
                           { return ! std::isspace( chr ); } ) );
  return str;
}

std::string &
rtrim( std::string & str )
{
  str.erase( std::find_if( str.rbegin(),
                           str.rend(),
                           []( unsigned char chr )
                           { return ! std::isspace( chr ); } )
               .base(),
             str.end() );
  return str;
}

std::string &
trim( std::string & str )
{
  rtrim( str );
  ltrim( str );
  return str;
}


std::string
ltrim_copy( std::string_view str )
{
  std::string rsl( str );
  ltrim( rsl );
  return rsl;
}

std::string
rtrim_copy( std::string_view str )
{
  std::string rsl( str );
  rtrim( rsl );
  return rsl;
}

std::string
trim_copy( std::string_view str )
{
  std::string rsl( str );
  trim( rsl );
  return rsl;
}


/* -------------------------------------------------------------------------- */

std::string
toCommandLine( std::string_view program, const Args & args )
{
  std::string rsl = nix::shellEscape( program );
  for ( const auto & arg : args )
    {
      rsl += ' ';
      rsl += nix::shellEscape( arg );
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
