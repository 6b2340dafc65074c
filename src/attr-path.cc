/* ========================================================================== *
 *
 * @file attr-path.cc
 *
 * @brief Parse and render dotted attribute paths.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cctype>
#include <string>
#include <string_view>

#include <nix/util.hh>

#include "nh/attr-path.hh"
#include "nh/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nh {

/* -------------------------------------------------------------------------- */

/** @brief Trim @a raw and strip the quote characters from it. */
static std::string
dequoteSegment( std::string_view raw )
{
  std::string trimmed = trim_copy( raw );
  std::string rsl;
  rsl.reserve( trimmed.size() );
  for ( const char chr : trimmed )
    {
      if ( chr != '"' ) { rsl.push_back( chr ); }
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

AttrPath
parseAttrPath( std::string_view input )
{
  AttrPath rsl;
  if ( trim_copy( input ).empty() ) { return rsl; }

  bool   inQuote    = false;
  size_t quoteStart = 0;
  size_t start      = 0;
  for ( size_t idx = 0; idx < input.size(); ++idx )
    {
      const char chr = input[idx];
      if ( chr == '"' )
        {
          inQuote = ! inQuote;
          if ( inQuote ) { quoteStart = idx; }
        }
      else if ( ( chr == '.' ) && ( ! inQuote ) )
        {
          rsl.emplace_back( dequoteSegment( input.substr( start, idx - start ) ) );
          start = idx + 1;
        }
    }

  if ( inQuote )
    {
      throw AttrPathParseException(
        nix::fmt( "unterminated quote at position %d in `%s'",
                  quoteStart,
                  std::string( input ) ) );
    }

  rsl.emplace_back( dequoteSegment( input.substr( start ) ) );
  return rsl;
}


/* -------------------------------------------------------------------------- */

/** @brief Whether @a segment must be quoted to survive a round trip. */
static bool
needsQuoting( const std::string & segment )
{
  if ( segment.empty() ) { return true; }
  if ( segment.find( '.' ) != std::string::npos ) { return true; }
  return ( std::isspace( static_cast<unsigned char>( segment.front() ) ) != 0 )
         || ( std::isspace( static_cast<unsigned char>( segment.back() ) )
              != 0 );
}


std::string
joinAttrPath( const AttrPath & path )
{
  std::string rsl;
  bool        first = true;
  for ( const auto & segment : path )
    {
      if ( first ) { first = false; }
      else { rsl += '.'; }

      if ( needsQuoting( segment ) ) { rsl += '"' + segment + '"'; }
      else { rsl += segment; }
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

std::string
quoteNixString( std::string_view str )
{
  std::string rsl = "\"";
  for ( size_t idx = 0; idx < str.size(); ++idx )
    {
      const char chr = str[idx];
      switch ( chr )
        {
          case '"': rsl += "\\\""; break;
          case '\\': rsl += "\\\\"; break;
          case '\n': rsl += "\\n"; break;
          case '\r': rsl += "\\r"; break;
          case '\t': rsl += "\\t"; break;
          case '$':
            if ( ( ( idx + 1 ) < str.size() ) && ( str[idx + 1] == '{' ) )
              {
                rsl += "\\$";
              }
            else { rsl += '$'; }
            break;
          default: rsl += chr; break;
        }
    }
  rsl += '"';
  return rsl;
}


/* -------------------------------------------------------------------------- */

}  // namespace nh


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
