#pragma once

#include <keystone/exception.hpp>

#include <cstdint>
#include <string>

namespace keystone::util {

KEYSTONE_DECLARE_EXCEPTION( hex_decode_error );

inline std::string to_hex( const std::string& bytes, bool prefix = true )
{
   static const char hex[16] = {'0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'};

   std::string result;
   result.reserve( bytes.size() * 2 + 2 );

   if ( prefix )
      result += "0x";

   for ( auto c : bytes )
   {
      result += hex[(uint8_t(c) & 0xF0) >> 4];
      result += hex[uint8_t(c) & 0x0F];
   }

   return result;
}

inline uint8_t hex_digit( char c )
{
   if ( c >= '0' && c <= '9' )
      return uint8_t( c - '0' );
   if ( c >= 'a' && c <= 'f' )
      return uint8_t( c - 'a' + 10 );
   if ( c >= 'A' && c <= 'F' )
      return uint8_t( c - 'A' + 10 );

   KEYSTONE_THROW( hex_decode_error, "invalid hex character '${c}'", ("c", std::string( 1, c )) );
}

/**
 * Decodes a hex string, with or without a leading 0x.
 *
 * An odd number of digits is treated as having an implicit leading zero.
 */
inline std::string from_hex( const std::string& s )
{
   std::size_t start = 0;
   if ( s.size() >= 2 && s[0] == '0' && ( s[1] == 'x' || s[1] == 'X' ) )
      start = 2;

   std::string digits = s.substr( start );
   if ( digits.size() % 2 )
      digits.insert( digits.begin(), '0' );

   std::string result;
   result.reserve( digits.size() / 2 );

   for ( std::size_t i = 0; i < digits.size(); i += 2 )
      result += char( ( hex_digit( digits[i] ) << 4 ) | hex_digit( digits[i + 1] ) );

   return result;
}

} // keystone::util
