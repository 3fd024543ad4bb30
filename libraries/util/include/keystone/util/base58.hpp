#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace keystone::util {

namespace detail {

static const char* base58_alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

inline int8_t base58_digit( char c )
{
   for ( int8_t i = 0; i < 58; ++i )
      if ( base58_alphabet[i] == c )
         return i;

   return -1;
}

} // detail

/**
 * Bitcoin alphabet base58. Each leading zero byte becomes a leading '1'.
 */
inline std::string encode_base58( const std::string& bytes )
{
   std::size_t zeroes = 0;
   while ( zeroes < bytes.size() && bytes[ zeroes ] == 0 )
      zeroes++;

   // log(256) / log(58), rounded up
   std::vector< uint8_t > b58( ( bytes.size() - zeroes ) * 138 / 100 + 1 );
   std::size_t length = 0;

   for ( std::size_t j = zeroes; j < bytes.size(); ++j )
   {
      uint32_t carry = uint8_t( bytes[ j ] );
      std::size_t i = 0;
      for ( auto it = b58.rbegin(); ( carry != 0 || i < length ) && it != b58.rend(); ++it, ++i )
      {
         carry += 256 * uint32_t( *it );
         *it = uint8_t( carry % 58 );
         carry /= 58;
      }
      length = i;
   }

   auto it = b58.begin() + ( b58.size() - length );
   while ( it != b58.end() && *it == 0 )
      it++;

   std::string result( zeroes, '1' );
   result.reserve( zeroes + ( b58.end() - it ) );
   for ( ; it != b58.end(); ++it )
      result += detail::base58_alphabet[ *it ];

   return result;
}

/**
 * Returns false on any character outside of the base58 alphabet.
 */
inline bool decode_base58( const std::string& s, std::string& dest )
{
   std::size_t zeroes = 0;
   while ( zeroes < s.size() && s[ zeroes ] == '1' )
      zeroes++;

   // log(58) / log(256), rounded up
   std::vector< uint8_t > b256( ( s.size() - zeroes ) * 733 / 1000 + 1 );
   std::size_t length = 0;

   for ( std::size_t j = zeroes; j < s.size(); ++j )
   {
      int8_t digit = detail::base58_digit( s[ j ] );
      if ( digit < 0 )
         return false;

      uint32_t carry = uint32_t( digit );
      std::size_t i = 0;
      for ( auto it = b256.rbegin(); ( carry != 0 || i < length ) && it != b256.rend(); ++it, ++i )
      {
         carry += 58 * uint32_t( *it );
         *it = uint8_t( carry % 256 );
         carry /= 256;
      }
      length = i;
   }

   auto it = b256.begin() + ( b256.size() - length );
   while ( it != b256.end() && *it == 0 )
      it++;

   dest.assign( zeroes, '\0' );
   for ( ; it != b256.end(); ++it )
      dest += char( *it );

   return true;
}

} // keystone::util
