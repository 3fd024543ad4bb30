#include <keystone/chain/encoding.hpp>
#include <keystone/crypto/multihash.hpp>
#include <keystone/util/base58.hpp>

#include <cstring>
#include <vector>

namespace keystone::chain {

namespace {

constexpr std::size_t checksum_length = 4;

std::string checksum( const std::string& data )
{
   auto first = crypto::hash( crypto::multicodec::sha2_256, data ).digest();
   return crypto::hash( crypto::multicodec::sha2_256, first ).digest().substr( 0, checksum_length );
}

const char* bech32_charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

constexpr uint32_t bech32_constant  = 1;
constexpr uint32_t bech32m_constant = 0x2bc830a3;
constexpr std::size_t bech32_checksum_length = 6;
constexpr std::size_t bech32_max_length = 90;

uint32_t bech32_constant_for( uint8_t version )
{
   return version == 0 ? bech32_constant : bech32m_constant;
}

uint32_t polymod( const std::vector< uint8_t >& values )
{
   static const uint32_t generator[5] = { 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };

   uint32_t chk = 1;
   for ( auto v : values )
   {
      uint8_t top = chk >> 25;
      chk = ( chk & 0x1ffffff ) << 5 ^ v;
      for ( int i = 0; i < 5; ++i )
         if ( ( top >> i ) & 1 )
            chk ^= generator[i];
   }

   return chk;
}

std::vector< uint8_t > expand_hrp( const std::string& hrp )
{
   std::vector< uint8_t > result;
   result.reserve( hrp.size() * 2 + 1 );

   for ( auto c : hrp )
      result.push_back( uint8_t( c ) >> 5 );
   result.push_back( 0 );
   for ( auto c : hrp )
      result.push_back( uint8_t( c ) & 0x1f );

   return result;
}

/**
 * Regroups bits from `from` bit words to `to` bit words. Returns false when
 * the input carries invalid padding.
 */
bool convert_bits( std::vector< uint8_t >& out, const std::vector< uint8_t >& in, unsigned from, unsigned to, bool pad )
{
   uint32_t acc = 0;
   unsigned bits = 0;
   const uint32_t max = ( 1u << to ) - 1;

   for ( auto v : in )
   {
      acc = ( acc << from ) | v;
      bits += from;
      while ( bits >= to )
      {
         bits -= to;
         out.push_back( uint8_t( ( acc >> bits ) & max ) );
      }
   }

   if ( pad )
   {
      if ( bits )
         out.push_back( uint8_t( ( acc << ( to - bits ) ) & max ) );
   }
   else if ( bits >= from || ( ( acc << ( to - bits ) ) & max ) )
   {
      return false;
   }

   return true;
}

bool valid_witness_program( uint8_t version, std::size_t length )
{
   if ( version > 16 || length < 2 || length > 40 )
      return false;

   return version != 0 || length == 20 || length == 32;
}

} // anonymous

namespace encoding {

std::string base58( const std::string& bytes )
{
   return util::encode_base58( bytes );
}

std::string base58check( const std::string& bytes, uint8_t version )
{
   std::string data( 1, char( version ) );
   data += bytes;
   data += checksum( data );
   return util::encode_base58( data );
}

std::string bech32( const std::string& program, uint8_t version, const std::string& hrp )
{
   KEYSTONE_ASSERT(
      valid_witness_program( version, program.size() ),
      encoding_failure_exception,
      "invalid witness program of ${l} bytes for version ${v}",
      ("l", program.size())("v", version)
   );
   KEYSTONE_ASSERT( !hrp.empty(), encoding_failure_exception, "human readable part is empty" );

   for ( auto c : hrp )
   {
      KEYSTONE_ASSERT(
         c >= 33 && c <= 126 && !( c >= 'A' && c <= 'Z' ),
         encoding_failure_exception,
         "invalid human readable part '${h}'",
         ("h", hrp)
      );
   }

   std::vector< uint8_t > data{ version };
   convert_bits( data, std::vector< uint8_t >( program.begin(), program.end() ), 8, 5, true );

   auto values = expand_hrp( hrp );
   values.insert( values.end(), data.begin(), data.end() );
   values.insert( values.end(), bech32_checksum_length, 0 );
   uint32_t mod = polymod( values ) ^ bech32_constant_for( version );

   std::string result = hrp + '1';
   for ( auto d : data )
      result += bech32_charset[ d ];
   for ( std::size_t i = 0; i < bech32_checksum_length; ++i )
      result += bech32_charset[ ( mod >> ( 5 * ( 5 - i ) ) ) & 0x1f ];

   KEYSTONE_ASSERT( result.size() <= bech32_max_length, encoding_failure_exception, "encoded address exceeds ${m} characters", ("m", bech32_max_length) );
   return result;
}

std::string p2pkh( const std::string& public_key )
{
   KEYSTONE_ASSERT(
      public_key.size() == 33 || public_key.size() == 65,
      encoding_failure_exception,
      "public key must be 33 or 65 bytes, was ${s}",
      ("s", public_key.size())
   );

   auto sha = crypto::hash( crypto::multicodec::sha2_256, public_key ).digest();
   return base58check( crypto::hash( crypto::multicodec::ripemd_160, sha ).digest(), p2pkh_version );
}

} // encoding

namespace decoding {

std::string base58( const std::string& s )
{
   std::string result;
   KEYSTONE_ASSERT( util::decode_base58( s, result ), decoding_failure_exception, "invalid base58 string '${s}'", ("s", s) );
   return result;
}

std::string base58check( const std::string& s, uint8_t version )
{
   auto data = base58( s );
   KEYSTONE_ASSERT( data.size() > checksum_length, decoding_failure_exception, "base58check string '${s}' is too short", ("s", s) );

   auto body = data.substr( 0, data.size() - checksum_length );
   KEYSTONE_ASSERT( checksum( body ) == data.substr( body.size() ), decoding_failure_exception, "base58check checksum mismatch" );
   KEYSTONE_ASSERT(
      uint8_t( body[0] ) == version,
      decoding_failure_exception,
      "expected version ${e}, found ${f}",
      ("e", version)("f", uint8_t( body[0] ))
   );

   return body.substr( 1 );
}

witness_program bech32( const std::string& s )
{
   KEYSTONE_ASSERT( s.size() <= bech32_max_length, decoding_failure_exception, "bech32 string exceeds ${m} characters", ("m", bech32_max_length) );

   bool lower = false, upper = false;
   std::string str;
   str.reserve( s.size() );

   for ( auto c : s )
   {
      KEYSTONE_ASSERT( c >= 33 && c <= 126, decoding_failure_exception, "invalid character in bech32 string" );
      if ( c >= 'a' && c <= 'z' )
         lower = true;
      if ( c >= 'A' && c <= 'Z' )
      {
         upper = true;
         c = char( c - 'A' + 'a' );
      }
      str += c;
   }

   KEYSTONE_ASSERT( !( lower && upper ), decoding_failure_exception, "bech32 string mixes case" );

   auto separator = str.rfind( '1' );
   KEYSTONE_ASSERT(
      separator != std::string::npos && separator > 0 && str.size() - separator - 1 > bech32_checksum_length,
      decoding_failure_exception,
      "malformed bech32 string '${s}'",
      ("s", s)
   );

   witness_program result;
   result.hrp = str.substr( 0, separator );

   std::vector< uint8_t > data;
   for ( auto c : str.substr( separator + 1 ) )
   {
      const char* p = std::strchr( bech32_charset, c );
      KEYSTONE_ASSERT( p, decoding_failure_exception, "invalid bech32 character '${c}'", ("c", std::string( 1, c )) );
      data.push_back( uint8_t( p - bech32_charset ) );
   }

   result.version = data[0];
   KEYSTONE_ASSERT( result.version <= 16, decoding_failure_exception, "unknown witness version ${v}", ("v", result.version) );

   auto values = expand_hrp( result.hrp );
   values.insert( values.end(), data.begin(), data.end() );
   KEYSTONE_ASSERT( polymod( values ) == bech32_constant_for( result.version ), decoding_failure_exception, "bech32 checksum mismatch" );

   std::vector< uint8_t > program;
   std::vector< uint8_t > words( data.begin() + 1, data.end() - bech32_checksum_length );
   KEYSTONE_ASSERT( convert_bits( program, words, 5, 8, false ), decoding_failure_exception, "invalid bech32 padding" );
   KEYSTONE_ASSERT(
      valid_witness_program( result.version, program.size() ),
      decoding_failure_exception,
      "invalid witness program of ${l} bytes for version ${v}",
      ("l", program.size())("v", result.version)
   );

   result.program.assign( program.begin(), program.end() );
   return result;
}

} // decoding

} // keystone::chain
