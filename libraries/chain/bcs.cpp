#include <keystone/chain/bcs.hpp>

namespace keystone::chain::bcs {

std::string encode( const address& a )
{
   return a.bytes();
}

std::string encode( uint64_t v )
{
   std::string result( sizeof( v ), '\0' );

   for ( std::size_t i = 0; i < sizeof( v ); ++i )
      result[ i ] = char( ( v >> ( 8 * i ) ) & 0xFF );

   return result;
}

std::string encode_uleb128( uint64_t v )
{
   std::string result;

   do
   {
      uint8_t byte = v & 0x7F;
      v >>= 7;
      if ( v )
         byte |= 0x80;
      result += char( byte );
   } while ( v );

   return result;
}

std::string encode_bytes( const std::string& bytes )
{
   return encode_uleb128( bytes.size() ) + bytes;
}

decoder::decoder( const std::string& data ) : _data( data ) {}

std::string decoder::take( std::size_t n )
{
   KEYSTONE_ASSERT(
      n <= remaining(),
      decoding_failure_exception,
      "expected ${n} more bytes, ${r} remain",
      ("n", n)("r", remaining())
   );

   auto result = _data.substr( _pos, n );
   _pos += n;
   return result;
}

address decoder::read_address()
{
   return address( take( address::length ) );
}

uint64_t decoder::read_uint64()
{
   auto bytes = take( sizeof( uint64_t ) );

   uint64_t v = 0;
   for ( std::size_t i = 0; i < sizeof( v ); ++i )
      v |= uint64_t( uint8_t( bytes[ i ] ) ) << ( 8 * i );

   return v;
}

uint64_t decoder::read_uleb128()
{
   uint64_t v = 0;

   for ( unsigned shift = 0; shift < 64; shift += 7 )
   {
      uint8_t byte = uint8_t( take( 1 )[0] );
      uint64_t digit = byte & 0x7F;

      KEYSTONE_ASSERT( shift < 63 || digit <= 1, decoding_failure_exception, "uleb128 value overflows 64 bits" );
      v |= digit << shift;

      if ( !( byte & 0x80 ) )
      {
         KEYSTONE_ASSERT( shift == 0 || digit != 0, decoding_failure_exception, "uleb128 value is not minimally encoded" );
         return v;
      }
   }

   KEYSTONE_THROW( decoding_failure_exception, "uleb128 value overflows 64 bits" );
}

std::string decoder::read_bytes()
{
   auto length = read_uleb128();
   KEYSTONE_ASSERT(
      length <= remaining(),
      decoding_failure_exception,
      "vector length ${l} exceeds the ${r} remaining bytes",
      ("l", length)("r", remaining())
   );

   return take( std::size_t( length ) );
}

std::size_t decoder::remaining() const
{
   return _data.size() - _pos;
}

void decoder::finish() const
{
   KEYSTONE_ASSERT( remaining() == 0, decoding_failure_exception, "${r} trailing bytes", ("r", remaining()) );
}

address decode_address( const std::string& data )
{
   decoder d( data );
   auto a = d.read_address();
   d.finish();
   return a;
}

uint64_t decode_uint64( const std::string& data )
{
   decoder d( data );
   auto v = d.read_uint64();
   d.finish();
   return v;
}

std::string decode_bytes( const std::string& data )
{
   decoder d( data );
   auto bytes = d.read_bytes();
   d.finish();
   return bytes;
}

} // keystone::chain::bcs
