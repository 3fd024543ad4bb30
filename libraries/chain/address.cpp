#include <keystone/chain/address.hpp>
#include <keystone/util/hex.hpp>

namespace keystone::chain {

address::address() : _bytes( length, '\0' ) {}

address::address( const std::string& bytes ) : _bytes( bytes )
{
   KEYSTONE_ASSERT(
      _bytes.size() == length,
      invalid_address,
      "address must be ${l} bytes, was ${s}",
      ("l", length)("s", _bytes.size())
   );
}

address address::from_hex( const std::string& s )
{
   std::string bytes;

   try
   {
      bytes = util::from_hex( s );
   }
   catch ( const util::hex_decode_error& )
   {
      KEYSTONE_THROW( invalid_address, "malformed address '${a}'", ("a", s) );
   }

   KEYSTONE_ASSERT( bytes.size() <= length, invalid_address, "address '${a}' is too long", ("a", s) );

   bytes.insert( bytes.begin(), length - bytes.size(), '\0' );
   return address( bytes );
}

address address::from_uint64( uint64_t value )
{
   address a;
   for ( std::size_t i = 0; i < sizeof( value ); ++i )
      a._bytes[ length - 1 - i ] = char( ( value >> ( 8 * i ) ) & 0xFF );
   return a;
}

const std::string& address::bytes() const
{
   return _bytes;
}

std::string address::to_hex() const
{
   return util::to_hex( _bytes );
}

std::ostream& operator<<( std::ostream& os, const address& a )
{
   return os << a.to_hex();
}

} // keystone::chain
