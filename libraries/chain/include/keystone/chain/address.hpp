#pragma once
#include <keystone/chain/exceptions.hpp>

#include <cstdint>
#include <ostream>
#include <string>

namespace keystone::chain {

/**
 * A 32 byte account address.
 *
 * The text form is 0x followed by 64 lowercase hex digits. Short forms such
 * as 0x1 are accepted when parsing and are left padded with zeros.
 */
class address
{
   public:
      static constexpr std::size_t length = 32;

      address();
      explicit address( const std::string& bytes );

      static address from_hex( const std::string& s );
      static address from_uint64( uint64_t value );

      const std::string& bytes() const;
      std::string to_hex() const;

      friend bool operator==( const address& a, const address& b ) { return a._bytes == b._bytes; }
      friend bool operator!=( const address& a, const address& b ) { return a._bytes != b._bytes; }
      friend bool operator<( const address& a, const address& b ) { return a._bytes < b._bytes; }

   private:
      std::string _bytes;
};

std::ostream& operator<<( std::ostream& os, const address& a );

} // keystone::chain
