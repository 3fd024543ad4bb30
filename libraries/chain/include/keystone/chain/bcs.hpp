#pragma once
#include <keystone/chain/address.hpp>

#include <cstdint>
#include <string>

namespace keystone::chain::bcs {

std::string encode( const address& a );
std::string encode( uint64_t v );

/**
 * vector<u8>, a ULEB128 length prefix followed by the bytes.
 */
std::string encode_bytes( const std::string& bytes );

std::string encode_uleb128( uint64_t v );

/**
 * Reads BCS values from the front of a byte string.
 *
 * Every read throws decoding_failure_exception when the input runs out or is
 * not canonical.
 */
class decoder
{
   public:
      explicit decoder( const std::string& data );

      address     read_address();
      uint64_t    read_uint64();
      uint64_t    read_uleb128();
      std::string read_bytes();

      std::size_t remaining() const;

      /**
       * Throws unless every byte was consumed.
       */
      void finish() const;

   private:
      std::string take( std::size_t n );

      std::string        _data;
      std::size_t        _pos = 0;
};

address     decode_address( const std::string& data );
uint64_t    decode_uint64( const std::string& data );
std::string decode_bytes( const std::string& data );

} // keystone::chain::bcs
