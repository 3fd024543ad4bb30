#pragma once
#include <keystone/exception.hpp>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <openssl/evp.h>

struct crypto_generichash_blake2b_state;

namespace keystone::crypto {

/* Multicodec IDs for hash algorithms
 * https://github.com/multiformats/multicodec/blob/master/table.csv
 */
enum class multicodec : std::uint64_t
{
   sha2_256    = 0x12,
   sha3_256    = 0x16,
   keccak_256  = 0x1b,
   ripemd_160  = 0x1053,
   blake2b_256 = 0xb220
};

KEYSTONE_DECLARE_EXCEPTION( unknown_hash_algorithm );
KEYSTONE_DECLARE_EXCEPTION( multihash_size_mismatch );
KEYSTONE_DECLARE_EXCEPTION( multihash_size_limit_exceeded );

std::size_t multihash_standard_size( multicodec code );

class multihash
{
   public:
      multihash() = default;
      multihash( multicodec code, const std::string& digest );
      multihash( multicodec code, std::string&& digest );

      multicodec code() const;
      const std::string& digest() const;

      bool operator==( const multihash& rhs ) const;
      bool operator!=( const multihash& rhs ) const;

   private:
      multicodec  _code = multicodec::sha2_256;
      std::string _digest;
};

std::ostream& operator<<( std::ostream&, const multihash& );

/**
 * Incremental hasher over the supported multicodecs.
 *
 * SHA-2, SHA-3 and RIPEMD-160 run through OpenSSL EVP, Blake2b through libsodium and
 * Keccak-256 through ethash, which only offers a one shot interface. Keccak
 * input is therefore buffered until get_result().
 */
class encoder
{
   public:
      encoder( multicodec code, std::size_t size = 0 );
      ~encoder();

      void write( const char* d, std::size_t len );
      void put( char c ) { write( &c, 1 ); }
      void reset();
      void get_result( multihash& mh );

   private:
      multicodec                                           _code;
      std::size_t                                          _size;
      const EVP_MD*                                        _md = nullptr;
      EVP_MD_CTX*                                          _mdctx = nullptr;
      std::unique_ptr< crypto_generichash_blake2b_state >  _blake2b;
      std::string                                          _buffer;
};

multihash hash( multicodec code, const char* data, std::size_t len, std::size_t size = 0 );
multihash hash( multicodec code, const std::string& data, std::size_t size = 0 );

} // keystone::crypto
