#include <keystone/crypto/multihash.hpp>
#include <keystone/crypto/openssl.hpp>
#include <keystone/util/hex.hpp>

#include <ethash/keccak.hpp>

#include <sodium.h>

#include <cstring>

namespace keystone::crypto {

std::size_t multihash_standard_size( multicodec code )
{
   switch( code )
   {
      case multicodec::sha2_256:
      case multicodec::sha3_256:
      case multicodec::keccak_256:
      case multicodec::blake2b_256:
         return 32;
      case multicodec::ripemd_160:
         return 20;
      default:
         KEYSTONE_THROW( unknown_hash_algorithm, "unknown hash code ${c}", ("c", std::uint64_t( code )) );
   }
}

const EVP_MD* get_evp_md( multicodec code )
{
   switch ( code )
   {
      case multicodec::sha2_256:
         return EVP_sha256();
      case multicodec::sha3_256:
         return EVP_sha3_256();
      case multicodec::ripemd_160:
         return EVP_ripemd160();
      default:
         return nullptr;
   }
}

multihash::multihash( multicodec code, const std::string& digest ) : _code( code ), _digest( digest ) {}

multihash::multihash( multicodec code, std::string&& digest ) : _code( code ), _digest( std::move( digest ) ) {}

multicodec multihash::code() const
{
   return _code;
}

const std::string& multihash::digest() const
{
   return _digest;
}

bool multihash::operator==( const multihash& rhs ) const
{
   return _code == rhs._code && _digest == rhs._digest;
}

bool multihash::operator!=( const multihash& rhs ) const
{
   return !( *this == rhs );
}

std::ostream& operator<<( std::ostream& out, const multihash& mh )
{
   return out << util::to_hex( mh.digest() );
}

encoder::encoder( multicodec code, std::size_t size ) : _code( code )
{
   init_openssl();

   if ( size == 0 )
      size = multihash_standard_size( code );

   switch ( code )
   {
      case multicodec::sha2_256:
      case multicodec::sha3_256:
      case multicodec::ripemd_160:
         KEYSTONE_ASSERT( size == multihash_standard_size( code ), multihash_size_mismatch,
            "requested hash size ${size} does not match the standard size of code ${c}", ("size", size)("c", std::uint64_t( code )) );
         _md = get_evp_md( code );
         break;
      case multicodec::blake2b_256:
         KEYSTONE_ASSERT( size >= crypto_generichash_blake2b_BYTES_MIN && size <= crypto_generichash_blake2b_BYTES_MAX,
            multihash_size_limit_exceeded, "requested hash size ${size} is outside of blake2b bounds", ("size", size) );
         break;
      case multicodec::keccak_256:
         KEYSTONE_ASSERT( size == 32, multihash_size_mismatch, "keccak only supports 32 byte digests" );
         break;
      default:
         KEYSTONE_THROW( unknown_hash_algorithm, "unknown hash code ${c}", ("c", std::uint64_t( code )) );
   }

   _size = size;
   reset();
}

encoder::~encoder()
{
   if( _mdctx ) EVP_MD_CTX_free( _mdctx );
}

void encoder::write( const char* d, std::size_t len )
{
   if ( !len )
      return;

   switch ( _code )
   {
      case multicodec::sha2_256:
      case multicodec::sha3_256:
      case multicodec::ripemd_160:
         EVP_DigestUpdate( _mdctx, d, len );
         break;
      case multicodec::blake2b_256:
         crypto_generichash_blake2b_update( _blake2b.get(), reinterpret_cast< const unsigned char* >( d ), len );
         break;
      case multicodec::keccak_256:
         _buffer.append( d, len );
         break;
   }
}

void encoder::reset()
{
   if ( _md )
   {
      if( _mdctx ) EVP_MD_CTX_free( _mdctx );
      _mdctx = EVP_MD_CTX_new();
      KEYSTONE_ASSERT( _mdctx, keystone::exception, "EVP_MD_CTX_new returned failure" );
      KEYSTONE_ASSERT( EVP_DigestInit_ex( _mdctx, _md, nullptr ), keystone::exception, "EVP_DigestInit_ex returned failure" );
   }
   else if ( _code == multicodec::blake2b_256 )
   {
      if ( !_blake2b )
         _blake2b = std::make_unique< crypto_generichash_blake2b_state >();
      crypto_generichash_blake2b_init( _blake2b.get(), nullptr, 0, _size );
   }

   _buffer.clear();
}

void encoder::get_result( multihash& mh )
{
   std::string digest( _size, '\0' );

   switch ( _code )
   {
      case multicodec::sha2_256:
      case multicodec::sha3_256:
      case multicodec::ripemd_160:
      {
         unsigned int size = (unsigned int) _size;
         KEYSTONE_ASSERT(
            EVP_DigestFinal_ex( _mdctx, reinterpret_cast< unsigned char* >( digest.data() ), &size ),
            keystone::exception, "EVP_DigestFinal_ex returned failure" );
         KEYSTONE_ASSERT( size == _size,
            multihash_size_mismatch,
            "OpenSSL EVP_DigestFinal_ex returned hash size ${size}, does not match expected hash size ${expected}",
            ("size", size)("expected", _size) );
         break;
      }
      case multicodec::blake2b_256:
         KEYSTONE_ASSERT(
            crypto_generichash_blake2b_final( _blake2b.get(), reinterpret_cast< unsigned char* >( digest.data() ), _size ) == 0,
            keystone::exception, "crypto_generichash_blake2b_final returned failure" );
         break;
      case multicodec::keccak_256:
      {
         auto h = ethash::keccak256( reinterpret_cast< const uint8_t* >( _buffer.data() ), _buffer.size() );
         std::memcpy( digest.data(), h.bytes, sizeof( h.bytes ) );
         break;
      }
   }

   mh = multihash( _code, std::move( digest ) );
}

multihash hash( multicodec code, const char* data, std::size_t len, std::size_t size )
{
   multihash result;
   encoder e( code, size );
   e.write( data, len );
   e.get_result( result );
   return result;
}

multihash hash( multicodec code, const std::string& data, std::size_t size )
{
   return hash( code, data.data(), data.size(), size );
}

} // keystone::crypto
