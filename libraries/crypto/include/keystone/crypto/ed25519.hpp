#pragma once
#include <keystone/crypto/elliptic.hpp>
#include <keystone/crypto/multihash.hpp>

#include <array>
#include <string>

namespace keystone::crypto::ed25519 {

constexpr std::size_t public_key_length = 32;
constexpr std::size_t signature_length  = 64;

/**
 * Verifies a pure Ed25519 signature (RFC 8032) over the raw message.
 *
 * Malformed keys or signatures verify as false.
 */
bool verify( const std::string& sig, const std::string& pub_key, const std::string& msg );

class private_key
{
   public:
      private_key();

      static private_key regenerate( const multihash& secret );

      std::string get_public_key()const;
      std::string sign( const std::string& msg )const;

   private:
      std::array< uint8_t, 32 > _seed{};
};

} // keystone::crypto::ed25519
