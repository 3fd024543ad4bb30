#pragma once
#include <keystone/crypto/multihash.hpp>
#include <keystone/exception.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace keystone::crypto {

KEYSTONE_DECLARE_EXCEPTION( key_serialization_error );
KEYSTONE_DECLARE_EXCEPTION( key_recovery_error );
KEYSTONE_DECLARE_EXCEPTION( key_manipulation_error );
KEYSTONE_DECLARE_EXCEPTION( signing_error );

constexpr std::size_t compressed_public_key_length   = 33;
constexpr std::size_t uncompressed_public_key_length = 65;
constexpr std::size_t signature_length               = 64;
constexpr std::size_t recoverable_signature_length   = 65;

typedef std::array< uint8_t, compressed_public_key_length > compressed_public_key;
typedef std::array< uint8_t, signature_length >             signature;              ///< r || s
typedef std::array< uint8_t, recoverable_signature_length > recoverable_signature;  ///< r || s || v
typedef std::array< uint8_t, 32 >                           private_key_secret;

/**
 * Message digests accepted by the secp256k1 verification functions.
 */
enum class digest_algorithm : uint8_t
{
   keccak256 = 0,
   sha256    = 1
};

/**
 *  @class public_key
 *  @brief contains only the public point of an elliptic curve key.
 */
class public_key
{
   public:
      public_key();
      public_key( const public_key& k );
      public_key( public_key&& pk );

      ~public_key();

      compressed_public_key serialize()const;

      /**
       * Parses either a 33 byte compressed or a 65 byte uncompressed SEC1 encoding.
       */
      static public_key deserialize( const std::string& bytes );

      static public_key recover( const recoverable_signature& sig, const multihash& digest );

      /**
       * Verifies a non-recoverable signature. High-S signatures are rejected.
       */
      bool verify( const signature& sig, const multihash& digest )const;

      public_key& operator =( public_key&& pk );
      public_key& operator =( const public_key& pk );

      friend bool operator ==( const public_key& a, const public_key& b );
      friend bool operator !=( const public_key& a, const public_key& b );

      static bool is_canonical( const signature& sig );

   private:
      friend class private_key;

      std::array< uint8_t, 64 > _key{}; ///< secp256k1_pubkey, opaque to us
};

/**
 *  @class private_key
 *  @brief an elliptic curve private key.
 */
class private_key
{
   public:
      private_key();
      private_key( private_key&& pk );
      private_key( const private_key& pk );
      ~private_key();

      private_key& operator=( private_key&& pk );
      private_key& operator=( const private_key& pk );

      static private_key regenerate( const multihash& secret );

      signature sign( const multihash& digest )const;
      recoverable_signature sign_compact( const multihash& digest )const;

      public_key get_public_key()const;

      inline friend bool operator==( const private_key& a, const private_key& b )
      {
         return a._key == b._key;
      }

      inline friend bool operator!=( const private_key& a, const private_key& b )
      {
         return !(a == b);
      }

   private:
      private_key_secret _key{};
};

multihash message_digest( digest_algorithm alg, const std::string& msg );

/**
 * Non-recoverable ECDSA verification of a 64 byte signature against a
 * serialized public key.
 */
bool verify_ecdsa( const std::string& sig, const std::string& pub_key, const std::string& msg, digest_algorithm alg );

/**
 * Recovers the signer of a 65 byte signature and checks the signature against it.
 * Returns false for anything that does not recover.
 */
bool verify_ecdsa_recoverable( const std::string& sig, const std::string& msg, digest_algorithm alg );

public_key recover_public_key( const std::string& sig, const std::string& msg, digest_algorithm alg );

} // keystone::crypto
