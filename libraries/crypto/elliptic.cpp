#include <keystone/crypto/elliptic.hpp>
#include <keystone/crypto/openssl.hpp>

#include <boost/core/ignore_unused.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>
#include <cstring>

namespace keystone::crypto {

const secp256k1_context* _get_context()
{
   static secp256k1_context* ctx = secp256k1_context_create( SECP256K1_CONTEXT_VERIFY | SECP256K1_CONTEXT_SIGN );
   return ctx;
}

void _init_lib()
{
   static const secp256k1_context* ctx = _get_context();
   static int init_o = init_openssl();
   boost::ignore_unused(ctx, init_o);
}

const std::array< uint8_t, 64 >& empty_pub()
{
   static const std::array< uint8_t, 64 > empty_pub{};
   return empty_pub;
}

const private_key_secret& empty_priv()
{
   static const private_key_secret empty_priv{};
   return empty_priv;
}

static void validate_digest( const multihash& digest )
{
   KEYSTONE_ASSERT( digest.digest().size() == 32, key_manipulation_error, "Digest must be 32 bytes" );
}


public_key::public_key() { _init_lib(); }

public_key::public_key( const public_key& pk ) : _key( pk._key ) { _init_lib(); }

public_key::public_key( public_key&& pk ) : _key( std::move( pk._key ) ) { _init_lib(); }

public_key::~public_key() {}

compressed_public_key public_key::serialize()const
{
   KEYSTONE_ASSERT( _key != empty_pub(), key_serialization_error, "Cannot serialize an empty public key" );

   compressed_public_key cpk;
   size_t len = cpk.size();
   KEYSTONE_ASSERT(
      secp256k1_ec_pubkey_serialize(
         _get_context(),
         cpk.data(),
         &len,
         reinterpret_cast< const secp256k1_pubkey* >( _key.data() ),
         SECP256K1_EC_COMPRESSED ),
      key_serialization_error, "Unknown error during public key serialization" );
   KEYSTONE_ASSERT( len == cpk.size(), key_serialization_error,
      "Serialized key does not match expected size of ${n} bytes", ("n", cpk.size()) );

   return cpk;
}

public_key public_key::deserialize( const std::string& bytes )
{
   KEYSTONE_ASSERT( bytes.size() == compressed_public_key_length || bytes.size() == uncompressed_public_key_length,
      key_serialization_error, "Public key must be ${c} or ${u} bytes, was ${n}",
      ("c", compressed_public_key_length)("u", uncompressed_public_key_length)("n", bytes.size()) );

   public_key pk;
   KEYSTONE_ASSERT(
      secp256k1_ec_pubkey_parse(
         _get_context(),
         reinterpret_cast< secp256k1_pubkey* >( pk._key.data() ),
         reinterpret_cast< const unsigned char* >( bytes.data() ),
         bytes.size() ),
      key_serialization_error, "Unknown error during public key deserialization" );
   return pk;
}

public_key public_key::recover( const recoverable_signature& sig, const multihash& digest )
{
   validate_digest( digest );

   signature rs;
   std::copy_n( sig.begin(), rs.size(), rs.begin() );
   KEYSTONE_ASSERT( is_canonical( rs ), key_recovery_error, "Signature is not canonical" );

   int32_t rec_id = sig[64];
   if ( rec_id >= 27 )
      rec_id -= 27;
   KEYSTONE_ASSERT( 0 <= rec_id && rec_id <= 3, key_recovery_error, "Recovery ID mismatch. Must be in range [0,3] or [27,30]" );

   // The internal representation, as per the secp256k1 documentation, is an implementation
   // detail and not guaranteed across platforms or versions of secp256k1. We need to
   // convert the portable format to the internal format first.
   secp256k1_ecdsa_recoverable_signature internal_sig;
   public_key pk;

   KEYSTONE_ASSERT(
      secp256k1_ecdsa_recoverable_signature_parse_compact(
         _get_context(),
         &internal_sig,
         sig.data(),
         rec_id ),
      key_recovery_error, "Unknown error when parsing signature" );

   KEYSTONE_ASSERT(
      secp256k1_ecdsa_recover(
         _get_context(),
         reinterpret_cast< secp256k1_pubkey* >( pk._key.data() ),
         &internal_sig,
         reinterpret_cast< const unsigned char* >( digest.digest().data() ) ),
      key_recovery_error, "Unknown error recovering public key from signature" );

   return pk;
}

bool public_key::verify( const signature& sig, const multihash& digest )const
{
   validate_digest( digest );
   KEYSTONE_ASSERT( _key != empty_pub(), key_manipulation_error, "Cannot verify with an empty public key" );

   secp256k1_ecdsa_signature internal_sig;
   if ( !secp256k1_ecdsa_signature_parse_compact( _get_context(), &internal_sig, sig.data() ) )
      return false;

   return secp256k1_ecdsa_verify(
      _get_context(),
      &internal_sig,
      reinterpret_cast< const unsigned char* >( digest.digest().data() ),
      reinterpret_cast< const secp256k1_pubkey* >( _key.data() ) ) == 1;
}

public_key& public_key::operator=( const public_key& pk )
{
   _key = pk._key;
   return *this;
}

public_key& public_key::operator=( public_key&& pk )
{
   _key = std::move( pk._key );
   return *this;
}

bool operator ==( const public_key& a, const public_key& b )
{
   return a.serialize() == b.serialize();
}

bool operator !=( const public_key& a, const public_key& b )
{
   return !(a == b);
}

bool public_key::is_canonical( const signature& sig )
{
   // BIP-0062 states that sig must be in [1,n/2]. secp256k1 reports whether normalization
   // was needed, which is exactly the upper bound check.
   secp256k1_ecdsa_signature internal_sig;
   if ( !secp256k1_ecdsa_signature_parse_compact( _get_context(), &internal_sig, sig.data() ) )
      return false;

   return secp256k1_ecdsa_signature_normalize( _get_context(), nullptr, &internal_sig ) == 0;
}


private_key::private_key() { _init_lib(); }

private_key::private_key( private_key&& pk ) : _key( std::move( pk._key ) ) { _init_lib(); }

private_key::private_key( const private_key& pk ) : _key( pk._key ) { _init_lib(); }

private_key::~private_key() {}

private_key& private_key::operator=( private_key&& pk )
{
   _key = std::move( pk._key );
   return *this;
}

private_key& private_key::operator=( const private_key& pk )
{
   _key = pk._key;
   return *this;
}

private_key private_key::regenerate( const multihash& secret )
{
   KEYSTONE_ASSERT( secret.digest().size() == 32, key_manipulation_error, "Secret must be 32 bytes" );
   private_key self;
   std::memcpy( self._key.data(), secret.digest().data(), self._key.size() );
   KEYSTONE_ASSERT( secp256k1_ec_seckey_verify( _get_context(), self._key.data() ),
      key_manipulation_error, "Secret is not a valid secp256k1 private key" );
   return self;
}

signature private_key::sign( const multihash& digest )const
{
   validate_digest( digest );
   KEYSTONE_ASSERT( _key != empty_priv(), signing_error, "Cannot sign with an empty key" );

   secp256k1_ecdsa_signature internal_sig;
   signature sig;

   KEYSTONE_ASSERT(
      secp256k1_ecdsa_sign(
         _get_context(),
         &internal_sig,
         reinterpret_cast< const unsigned char* >( digest.digest().data() ),
         _key.data(),
         nullptr,
         nullptr ),
      signing_error, "Unknown error when signing" );

   KEYSTONE_ASSERT(
      secp256k1_ecdsa_signature_serialize_compact( _get_context(), sig.data(), &internal_sig ),
      signing_error, "Unknown error when serializing signature" );

   return sig;
}

recoverable_signature private_key::sign_compact( const multihash& digest )const
{
   validate_digest( digest );
   KEYSTONE_ASSERT( _key != empty_priv(), signing_error, "Cannot sign with an empty key" );

   secp256k1_ecdsa_recoverable_signature internal_sig;
   recoverable_signature sig;
   int rec_id = 0;

   KEYSTONE_ASSERT(
      secp256k1_ecdsa_sign_recoverable(
         _get_context(),
         &internal_sig,
         reinterpret_cast< const unsigned char* >( digest.digest().data() ),
         _key.data(),
         nullptr,
         nullptr ),
      signing_error, "Unknown error when signing" );
   KEYSTONE_ASSERT(
      secp256k1_ecdsa_recoverable_signature_serialize_compact(
         _get_context(),
         sig.data(),
         &rec_id,
         &internal_sig ),
      signing_error, "Unknown error when serialzing recoverable signature" );
   sig[64] = uint8_t( rec_id );

   return sig;
}

public_key private_key::get_public_key()const
{
   KEYSTONE_ASSERT( _key != empty_priv(), key_manipulation_error, "Cannot get public key of an empty private key" );
   public_key pk;
   KEYSTONE_ASSERT(
      secp256k1_ec_pubkey_create(
         _get_context(),
         reinterpret_cast< secp256k1_pubkey* >( pk._key.data() ),
         _key.data() ),
      key_manipulation_error, "Unknown error creating public key from a private key" );
   return pk;
}

multihash message_digest( digest_algorithm alg, const std::string& msg )
{
   switch ( alg )
   {
      case digest_algorithm::keccak256:
         return hash( multicodec::keccak_256, msg );
      case digest_algorithm::sha256:
         return hash( multicodec::sha2_256, msg );
   }

   KEYSTONE_THROW( unknown_hash_algorithm, "unknown digest algorithm ${a}", ("a", uint32_t( alg )) );
}

bool verify_ecdsa( const std::string& sig, const std::string& pub_key, const std::string& msg, digest_algorithm alg )
{
   if ( sig.size() != signature_length )
      return false;

   signature s;
   std::copy_n( sig.begin(), s.size(), s.begin() );

   return public_key::deserialize( pub_key ).verify( s, message_digest( alg, msg ) );
}

public_key recover_public_key( const std::string& sig, const std::string& msg, digest_algorithm alg )
{
   KEYSTONE_ASSERT( sig.size() == recoverable_signature_length, key_recovery_error,
      "Recoverable signature must be ${n} bytes", ("n", recoverable_signature_length) );

   recoverable_signature s;
   std::copy_n( sig.begin(), s.size(), s.begin() );

   return public_key::recover( s, message_digest( alg, msg ) );
}

bool verify_ecdsa_recoverable( const std::string& sig, const std::string& msg, digest_algorithm alg )
{
   if ( sig.size() != recoverable_signature_length )
      return false;

   try
   {
      auto pub_key = recover_public_key( sig, msg, alg );

      signature s;
      std::copy_n( sig.begin(), s.size(), s.begin() );
      return pub_key.verify( s, message_digest( alg, msg ) );
   }
   catch ( const key_recovery_error& )
   {
      return false;
   }
}

} // keystone::crypto
