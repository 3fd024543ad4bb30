#include <keystone/crypto/ed25519.hpp>
#include <keystone/crypto/openssl.hpp>

#include <cstring>

namespace keystone::crypto::ed25519 {

bool verify( const std::string& sig, const std::string& pub_key, const std::string& msg )
{
   init_openssl();

   if ( sig.size() != signature_length || pub_key.size() != public_key_length )
      return false;

   evp_pkey key( EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519,
      nullptr,
      reinterpret_cast< const unsigned char* >( pub_key.data() ),
      pub_key.size() ) );

   if ( !key.get() )
      return false;

   evp_md_ctx ctx( EVP_MD_CTX_new() );
   KEYSTONE_ASSERT( ctx.get(), keystone::exception, "EVP_MD_CTX_new returned failure" );

   if ( EVP_DigestVerifyInit( ctx, nullptr, nullptr, nullptr, key ) != 1 )
      return false;

   return EVP_DigestVerify(
      ctx,
      reinterpret_cast< const unsigned char* >( sig.data() ),
      sig.size(),
      reinterpret_cast< const unsigned char* >( msg.data() ),
      msg.size() ) == 1;
}

private_key::private_key() { init_openssl(); }

private_key private_key::regenerate( const multihash& secret )
{
   KEYSTONE_ASSERT( secret.digest().size() == 32, key_manipulation_error, "Secret must be 32 bytes" );
   private_key self;
   std::memcpy( self._seed.data(), secret.digest().data(), self._seed.size() );
   return self;
}

std::string private_key::get_public_key()const
{
   evp_pkey key( EVP_PKEY_new_raw_private_key( EVP_PKEY_ED25519, nullptr, _seed.data(), _seed.size() ) );
   KEYSTONE_ASSERT( key.get(), key_manipulation_error, "Unable to load ed25519 private key: ${e}", ("e", last_openssl_error()) );

   std::string pub( public_key_length, '\0' );
   std::size_t len = pub.size();
   KEYSTONE_ASSERT(
      EVP_PKEY_get_raw_public_key( key, reinterpret_cast< unsigned char* >( pub.data() ), &len ) == 1 && len == public_key_length,
      key_serialization_error, "Unable to serialize ed25519 public key: ${e}", ("e", last_openssl_error()) );

   return pub;
}

std::string private_key::sign( const std::string& msg )const
{
   evp_pkey key( EVP_PKEY_new_raw_private_key( EVP_PKEY_ED25519, nullptr, _seed.data(), _seed.size() ) );
   KEYSTONE_ASSERT( key.get(), signing_error, "Unable to load ed25519 private key: ${e}", ("e", last_openssl_error()) );

   evp_md_ctx ctx( EVP_MD_CTX_new() );
   KEYSTONE_ASSERT( ctx.get(), signing_error, "EVP_MD_CTX_new returned failure" );
   KEYSTONE_ASSERT( EVP_DigestSignInit( ctx, nullptr, nullptr, nullptr, key ) == 1,
      signing_error, "Unable to initialize ed25519 signing: ${e}", ("e", last_openssl_error()) );

   std::string sig( signature_length, '\0' );
   std::size_t len = sig.size();
   KEYSTONE_ASSERT(
      EVP_DigestSign(
         ctx,
         reinterpret_cast< unsigned char* >( sig.data() ),
         &len,
         reinterpret_cast< const unsigned char* >( msg.data() ),
         msg.size() ) == 1 && len == signature_length,
      signing_error, "Unknown error when signing: ${e}", ("e", last_openssl_error()) );

   return sig;
}

} // keystone::crypto::ed25519
