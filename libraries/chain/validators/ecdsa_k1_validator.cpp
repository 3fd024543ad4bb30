#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/validators/ecdsa_k1_validator.hpp>
#include <keystone/crypto/elliptic.hpp>

namespace keystone::chain {

namespace {

constexpr std::size_t signature_offset  = 1;
constexpr std::size_t public_key_offset = signature_offset + crypto::signature_length;

} // anonymous

chain::scheme ecdsa_k1_validator::scheme() const
{
   return chain::scheme::ecdsa_k1;
}

std::string ecdsa_k1_validator::name() const
{
   return "ecdsa_k1";
}

std::size_t ecdsa_k1_validator::public_key_length() const
{
   return crypto::compressed_public_key_length;
}

std::size_t ecdsa_k1_validator::payload_length() const
{
   return public_key_offset + public_key_length();
}

std::string ecdsa_k1_validator::verify_payload( const std::string& payload, const std::string& tx_hash ) const
{
   auto sig = payload.substr( signature_offset, crypto::signature_length );
   auto public_key = payload.substr( public_key_offset );

   check_public_key_length( public_key );

   bool verified = false;

   try
   {
      verified = crypto::verify_ecdsa( sig, public_key, tx_hash, crypto::digest_algorithm::sha256 );
   }
   catch ( const crypto::key_serialization_error& ex )
   {
      KEYSTONE_THROW( invalid_authenticator_exception, "malformed public key: ${m}", ("m", ex.get_message()) );
   }

   KEYSTONE_ASSERT( verified, invalid_authenticator_exception, "ecdsa_k1 signature does not verify" );

   return public_key;
}

} // keystone::chain
