#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/validators/ed25519_validator.hpp>
#include <keystone/crypto/ed25519.hpp>

namespace keystone::chain {

namespace {

constexpr std::size_t signature_offset  = 1;
constexpr std::size_t public_key_offset = signature_offset + crypto::ed25519::signature_length;

} // anonymous

chain::scheme ed25519_validator::scheme() const
{
   return chain::scheme::ed25519;
}

std::string ed25519_validator::name() const
{
   return "ed25519";
}

std::size_t ed25519_validator::public_key_length() const
{
   return crypto::ed25519::public_key_length;
}

std::size_t ed25519_validator::payload_length() const
{
   return public_key_offset + public_key_length();
}

std::string ed25519_validator::verify_payload( const std::string& payload, const std::string& tx_hash ) const
{
   auto sig = payload.substr( signature_offset, crypto::ed25519::signature_length );
   auto public_key = payload.substr( public_key_offset );

   check_public_key_length( public_key );

   KEYSTONE_ASSERT(
      crypto::ed25519::verify( sig, public_key, tx_hash ),
      invalid_authenticator_exception,
      "ed25519 signature does not verify"
   );

   return public_key;
}

} // keystone::chain
