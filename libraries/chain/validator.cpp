#include <keystone/chain/authenticator.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/validator.hpp>
#include <keystone/log.hpp>

namespace keystone::chain {

abstract_validator::~abstract_validator() = default;

crypto::multicodec abstract_validator::key_hash() const
{
   return crypto::multicodec::blake2b_256;
}

std::string abstract_validator::validate( const std::string& payload, const std::string& tx_hash ) const
{
   try
   {
      KEYSTONE_ASSERT(
         payload.size() >= payload_length(),
         malformed_payload_exception,
         "${n} payload must be at least ${l} bytes, was ${s}",
         ("n", name())("l", payload_length())("s", payload.size())
      );

      KEYSTONE_ASSERT(
         uint8_t( payload[0] ) == uint8_t( scheme() ),
         malformed_payload_exception,
         "${n} payload carries scheme tag ${t}",
         ("n", name())("t", uint32_t( uint8_t( payload[0] ) ))
      );

      return verify_payload( payload, tx_hash );
   }
   catch ( const reversion_exception& e )
   {
      LOG(warning) << "Rejected " << name() << " payload: " << e.get_message();
      throw;
   }
}

address abstract_validator::payload_to_address( const std::string& payload, const std::string& tx_hash ) const
{
   return address_from_public_key( scheme(), validate( payload, tx_hash ), key_hash() );
}

std::string abstract_validator::authentication_key_from_public_key( const std::string& public_key ) const
{
   check_public_key_length( public_key );
   return chain::authentication_key_from_public_key( scheme(), public_key, key_hash() );
}

void abstract_validator::rotate_authentication_key_entry( account_registry& registry, const signer& account, const std::string& public_key ) const
{
   registry.rotate_scheme_authentication_key( account, scheme(), authentication_key_from_public_key( public_key ) );
}

void abstract_validator::remove_authentication_key_entry( account_registry& registry, const signer& account ) const
{
   registry.remove_scheme_authentication_key( account, scheme() );
}

void abstract_validator::check_public_key_length( const std::string& public_key ) const
{
   KEYSTONE_ASSERT(
      public_key.size() == public_key_length(),
      invalid_public_key_length_exception,
      "${n} public key must be ${l} bytes, was ${s}",
      ("n", name())("l", public_key_length())("s", public_key.size())
   );
}

} // keystone::chain
