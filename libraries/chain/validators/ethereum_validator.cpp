#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/validators/ethereum_validator.hpp>
#include <keystone/crypto/elliptic.hpp>

namespace keystone::chain {

namespace {

constexpr std::size_t signature_offset = 1;

bool is_valid_recovery_id( uint8_t v )
{
   return v == 0 || v == 1 || v == 27 || v == 28;
}

} // anonymous

chain::scheme ethereum_validator::scheme() const
{
   return chain::scheme::ethereum;
}

std::string ethereum_validator::name() const
{
   return "ethereum";
}

std::size_t ethereum_validator::public_key_length() const
{
   return crypto::compressed_public_key_length;
}

std::size_t ethereum_validator::payload_length() const
{
   return signature_offset + crypto::recoverable_signature_length;
}

std::string ethereum_validator::verify_payload( const std::string& payload, const std::string& tx_hash ) const
{
   auto sig = payload.substr( signature_offset, crypto::recoverable_signature_length );

   KEYSTONE_ASSERT(
      is_valid_recovery_id( uint8_t( sig.back() ) ),
      invalid_authenticator_exception,
      "invalid recovery id ${v}",
      ("v", uint32_t( uint8_t( sig.back() ) ))
   );

   KEYSTONE_ASSERT(
      crypto::verify_ecdsa_recoverable( sig, tx_hash, crypto::digest_algorithm::keccak256 ),
      invalid_authenticator_exception,
      "ethereum signature does not verify"
   );

   auto public_key = crypto::recover_public_key( sig, tx_hash, crypto::digest_algorithm::keccak256 ).serialize();
   return std::string( reinterpret_cast< const char* >( public_key.data() ), public_key.size() );
}

} // keystone::chain
