#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/validator_registry.hpp>
#include <keystone/chain/validators/ecdsa_k1_validator.hpp>
#include <keystone/chain/validators/ed25519_validator.hpp>
#include <keystone/chain/validators/ethereum_validator.hpp>
#include <keystone/log.hpp>

namespace keystone::chain {

void validator_registry::register_validator( validator_ptr v )
{
   KEYSTONE_ASSERT( v, keystone::exception, "cannot register a null validator" );

   auto s = v->scheme();
   LOG(debug) << "Registered " << v->name() << " validator for scheme " << uint32_t( s );
   _validators[ s ] = std::move( v );
}

const abstract_validator& validator_registry::get_validator( scheme s ) const
{
   auto itr = _validators.find( s );
   KEYSTONE_ASSERT( itr != _validators.end(), unknown_scheme_exception, "no validator for scheme ${s}", ("s", uint32_t( s )) );
   return *itr->second;
}

bool validator_registry::contains( scheme s ) const
{
   return _validators.find( s ) != _validators.end();
}

const abstract_validator& validator_registry::get_payload_validator( const std::string& payload ) const
{
   KEYSTONE_ASSERT( !payload.empty(), malformed_payload_exception, "payload is empty" );
   return get_validator( scheme( uint8_t( payload[0] ) ) );
}

std::string validator_registry::validate( const std::string& payload, const std::string& tx_hash ) const
{
   return get_payload_validator( payload ).validate( payload, tx_hash );
}

address validator_registry::payload_to_address( const std::string& payload, const std::string& tx_hash ) const
{
   return get_payload_validator( payload ).payload_to_address( payload, tx_hash );
}

std::shared_ptr< validator_registry > make_default_validator_registry()
{
   auto registry = std::make_shared< validator_registry >();
   registry->register_validator( std::make_shared< ed25519_validator >() );
   registry->register_validator( std::make_shared< ecdsa_k1_validator >() );
   registry->register_validator( std::make_shared< ethereum_validator >() );
   return registry;
}

} // keystone::chain
