#pragma once
#include <keystone/chain/address.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/chain/validator.hpp>

#include <map>
#include <memory>
#include <string>

namespace keystone::chain {

using validator_ptr = std::shared_ptr< abstract_validator >;

/**
 * Dispatches authenticator payloads to validators by their leading scheme tag.
 */
class validator_registry
{
   public:
      /**
       * Registers v under its scheme, replacing any validator already registered for it.
       */
      void register_validator( validator_ptr v );

      const abstract_validator& get_validator( scheme s ) const;
      bool contains( scheme s ) const;

      /**
       * Validates with the validator selected by payload[0]. Returns the
       * authenticated public key.
       */
      std::string validate( const std::string& payload, const std::string& tx_hash ) const;

      address payload_to_address( const std::string& payload, const std::string& tx_hash ) const;

   private:
      const abstract_validator& get_payload_validator( const std::string& payload ) const;

      std::map< scheme, validator_ptr > _validators;
};

/**
 * A registry holding the ed25519, ecdsa_k1 and ethereum validators.
 */
std::shared_ptr< validator_registry > make_default_validator_registry();

} // keystone::chain
