#pragma once
#include <keystone/chain/account.hpp>
#include <keystone/chain/address.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/chain/signer.hpp>
#include <keystone/crypto/multihash.hpp>

#include <cstdint>
#include <string>

namespace keystone::chain {

/**
 * Authenticates a transaction hash against a scheme specific payload.
 *
 * A payload starts with the scheme tag byte, followed by fixed offset fields
 * defined by each implementation. Validators hold no state of their own. Key
 * entries live in the account_registry, scoped by the validator's scheme.
 */
class abstract_validator
{
   public:
      virtual ~abstract_validator();

      virtual chain::scheme scheme() const = 0;
      virtual std::string name() const = 0;
      virtual std::size_t public_key_length() const = 0;

      /**
       * Minimum payload length, including the tag byte.
       */
      virtual std::size_t payload_length() const = 0;

      virtual crypto::multicodec key_hash() const;

      /**
       * Checks the payload against the transaction hash and returns the public
       * key that signed it.
       *
       * Throws malformed_payload_exception when the payload is short or carries
       * another scheme's tag, invalid_public_key_length_exception when an
       * embedded key has the wrong length and invalid_authenticator_exception
       * when the signature does not verify.
       */
      std::string validate( const std::string& payload, const std::string& tx_hash ) const;

      address payload_to_address( const std::string& payload, const std::string& tx_hash ) const;

      std::string authentication_key_from_public_key( const std::string& public_key ) const;

      void rotate_authentication_key_entry( account_registry& registry, const signer& account, const std::string& public_key ) const;
      void remove_authentication_key_entry( account_registry& registry, const signer& account ) const;

   protected:
      /**
       * Called with a payload of at least payload_length() bytes carrying this scheme's tag.
       */
      virtual std::string verify_payload( const std::string& payload, const std::string& tx_hash ) const = 0;

      void check_public_key_length( const std::string& public_key ) const;
};

} // keystone::chain
