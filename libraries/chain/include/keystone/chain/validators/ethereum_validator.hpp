#pragma once
#include <keystone/chain/validator.hpp>

namespace keystone::chain {

/**
 * Recoverable secp256k1 ECDSA over keccak256( tx_hash ). The public key is
 * recovered from the signature.
 *
 * [0,1) tag, [1,66) signature r || s || v with v in { 0, 1, 27, 28 }
 */
class ethereum_validator final : public abstract_validator
{
   public:
      chain::scheme scheme() const override;
      std::string name() const override;
      std::size_t public_key_length() const override;
      std::size_t payload_length() const override;

   protected:
      std::string verify_payload( const std::string& payload, const std::string& tx_hash ) const override;
};

} // keystone::chain
