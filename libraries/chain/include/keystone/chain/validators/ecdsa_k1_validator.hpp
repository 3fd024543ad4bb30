#pragma once
#include <keystone/chain/validator.hpp>

namespace keystone::chain {

/**
 * secp256k1 ECDSA over sha256( tx_hash ).
 *
 * [0,1) tag, [1,65) signature r || s, [65,98) compressed public key
 */
class ecdsa_k1_validator final : public abstract_validator
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
