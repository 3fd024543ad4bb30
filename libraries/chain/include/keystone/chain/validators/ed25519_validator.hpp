#pragma once
#include <keystone/chain/validator.hpp>

namespace keystone::chain {

// [0,1) tag, [1,65) signature, [65,97) public key
class ed25519_validator final : public abstract_validator
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
