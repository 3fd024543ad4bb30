#pragma once
#include <keystone/chain/account.hpp>
#include <keystone/chain/address.hpp>
#include <keystone/chain/signer.hpp>

#include <string>
#include <utility>

namespace keystone::chain {

/**
 * Derives and creates resource accounts, accounts controlled only through a
 * signer_capability.
 */
class resource_account_deriver
{
   public:
      explicit resource_account_deriver( account_registry& registry );

      /**
       * sha3_256( bcs(a) || bcs(sequence_number(a)) )
       *
       * An address without an account derives with sequence number 0.
       */
      std::string derive_seed( const address& a ) const;

      /**
       * sha3_256( bcs(source) || seed || 0xFF )
       */
      static address derive_resource_address( const address& source, const std::string& seed );

      std::pair< signer, signer_capability > create_resource_account( const signer& source );

      bool is_resource_account( const address& a ) const;

   private:
      account_registry& _registry;
};

} // keystone::chain
