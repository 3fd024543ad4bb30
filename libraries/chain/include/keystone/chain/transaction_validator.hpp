#pragma once
#include <keystone/chain/account.hpp>
#include <keystone/chain/address.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/chain/signer.hpp>
#include <keystone/chain/validator_registry.hpp>
#include <keystone/state_db/state_db.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace keystone::chain {

/**
 * Gates transactions on sequence number and authenticator, and bumps the
 * sender's sequence number once the transaction has run.
 */
class transaction_validator
{
   public:
      transaction_validator(
         state_db::abstract_state_node_ptr state,
         std::shared_ptr< validator_registry > validators,
         bool verify_authentication_key = false );

      /**
       * Throws sequence_number_too_old_exception or sequence_number_too_new_exception
       * when tx_sequence_number is not the sender's current sequence number.
       * A sender without an account must use sequence number 0.
       *
       * Returns the sender's signer for the transaction body.
       */
      signer validate(
         const address& sender,
         uint64_t tx_sequence_number,
         scheme s,
         const std::string& payload,
         const std::string& tx_hash ) const;

      void post_execute( const address& sender );

      /**
       * Runs fn against a scratch node. Its writes are committed when fn
       * returns and discarded when it throws.
       */
      void execute_transaction( const std::function< void( account_registry& ) >& fn );

      account_registry& registry();

   private:
      account_registry                        _registry;
      std::shared_ptr< validator_registry >   _validators;
      bool                                    _verify_authentication_key;
};

} // keystone::chain
