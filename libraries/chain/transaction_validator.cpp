#include <keystone/chain/authenticator.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/transaction_validator.hpp>
#include <keystone/log.hpp>

namespace keystone::chain {

transaction_validator::transaction_validator(
   state_db::abstract_state_node_ptr state,
   std::shared_ptr< validator_registry > validators,
   bool verify_authentication_key ) :
   _registry( std::move( state ) ),
   _validators( std::move( validators ) ),
   _verify_authentication_key( verify_authentication_key )
{
   KEYSTONE_ASSERT( _validators, keystone::exception, "transaction validator requires a validator registry" );
}

signer transaction_validator::validate(
   const address& sender,
   uint64_t tx_sequence_number,
   scheme s,
   const std::string& payload,
   const std::string& tx_hash ) const
{
   uint64_t sequence_number = 0;
   if ( _registry.exists_at( sender ) )
      sequence_number = _registry.sequence_number( sender );

   KEYSTONE_ASSERT(
      tx_sequence_number >= sequence_number,
      sequence_number_too_old_exception,
      "transaction sequence number ${t} is older than account sequence number ${a}",
      ("t", tx_sequence_number)("a", sequence_number)
   );

   KEYSTONE_ASSERT(
      tx_sequence_number <= sequence_number,
      sequence_number_too_new_exception,
      "transaction sequence number ${t} is newer than account sequence number ${a}",
      ("t", tx_sequence_number)("a", sequence_number)
   );

   const auto& validator = _validators->get_validator( s );
   auto public_key = validator.validate( payload, tx_hash );

   if ( _verify_authentication_key )
   {
      KEYSTONE_ASSERT(
         validator.authentication_key_from_public_key( public_key ) == _registry.get_scheme_authentication_key( sender, s ),
         invalid_authenticator_exception,
         "authenticator does not match the ${n} authentication key of ${a}",
         ("n", validator.name())("a", sender.to_hex())
      );
   }

   return signer( sender );
}

void transaction_validator::post_execute( const address& sender )
{
   if ( !_registry.exists_at( sender ) )
      _registry.create_account( sender );

   _registry.increment_sequence_number( sender );
}

void transaction_validator::execute_transaction( const std::function< void( account_registry& ) >& fn )
{
   auto node = _registry.get_state()->create_anonymous_node();
   account_registry registry( node );

   try
   {
      fn( registry );
   }
   catch ( const keystone::exception& e )
   {
      LOG(debug) << "Transaction reverted: " << e.get_message();
      node->reset();
      throw;
   }

   node->commit();
}

account_registry& transaction_validator::registry()
{
   return _registry;
}

} // keystone::chain
