#pragma once
#include <keystone/chain/address.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/chain/signer.hpp>
#include <keystone/state_db/state_db.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace keystone::chain {

/**
 * Account lifecycle, sequence numbers and authentication keys.
 *
 * Every operation reads and writes through the state node given at
 * construction. Errors leave the node untouched.
 */
class account_registry
{
   public:
      explicit account_registry( state_db::abstract_state_node_ptr state );

      /**
       * Creates an account with sequence number 0 and bcs(a) as its authentication key.
       *
       * Throws reserved_address_exception for 0x0 and 0x3 and
       * account_already_exists_exception when an account is already present.
       */
      signer create_account( const address& a );

      /**
       * Creates one of the framework reserved accounts 0x1 through 0xa and
       * yields a capability over it.
       */
      std::pair< signer, signer_capability > create_framework_reserved_account( const address& a );

      bool exists_at( const address& a ) const;

      uint64_t sequence_number( const address& a ) const;
      void increment_sequence_number( const address& a );

      std::string get_authentication_key( const address& a ) const;

      /**
       * Replaces the authentication key unconditionally. Callers are responsible
       * for deciding who may rotate.
       *
       * The key length is checked before the account is looked up, so a key
       * that is not 32 bytes always fails with malformed_key_exception.
       */
      void rotate_authentication_key( const address& a, const std::string& new_key );

      signer create_signer_with_capability( const signer_capability& cap ) const;
      const address& get_signer_capability_address( const signer_capability& cap ) const;

      // Authentication keys scoped by scheme
      void rotate_scheme_authentication_key( const signer& s, scheme sch, const std::string& new_key );
      void remove_scheme_authentication_key( const signer& s, scheme sch );

      /**
       * Returns bcs(a) when no key was ever set for the scheme.
       */
      std::string get_scheme_authentication_key( const address& a, scheme sch ) const;

      const state_db::abstract_state_node_ptr& get_state() const;

   private:
      void create_account_unchecked( const address& a );

      state_db::abstract_state_node_ptr _state;
};

} // keystone::chain
