#include <keystone/chain/account.hpp>
#include <keystone/chain/bcs.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/state.hpp>
#include <keystone/log.hpp>
#include <keystone/util/hex.hpp>

#include <limits>

namespace keystone::chain {

namespace {

account_object load_account( const state_db::abstract_state_node& node, const address& a )
{
   auto account = state::get_object< account_object >( node, state::space::account(), state::key::account( a ) );
   KEYSTONE_ASSERT( account, account_not_found_exception, "account ${a} does not exist", ("a", a.to_hex()) );
   return *account;
}

void check_key_length( const std::string& key )
{
   KEYSTONE_ASSERT(
      key.size() == authentication_key_length,
      malformed_key_exception,
      "authentication key must be ${l} bytes, was ${s}",
      ("l", authentication_key_length)("s", key.size())
   );
}

} // anonymous

account_registry::account_registry( state_db::abstract_state_node_ptr state ) :
   _state( std::move( state ) )
{}

signer account_registry::create_account( const address& a )
{
   KEYSTONE_ASSERT(
      a != address::from_uint64( reserved::vm_address ) && a != address::from_uint64( reserved::framework_address ),
      reserved_address_exception,
      "cannot create account at reserved address ${a}",
      ("a", a.to_hex())
   );

   create_account_unchecked( a );
   return signer( a );
}

std::pair< signer, signer_capability > account_registry::create_framework_reserved_account( const address& a )
{
   bool allowed = false;
   for ( auto i = reserved::framework_range_min; i <= reserved::framework_range_max; ++i )
   {
      if ( a == address::from_uint64( i ) )
      {
         allowed = true;
         break;
      }
   }

   KEYSTONE_ASSERT( allowed, invalid_reserved_address_exception, "${a} is not a framework reserved address", ("a", a.to_hex()) );

   create_account_unchecked( a );
   return std::make_pair( signer( a ), signer_capability( a ) );
}

void account_registry::create_account_unchecked( const address& a )
{
   KEYSTONE_ASSERT( !exists_at( a ), account_already_exists_exception, "account ${a} already exists", ("a", a.to_hex()) );

   auto key = bcs::encode( a );
   check_key_length( key );

   account_object account;
   account.set_authentication_key( key );
   account.set_sequence_number( 0 );

   state::put_object( *_state, state::space::account(), state::key::account( a ), account );

   LOG(debug) << "Created account " << a;
}

bool account_registry::exists_at( const address& a ) const
{
   return _state->has_object( state::space::account(), state::key::account( a ) );
}

uint64_t account_registry::sequence_number( const address& a ) const
{
   return load_account( *_state, a ).sequence_number();
}

void account_registry::increment_sequence_number( const address& a )
{
   auto account = load_account( *_state, a );

   KEYSTONE_ASSERT(
      account.sequence_number() < std::numeric_limits< uint64_t >::max(),
      sequence_overflow_exception,
      "sequence number of ${a} would overflow",
      ("a", a.to_hex())
   );

   account.set_sequence_number( account.sequence_number() + 1 );
   state::put_object( *_state, state::space::account(), state::key::account( a ), account );
}

std::string account_registry::get_authentication_key( const address& a ) const
{
   return load_account( *_state, a ).authentication_key();
}

void account_registry::rotate_authentication_key( const address& a, const std::string& new_key )
{
   check_key_length( new_key );
   auto account = load_account( *_state, a );

   account.set_authentication_key( new_key );
   state::put_object( *_state, state::space::account(), state::key::account( a ), account );

   LOG(debug) << "Rotated authentication key of " << a << " to " << util::to_hex( new_key );
}

signer account_registry::create_signer_with_capability( const signer_capability& cap ) const
{
   return signer( cap.get_address() );
}

const address& account_registry::get_signer_capability_address( const signer_capability& cap ) const
{
   return cap.get_address();
}

void account_registry::rotate_scheme_authentication_key( const signer& s, scheme sch, const std::string& new_key )
{
   check_key_length( new_key );

   authentication_key_object obj;
   obj.set_authentication_key( new_key );
   state::put_object( *_state, state::space::authentication_key(), state::key::authentication_key( s.get_address(), sch ), obj );

   LOG(debug) << "Rotated scheme " << uint32_t( sch ) << " authentication key of " << s.get_address() << " to " << util::to_hex( new_key );
}

void account_registry::remove_scheme_authentication_key( const signer& s, scheme sch )
{
   _state->remove_object( state::space::authentication_key(), state::key::authentication_key( s.get_address(), sch ) );

   LOG(debug) << "Removed scheme " << uint32_t( sch ) << " authentication key of " << s.get_address();
}

std::string account_registry::get_scheme_authentication_key( const address& a, scheme sch ) const
{
   auto obj = state::get_object< authentication_key_object >( *_state, state::space::authentication_key(), state::key::authentication_key( a, sch ) );

   if ( !obj )
      return bcs::encode( a );

   return obj->authentication_key();
}

const state_db::abstract_state_node_ptr& account_registry::get_state() const
{
   return _state;
}

} // keystone::chain
