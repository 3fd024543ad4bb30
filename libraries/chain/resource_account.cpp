#include <keystone/chain/bcs.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/resource_account.hpp>
#include <keystone/chain/state.hpp>
#include <keystone/crypto/multihash.hpp>
#include <keystone/log.hpp>

namespace keystone::chain {

resource_account_deriver::resource_account_deriver( account_registry& registry ) :
   _registry( registry )
{}

std::string resource_account_deriver::derive_seed( const address& a ) const
{
   uint64_t sequence_number = 0;
   if ( _registry.exists_at( a ) )
      sequence_number = _registry.sequence_number( a );

   return crypto::hash( crypto::multicodec::sha3_256, bcs::encode( a ) + bcs::encode( sequence_number ) ).digest();
}

address resource_account_deriver::derive_resource_address( const address& source, const std::string& seed )
{
   std::string preimage = bcs::encode( source );
   preimage += seed;
   preimage += char( resource_account_scheme );

   return address( crypto::hash( crypto::multicodec::sha3_256, preimage ).digest() );
}

std::pair< signer, signer_capability > resource_account_deriver::create_resource_account( const signer& source )
{
   auto seed = derive_seed( source.get_address() );
   auto resource_address = derive_resource_address( source.get_address(), seed );

   KEYSTONE_ASSERT(
      !is_resource_account( resource_address ),
      already_resource_account_exception,
      "${a} is already a resource account",
      ("a", resource_address.to_hex())
   );

   if ( _registry.exists_at( resource_address ) )
   {
      KEYSTONE_ASSERT(
         _registry.sequence_number( resource_address ) == 0,
         resource_account_already_used_exception,
         "account ${a} has already been used",
         ("a", resource_address.to_hex())
      );
   }
   else
   {
      _registry.create_account( resource_address );
   }

   _registry.rotate_authentication_key( resource_address, zero_authentication_key );

   resource_account_object marker;
   marker.set_source( source.get_address().bytes() );
   state::put_object( *_registry.get_state(), state::space::resource_account(), state::key::resource_account( resource_address ), marker );

   LOG(debug) << "Created resource account " << resource_address << " from " << source.get_address();

   return std::make_pair( signer( resource_address ), signer_capability( resource_address ) );
}

bool resource_account_deriver::is_resource_account( const address& a ) const
{
   return _registry.get_state()->has_object( state::space::resource_account(), state::key::resource_account( a ) );
}

} // keystone::chain
