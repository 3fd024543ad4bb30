#pragma once

#include <keystone/chain/address.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/state_db/state_db.hpp>

#include <optional>
#include <string>

namespace keystone::chain::state {

namespace zone {

const auto framework = std::string{};

} // zone

namespace space {

const object_space& account();
const object_space& resource_account();
const object_space& authentication_key();

} // space

namespace key {

inline std::string account( const address& a )
{
   return a.bytes();
}

inline std::string resource_account( const address& a )
{
   return a.bytes();
}

inline std::string authentication_key( const address& a, scheme s )
{
   return std::string( 1, char( s ) ) + a.bytes();
}

} // key

template< typename T >
std::optional< T > get_object( const state_db::abstract_state_node& node, const object_space& space, const std::string& key )
{
   auto val = node.get_object( space, key );
   if ( val == nullptr )
      return {};

   T obj;
   KEYSTONE_ASSERT( obj.ParseFromString( *val ), parse_failure, "unable to parse ${t}", ("t", obj.GetTypeName()) );
   return obj;
}

template< typename T >
void put_object( state_db::abstract_state_node& node, const object_space& space, const std::string& key, const T& obj )
{
   std::string val;
   KEYSTONE_ASSERT( obj.SerializeToString( &val ), parse_failure, "unable to serialize ${t}", ("t", obj.GetTypeName()) );
   node.put_object( space, key, val );
}

} // keystone::chain::state
