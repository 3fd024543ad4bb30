#include <keystone/chain/state.hpp>

namespace keystone::chain::state::space {

namespace detail {

object_space make_system_space( system_space_id id )
{
   object_space s;
   s.set_system( true );
   s.set_zone( zone::framework );
   s.set_id( id );
   return s;
}

} // detail

const object_space& account()
{
   static const auto s = detail::make_system_space( system_space_id::account_space );
   return s;
}

const object_space& resource_account()
{
   static const auto s = detail::make_system_space( system_space_id::resource_account_space );
   return s;
}

const object_space& authentication_key()
{
   static const auto s = detail::make_system_space( system_space_id::authentication_key_space );
   return s;
}

} // keystone::chain::state::space
