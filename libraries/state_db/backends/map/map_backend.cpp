#include <keystone/state_db/backends/map/map_backend.hpp>

namespace keystone::state_db::backends::map {

map_backend::map_backend() {}

map_backend::~map_backend() {}

void map_backend::put( const key_type& k, const value_type& v )
{
   _map.insert_or_assign( k, v );
}

const map_backend::value_type* map_backend::get( const key_type& key ) const
{
   auto itr = _map.find( key );
   if ( itr == _map.end() )
   {
      return nullptr;
   }

   return &itr->second;
}

void map_backend::erase( const key_type& k )
{
   _map.erase( k );
}

void map_backend::clear() noexcept
{
   _map.clear();
}

map_backend::size_type map_backend::size() const noexcept
{
   return _map.size();
}

void map_backend::for_each( const visitor& v ) const
{
   for ( const auto& [ key, value ] : _map )
      v( key, value );
}

} // keystone::state_db::backends::map
