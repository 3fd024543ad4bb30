#include <keystone/state_db/detail/state_delta.hpp>

namespace keystone::state_db::detail {

using backend_type = state_delta::backend_type;
using value_type   = state_delta::value_type;

state_delta::state_delta() :
   _backend( std::make_shared< backends::map::map_backend >() )
{}

void state_delta::put( const key_type& k, const value_type& v )
{
   _backend->put( k, v );
   _removed_objects.erase( k );
}

void state_delta::erase( const key_type& k )
{
   if ( find( k ) )
   {
      _backend->erase( k );

      // The root has nothing underneath it to shadow
      if ( !is_root() )
         _removed_objects.insert( k );
   }
}

const value_type* state_delta::find( const key_type& key ) const
{
   if ( auto val_ptr = _backend->get( key ); val_ptr )
      return val_ptr;

   if ( is_removed( key ) )
      return nullptr;

   return is_root() ? nullptr : _parent->find( key );
}

void state_delta::squash()
{
   if ( is_root() )
      return;

   // If an object is removed here and exists in the parent, it needs to only be removed in the parent
   // If an object is modified here, but removed in the parent, it needs to only be modified in the parent
   for ( const key_type& r_key : _removed_objects )
   {
      _parent->_backend->erase( r_key );

      if ( !_parent->is_root() )
      {
         _parent->_removed_objects.insert( r_key );
      }
   }

   _backend->for_each( [&]( const key_type& key, const value_type& value )
   {
      _parent->_backend->put( key, value );

      if ( !_parent->is_root() )
      {
         _parent->_removed_objects.erase( key );
      }
   } );
}

void state_delta::reset()
{
   _backend->clear();
   _removed_objects.clear();
}

bool state_delta::is_removed( const key_type& k ) const
{
   return _removed_objects.find( k ) != _removed_objects.end();
}

bool state_delta::is_root() const
{
   return !_parent;
}

bool state_delta::is_writable() const
{
   return _writable;
}

void state_delta::set_writable( bool writable )
{
   _writable = writable;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
   auto child = std::make_shared< state_delta >();
   child->_parent = shared_from_this();

   return child;
}

const std::shared_ptr< backend_type > state_delta::backend() const
{
   return _backend;
}

std::shared_ptr< state_delta > state_delta::parent() const
{
   return _parent;
}

} // keystone::state_db::detail
