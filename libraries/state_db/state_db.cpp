#include <keystone/state_db/detail/state_delta.hpp>
#include <keystone/state_db/state_db.hpp>

namespace keystone::state_db {

namespace {

std::string make_compound_key( const object_space& space, const object_key& key )
{
   chain::database_key db_key;
   *db_key.mutable_space() = space;
   db_key.set_key( key );

   std::string key_string;
   KEYSTONE_ASSERT( db_key.SerializeToString( &key_string ), internal_error, "unable to serialize database key" );
   return key_string;
}

} // anonymous

abstract_state_node::abstract_state_node() :
   _state( std::make_shared< detail::state_delta >() )
{}

abstract_state_node::~abstract_state_node() {}

const object_value* abstract_state_node::get_object( const object_space& space, const object_key& key ) const
{
   return _state->find( make_compound_key( space, key ) );
}

int64_t abstract_state_node::put_object( const object_space& space, const object_key& key, const object_value& val )
{
   KEYSTONE_ASSERT( !is_finalized(), node_finalized, "cannot write to a finalized node" );

   auto key_string = make_compound_key( space, key );

   int64_t bytes_used = 0;
   auto pobj = _state->find( key_string );

   if ( pobj != nullptr )
      bytes_used -= pobj->size();
   else
      bytes_used += key_string.size();

   bytes_used += val.size();
   _state->put( key_string, val );

   return bytes_used;
}

int64_t abstract_state_node::remove_object( const object_space& space, const object_key& key )
{
   KEYSTONE_ASSERT( !is_finalized(), node_finalized, "cannot write to a finalized node" );

   auto key_string = make_compound_key( space, key );

   int64_t bytes_used = 0;
   auto pobj = _state->find( key_string );

   if ( pobj != nullptr )
   {
      bytes_used -= pobj->size();
      bytes_used -= key_string.size();
   }

   _state->erase( key_string );

   return bytes_used;
}

bool abstract_state_node::has_object( const object_space& space, const object_key& key ) const
{
   return get_object( space, key ) != nullptr;
}

bool abstract_state_node::is_finalized() const
{
   return !_state->is_writable();
}

anonymous_state_node_ptr abstract_state_node::create_anonymous_node()
{
   auto anonymous_node = std::make_shared< anonymous_state_node >();
   anonymous_node->_parent = shared_from_derived();
   anonymous_node->_state = _state->make_child();
   return anonymous_node;
}

anonymous_state_node::anonymous_state_node() {}

anonymous_state_node::~anonymous_state_node() {}

abstract_state_node_ptr anonymous_state_node::parent() const
{
   return _parent;
}

void anonymous_state_node::commit()
{
   KEYSTONE_ASSERT( _parent, internal_error, "cannot commit a node without a parent" );
   KEYSTONE_ASSERT( !_parent->is_finalized(), node_finalized, "cannot commit to a finalized node" );
   _state->squash();
   reset();
}

void anonymous_state_node::reset()
{
   _state->reset();
}

std::shared_ptr< abstract_state_node > anonymous_state_node::shared_from_derived()
{
   return shared_from_this();
}

state_node::state_node() {}

state_node::~state_node() {}

abstract_state_node_ptr state_node::parent() const
{
   return abstract_state_node_ptr();
}

void state_node::finalize()
{
   _state->set_writable( false );
}

std::shared_ptr< abstract_state_node > state_node::shared_from_derived()
{
   return shared_from_this();
}

database::database() {}

database::~database() {}

void database::open()
{
   _root = std::make_shared< state_node >();
}

void database::close()
{
   _root.reset();
}

state_node_ptr database::get_root() const
{
   KEYSTONE_ASSERT( _root, database_not_open, "database is not open" );
   return _root;
}

} // keystone::state_db
