#pragma once
#include <keystone/state_db/backends/backend.hpp>
#include <keystone/state_db/backends/map/map_backend.hpp>
#include <keystone/state_db/state_db_types.hpp>

#include <memory>
#include <unordered_set>

namespace keystone::state_db::detail {

   class state_delta;

   using state_delta_ptr = std::shared_ptr< state_delta >;

   /**
    * A layer of writes on top of an optional parent layer.
    *
    * Reads fall through to the parent unless the key was written or removed
    * in this layer. squash() folds this layer into its parent.
    */
   class state_delta : public std::enable_shared_from_this< state_delta >
   {
      public:
         using backend_type  = backends::abstract_backend;
         using key_type      = backend_type::key_type;
         using value_type    = backend_type::value_type;

      private:
         state_delta_ptr                            _parent;

         std::shared_ptr< backend_type >            _backend;
         std::unordered_set< key_type >             _removed_objects;

         bool                                       _writable = true;

      public:
         state_delta();
         ~state_delta() = default;

         void put( const key_type& k, const value_type& v );
         void erase( const key_type& k );
         const value_type* find( const key_type& key ) const;

         void squash();
         void reset();

         bool is_removed( const key_type& k ) const;
         bool is_root() const;

         bool is_writable() const;
         void set_writable( bool );

         state_delta_ptr parent() const;

         state_delta_ptr make_child();

         const std::shared_ptr< backend_type > backend() const;
   };

} // keystone::state_db::detail
