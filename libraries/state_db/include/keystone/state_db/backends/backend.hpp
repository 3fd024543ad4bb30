#pragma once

#include <keystone/state_db/backends/types.hpp>

#include <functional>

namespace keystone::state_db::backends {

class abstract_backend
{
   public:
      using key_type   = detail::key_type;
      using value_type = detail::value_type;
      using size_type  = detail::size_type;
      using visitor    = std::function< void( const key_type&, const value_type& ) >;

      virtual ~abstract_backend() {};

      virtual void put( const key_type& k, const value_type& v ) = 0;
      virtual const value_type* get( const key_type& )const = 0;
      virtual void erase( const key_type& k ) = 0;
      virtual void clear() = 0;

      virtual size_type size()const = 0;

      /**
       * Visits every object in key order.
       */
      virtual void for_each( const visitor& v )const = 0;
};

} // keystone::state_db::backends
