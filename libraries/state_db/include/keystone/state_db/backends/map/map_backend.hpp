#pragma once

#include <keystone/state_db/backends/backend.hpp>

#include <map>

namespace keystone::state_db::backends::map {

class map_backend final : public abstract_backend {
   public:
      using key_type   = abstract_backend::key_type;
      using value_type = abstract_backend::value_type;
      using size_type  = abstract_backend::size_type;

      map_backend();
      virtual ~map_backend() override;

      // Modifiers
      virtual void put( const key_type& k, const value_type& v ) override;
      virtual const value_type* get( const key_type& ) const override;
      virtual void erase( const key_type& k ) override;
      virtual void clear() noexcept override;

      virtual size_type size() const noexcept override;

      virtual void for_each( const visitor& v ) const override;

   private:
      std::map< key_type, value_type > _map;
};

} // keystone::state_db::backends::map
