#pragma once
#include <keystone/state_db/state_db_types.hpp>

#include <cstdint>
#include <memory>

namespace keystone::state_db {

namespace detail {

class state_delta;

} // detail

class abstract_state_node;
class anonymous_state_node;
class state_node;

using abstract_state_node_ptr  = std::shared_ptr< abstract_state_node >;
using anonymous_state_node_ptr = std::shared_ptr< anonymous_state_node >;
using state_node_ptr           = std::shared_ptr< state_node >;

/**
 * Keyed object storage scoped by (object_space, key).
 */
class abstract_state_node
{
   public:
      abstract_state_node();
      virtual ~abstract_state_node();

      /**
       * Fetch an object if one exists, nullptr otherwise.
       *
       * The returned pointer is invalidated by the next write to this node.
       */
      const object_value* get_object( const object_space& space, const object_key& key ) const;

      /**
       * Write an object into the state_node.
       *
       * - Fail if node is not writable.
       * - If object exists, object is overwritten.
       * - Returns the change in bytes used.
       */
      int64_t put_object( const object_space& space, const object_key& key, const object_value& val );

      /**
       * Remove an object from the state_node. Removing a missing object is a no-op.
       */
      int64_t remove_object( const object_space& space, const object_key& key );

      bool has_object( const object_space& space, const object_key& key ) const;

      /**
       * Return true if the node is writable.
       */
      bool is_finalized() const;

      /**
       * Returns an anonymous state node with this node as its parent.
       */
      anonymous_state_node_ptr create_anonymous_node();

      virtual abstract_state_node_ptr parent() const = 0;

   protected:
      virtual std::shared_ptr< abstract_state_node > shared_from_derived() = 0;

      std::shared_ptr< detail::state_delta > _state;
};

/**
 * A scratch node for a single transaction.
 *
 * Writes are visible through this node only. commit() folds them into the
 * parent, reset() throws them away.
 */
class anonymous_state_node final : public abstract_state_node, public std::enable_shared_from_this< anonymous_state_node >
{
   public:
      anonymous_state_node();
      ~anonymous_state_node();

      abstract_state_node_ptr parent() const override;

      void commit();
      void reset();

      friend class abstract_state_node;

   protected:
      std::shared_ptr< abstract_state_node > shared_from_derived() override;

   private:
      abstract_state_node_ptr _parent;
};

class state_node final : public abstract_state_node, public std::enable_shared_from_this< state_node >
{
   public:
      state_node();
      ~state_node();

      abstract_state_node_ptr parent() const override;

      void finalize();

   protected:
      std::shared_ptr< abstract_state_node > shared_from_derived() override;
};

/**
 * Owns the root state node. Everything is held in memory.
 */
class database final
{
   public:
      database();
      ~database();

      void open();
      void close();

      state_node_ptr get_root() const;

   private:
      state_node_ptr _root;
};

} // keystone::state_db
