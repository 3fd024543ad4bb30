#pragma once

#include <cstddef>
#include <string>

#include <keystone/exception.hpp>
#include <keystone/chain/chain.pb.h>

namespace keystone::state_db {

using object_space  = chain::object_space;
using object_key    = std::string;
using object_value  = std::string;

KEYSTONE_DECLARE_EXCEPTION( state_db_exception );

KEYSTONE_DECLARE_DERIVED_EXCEPTION( database_not_open, state_db_exception );

/**
 * An attempt was made to modify a finalized node.
 */
KEYSTONE_DECLARE_DERIVED_EXCEPTION( node_finalized, state_db_exception );

/**
 * An internal invariant has been violated.
 *
 * This is most likely caused by a programming error in state_db.
 */
KEYSTONE_DECLARE_DERIVED_EXCEPTION( internal_error, state_db_exception );

} // keystone::state_db
