#pragma once
#include <keystone/exception.hpp>
#include <keystone/chain/chain.pb.h>

namespace keystone::chain {

/**
 * Aborts the enclosing transaction. State written by the transaction is discarded.
 */
KEYSTONE_DECLARE_EXCEPTION_WITH_CODE( reversion_exception, reversion );

// Account registry
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( account_already_exists_exception, reversion_exception, already_exists );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( account_not_found_exception, reversion_exception, not_found );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( malformed_key_exception, reversion_exception, malformed_key );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( sequence_overflow_exception, reversion_exception, sequence_overflow );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( reserved_address_exception, reversion_exception, reserved_address );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( invalid_reserved_address_exception, reversion_exception, invalid_reserved_address );

// Resource accounts
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( already_resource_account_exception, reversion_exception, already_resource_account );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( resource_account_already_used_exception, reversion_exception, resource_account_already_used );

// Authentication
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( malformed_payload_exception, reversion_exception, malformed_payload );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( invalid_public_key_length_exception, reversion_exception, invalid_public_key_length );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( invalid_authenticator_exception, reversion_exception, invalid_authenticator );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( unknown_scheme_exception, reversion_exception, unknown_scheme );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( sequence_number_too_old_exception, reversion_exception, sequence_number_too_old );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( sequence_number_too_new_exception, reversion_exception, sequence_number_too_new );

// Encoding
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( decoding_failure_exception, reversion_exception, decoding_failure );
KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( encoding_failure_exception, reversion_exception, encoding_failure );

// Parse exceptions
KEYSTONE_DECLARE_EXCEPTION( parse_failure );
KEYSTONE_DECLARE_DERIVED_EXCEPTION( invalid_address, parse_failure );

} // keystone::chain
