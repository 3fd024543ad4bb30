#include <boost/test/unit_test.hpp>

#include <keystone/chain/account.hpp>
#include <keystone/chain/bcs.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/state.hpp>

#include <keystone/tests/util.hpp>

#include "chain_fixture.hpp"

#include <limits>
#include <type_traits>

BOOST_FIXTURE_TEST_SUITE( account_tests, chain_fixture )

BOOST_AUTO_TEST_CASE( create_account_test )
{ try {
   BOOST_TEST_MESSAGE( "Creating an account" );
   BOOST_CHECK( !registry->exists_at( alice ) );

   auto s = registry->create_account( alice );
   BOOST_CHECK( s.get_address() == alice );
   BOOST_CHECK( registry->exists_at( alice ) );
   BOOST_CHECK_EQUAL( registry->sequence_number( alice ), 0 );

   BOOST_TEST_MESSAGE( "The default authentication key is the address itself" );
   auto key = registry->get_authentication_key( alice );
   BOOST_CHECK_EQUAL( key.size(), chain::authentication_key_length );
   BOOST_CHECK( key == chain::bcs::encode( alice ) );

   BOOST_TEST_MESSAGE( "A second creation fails" );
   KEYSTONE_REQUIRE_THROW( registry->create_account( alice ), chain::error_code::already_exists );

   BOOST_TEST_MESSAGE( "Reserved addresses are refused" );
   KEYSTONE_REQUIRE_THROW( registry->create_account( chain::address::from_hex( "0x0" ) ), chain::error_code::reserved_address );
   KEYSTONE_REQUIRE_THROW( registry->create_account( chain::address::from_hex( "0x3" ) ), chain::error_code::reserved_address );
   BOOST_CHECK( !registry->exists_at( chain::address::from_hex( "0x3" ) ) );

   BOOST_TEST_MESSAGE( "Addresses next to the reserved ones are ordinary" );
   registry->create_account( chain::address::from_hex( "0x2" ) );
   registry->create_account( chain::address::from_hex( "0x4" ) );
   BOOST_CHECK( registry->exists_at( chain::address::from_hex( "0x4" ) ) );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( create_once_test )
{ try {
   BOOST_TEST_MESSAGE( "Every non reserved address can be created exactly once" );
   for ( uint64_t i = 0; i < 64; ++i )
   {
      auto a = chain::address( crypto::hash( crypto::multicodec::sha3_256, std::to_string( i ) ).digest() );

      registry->create_account( a );
      BOOST_CHECK( registry->get_authentication_key( a ) == a.bytes() );
      KEYSTONE_CHECK_THROW( registry->create_account( a ), chain::error_code::already_exists );
   }
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( framework_reserved_account_test )
{ try {
   BOOST_TEST_MESSAGE( "Framework reserved accounts come with a capability" );
   auto framework = chain::address::from_hex( "0x3" );
   auto [s, cap] = registry->create_framework_reserved_account( framework );

   BOOST_CHECK( s.get_address() == framework );
   BOOST_CHECK( registry->get_signer_capability_address( cap ) == framework );
   BOOST_CHECK( registry->create_signer_with_capability( cap ).get_address() == framework );
   BOOST_CHECK( registry->exists_at( framework ) );
   BOOST_CHECK_EQUAL( registry->sequence_number( framework ), 0 );

   BOOST_TEST_MESSAGE( "The whole allow list can be created" );
   for ( uint64_t i = chain::reserved::framework_range_min; i <= chain::reserved::framework_range_max; ++i )
   {
      auto a = chain::address::from_uint64( i );
      if ( a == framework )
         continue;

      registry->create_framework_reserved_account( a );
      BOOST_CHECK( registry->exists_at( a ) );
   }

   BOOST_TEST_MESSAGE( "Addresses outside of the allow list are refused" );
   KEYSTONE_REQUIRE_THROW( registry->create_framework_reserved_account( chain::address::from_hex( "0x0" ) ), chain::error_code::invalid_reserved_address );
   KEYSTONE_REQUIRE_THROW( registry->create_framework_reserved_account( chain::address::from_hex( "0xb" ) ), chain::error_code::invalid_reserved_address );
   KEYSTONE_REQUIRE_THROW( registry->create_framework_reserved_account( alice ), chain::error_code::invalid_reserved_address );

   BOOST_TEST_MESSAGE( "Storage still holds one account per address" );
   KEYSTONE_REQUIRE_THROW( registry->create_framework_reserved_account( framework ), chain::error_code::already_exists );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( sequence_number_test )
{ try {
   BOOST_TEST_MESSAGE( "Missing accounts have no sequence number" );
   KEYSTONE_REQUIRE_THROW( registry->sequence_number( alice ), chain::error_code::not_found );
   KEYSTONE_REQUIRE_THROW( registry->increment_sequence_number( alice ), chain::error_code::not_found );

   registry->create_account( alice );

   BOOST_TEST_MESSAGE( "Incrementing N times yields N" );
   for ( uint64_t i = 1; i <= 100; ++i )
   {
      registry->increment_sequence_number( alice );
      BOOST_REQUIRE_EQUAL( registry->sequence_number( alice ), i );
   }

   BOOST_TEST_MESSAGE( "Incrementing at the maximum fails and leaves state unchanged" );
   chain::account_object account;
   account.set_authentication_key( chain::bcs::encode( bob ) );
   account.set_sequence_number( std::numeric_limits< uint64_t >::max() );
   chain::state::put_object( *db.get_root(), chain::state::space::account(), chain::state::key::account( bob ), account );

   KEYSTONE_REQUIRE_THROW( registry->increment_sequence_number( bob ), chain::error_code::sequence_overflow );
   BOOST_CHECK_EQUAL( registry->sequence_number( bob ), std::numeric_limits< uint64_t >::max() );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( rotate_authentication_key_test )
{ try {
   auto new_key = crypto::hash( crypto::multicodec::blake2b_256, "new key"s ).digest();

   BOOST_TEST_MESSAGE( "Rotating the key of a missing account fails" );
   KEYSTONE_REQUIRE_THROW( registry->rotate_authentication_key( alice, new_key ), chain::error_code::not_found );

   BOOST_TEST_MESSAGE( "A malformed key is refused whether or not the account exists" );
   KEYSTONE_REQUIRE_THROW( registry->rotate_authentication_key( alice, std::string( 31, 'k' ) ), chain::error_code::malformed_key );
   BOOST_CHECK( !registry->exists_at( alice ) );

   registry->create_account( alice );

   BOOST_TEST_MESSAGE( "Keys must be 32 bytes" );
   KEYSTONE_REQUIRE_THROW( registry->rotate_authentication_key( alice, new_key.substr( 1 ) ), chain::error_code::malformed_key );
   KEYSTONE_REQUIRE_THROW( registry->rotate_authentication_key( alice, new_key + "x" ), chain::error_code::malformed_key );
   BOOST_CHECK( registry->get_authentication_key( alice ) == alice.bytes() );

   BOOST_TEST_MESSAGE( "Rotation replaces the key unconditionally" );
   registry->rotate_authentication_key( alice, new_key );
   BOOST_CHECK( registry->get_authentication_key( alice ) == new_key );

   registry->rotate_authentication_key( alice, chain::zero_authentication_key );
   BOOST_CHECK( registry->get_authentication_key( alice ) == chain::zero_authentication_key );
   BOOST_CHECK_EQUAL( registry->sequence_number( alice ), 0 );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( scheme_authentication_key_test )
{ try {
   auto key = crypto::hash( crypto::multicodec::blake2b_256, "scheme key"s ).digest();
   auto alice_signer = registry->create_account( alice );

   BOOST_TEST_MESSAGE( "Unset scheme keys default to the address" );
   BOOST_CHECK( registry->get_scheme_authentication_key( alice, chain::scheme::ecdsa_k1 ) == chain::bcs::encode( alice ) );

   BOOST_TEST_MESSAGE( "Scheme keys are held per scheme" );
   registry->rotate_scheme_authentication_key( alice_signer, chain::scheme::ecdsa_k1, key );
   BOOST_CHECK( registry->get_scheme_authentication_key( alice, chain::scheme::ecdsa_k1 ) == key );
   BOOST_CHECK( registry->get_scheme_authentication_key( alice, chain::scheme::ethereum ) == alice.bytes() );
   BOOST_CHECK( registry->get_scheme_authentication_key( bob, chain::scheme::ecdsa_k1 ) == bob.bytes() );

   KEYSTONE_REQUIRE_THROW( registry->rotate_scheme_authentication_key( alice_signer, chain::scheme::ethereum, key.substr( 2 ) ), chain::error_code::malformed_key );

   BOOST_TEST_MESSAGE( "Removing a scheme key restores the default" );
   registry->remove_scheme_authentication_key( alice_signer, chain::scheme::ecdsa_k1 );
   BOOST_CHECK( registry->get_scheme_authentication_key( alice, chain::scheme::ecdsa_k1 ) == alice.bytes() );

   BOOST_TEST_MESSAGE( "Removing a key that was never set is a no-op" );
   registry->remove_scheme_authentication_key( alice_signer, chain::scheme::ed25519 );
   BOOST_CHECK( registry->get_scheme_authentication_key( alice, chain::scheme::ed25519 ) == alice.bytes() );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( signer_issuance_test )
{ try {
   BOOST_TEST_MESSAGE( "Signers and capabilities cannot be made from a bare address" );
   BOOST_CHECK( !( std::is_constructible_v< chain::signer, const chain::address& > ) );
   BOOST_CHECK( !( std::is_constructible_v< chain::signer_capability, const chain::address& > ) );
   BOOST_CHECK( !std::is_copy_constructible_v< chain::signer_capability > );
   BOOST_CHECK( std::is_move_constructible_v< chain::signer_capability > );

   BOOST_TEST_MESSAGE( "Account creation issues the signer of the new account" );
   auto alice_signer = registry->create_account( alice );
   BOOST_CHECK( alice_signer.get_address() == alice );

   auto [reserved_signer, cap] = registry->create_framework_reserved_account( chain::address::from_uint64( 0x2 ) );
   BOOST_CHECK( registry->create_signer_with_capability( cap ).get_address() == reserved_signer.get_address() );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( address_test )
{ try {
   BOOST_TEST_MESSAGE( "Short addresses are left padded" );
   auto one = chain::address::from_hex( "0x1" );
   BOOST_CHECK_EQUAL( one.to_hex(), "0x0000000000000000000000000000000000000000000000000000000000000001" );
   BOOST_CHECK( one == chain::address::from_uint64( 1 ) );
   BOOST_CHECK( chain::address() == chain::address::from_hex( "0x0" ) );

   auto full = "0x8c891976da9498ec1d3ff778a5d6c40c217d63cc8c48539c959f8b683eedf5a4"s;
   BOOST_CHECK_EQUAL( chain::address::from_hex( full ).to_hex(), full );

   BOOST_TEST_MESSAGE( "Malformed addresses are refused" );
   BOOST_REQUIRE_THROW( chain::address::from_hex( full + "00" ), chain::invalid_address );
   BOOST_REQUIRE_THROW( chain::address::from_hex( "0xzz" ), chain::invalid_address );
   BOOST_REQUIRE_THROW( chain::address( "short"s ), chain::invalid_address );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
