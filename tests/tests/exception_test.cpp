#include <boost/test/unit_test.hpp>

#include <keystone/chain/address.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/exception.hpp>

#include <keystone/tests/util.hpp>

#include <nlohmann/json.hpp>

#include <string>

KEYSTONE_DECLARE_EXCEPTION( tool_failure );
KEYSTONE_DECLARE_DERIVED_EXCEPTION( tool_input_failure, tool_failure );

struct exception_fixture {};

BOOST_FIXTURE_TEST_SUITE( exception_tests, exception_fixture )

BOOST_AUTO_TEST_CASE( message_format_test )
{ try {
   using keystone::detail::format_message;

   nlohmann::json values;
   values["a"] = "0x01";
   values["n"] = 33;

   BOOST_TEST_MESSAGE( "Keys are replaced without json quoting" );
   BOOST_CHECK_EQUAL( format_message( "account ${a} key ${n}", values ), "account 0x01 key 33" );

   BOOST_TEST_MESSAGE( "Unknown keys and unterminated keys are kept" );
   BOOST_CHECK_EQUAL( format_message( "missing ${b}", values ), "missing ${b}" );
   BOOST_CHECK_EQUAL( format_message( "open ${a", values ), "open ${a" );
   BOOST_CHECK_EQUAL( format_message( "tail ${", values ), "tail ${" );

   BOOST_TEST_MESSAGE( "${$ escapes a literal" );
   BOOST_CHECK_EQUAL( format_message( "escaped ${$a}", values ), "escaped ${$a}" );
   BOOST_CHECK_EQUAL( format_message( "dollar $ sign", values ), "dollar $ sign" );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( capture_test )
{ try {
   BOOST_TEST_MESSAGE( "Values captured on rethrow complete the message" );
   try
   {
      try
      {
         KEYSTONE_THROW( tool_input_failure, "option --${k} needs ${v}", ("k", "scheme") );
      }
      KEYSTONE_CAPTURE_CATCH_AND_RETHROW( ("v", "a value") )
   }
   catch ( const tool_failure& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "option --scheme needs a value" );
      BOOST_CHECK_EQUAL( e.get_json()["k"], "scheme" );
      BOOST_CHECK_EQUAL( e.get_code(), keystone::unknown_error_code );
      BOOST_CHECK( e.get_stacktrace().size() > 0 );
   }
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( chain_error_code_test )
{ try {
   using namespace keystone::chain;

   BOOST_TEST_MESSAGE( "Chain exceptions carry their error code and revert" );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( reversion_exception, "reverted" ), error_code::reversion );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( account_already_exists_exception, "" ), error_code::already_exists );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( account_not_found_exception, "" ), error_code::not_found );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( malformed_key_exception, "" ), error_code::malformed_key );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( malformed_payload_exception, "" ), error_code::malformed_payload );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( invalid_public_key_length_exception, "" ), error_code::invalid_public_key_length );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( sequence_overflow_exception, "" ), error_code::sequence_overflow );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( reserved_address_exception, "" ), error_code::reserved_address );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( invalid_reserved_address_exception, "" ), error_code::invalid_reserved_address );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( already_resource_account_exception, "" ), error_code::already_resource_account );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( resource_account_already_used_exception, "" ), error_code::resource_account_already_used );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( invalid_authenticator_exception, "" ), error_code::invalid_authenticator );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( unknown_scheme_exception, "" ), error_code::unknown_scheme );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( sequence_number_too_old_exception, "" ), error_code::sequence_number_too_old );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( sequence_number_too_new_exception, "" ), error_code::sequence_number_too_new );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( decoding_failure_exception, "" ), error_code::decoding_failure );
   KEYSTONE_CHECK_THROW( KEYSTONE_THROW( encoding_failure_exception, "" ), error_code::encoding_failure );

   try
   {
      KEYSTONE_THROW( account_not_found_exception, "account ${a} does not exist", ("a", address::from_uint64( 1 ).to_hex()) );
   }
   catch ( const reversion_exception& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "account 0x0000000000000000000000000000000000000000000000000000000000000001 does not exist" );
   }

   BOOST_TEST_MESSAGE( "Parse failures are not reversions" );
   BOOST_CHECK_THROW( address::from_hex( "0xzz" ), invalid_address );
   try
   {
      address::from_hex( "0xzz" );
   }
   catch ( const parse_failure& e )
   {
      BOOST_CHECK_EQUAL( e.get_code(), keystone::unknown_error_code );
   }
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
