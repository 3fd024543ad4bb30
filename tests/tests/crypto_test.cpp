#include <boost/test/unit_test.hpp>

#include <keystone/crypto/ed25519.hpp>
#include <keystone/crypto/elliptic.hpp>
#include <keystone/exception.hpp>
#include <keystone/util/hex.hpp>

#include "crypto_fixture.hpp"

#include <string>

using namespace std::string_literals;

BOOST_FIXTURE_TEST_SUITE( crypto_tests, crypto_fixture )

BOOST_AUTO_TEST_CASE( sha256_test )
{ try {
   test( multicodec::sha2_256, TEST1, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" );
   test( multicodec::sha2_256, TEST2, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" );
   test( multicodec::sha2_256, TEST3, "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1" );
   test_incremental( multicodec::sha2_256 );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( sha3_256_test )
{ try {
   test( multicodec::sha3_256, TEST1, "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532" );
   test( multicodec::sha3_256, TEST2, "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a" );
   test_incremental( multicodec::sha3_256 );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( keccak_256_test )
{ try {
   test( multicodec::keccak_256, TEST1, "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45" );
   test( multicodec::keccak_256, TEST2, "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470" );
   test_incremental( multicodec::keccak_256 );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( blake2b_256_test )
{ try {
   test( multicodec::blake2b_256, TEST1, "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319" );
   test( multicodec::blake2b_256, TEST2, "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8" );
   test_incremental( multicodec::blake2b_256 );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( ripemd_160_test )
{ try {
   test( multicodec::ripemd_160, TEST1, "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc" );
   test( multicodec::ripemd_160, TEST2, "9c1185a5c5e9fc54612808977ee8f548b2258d31" );
   test_incremental( multicodec::ripemd_160 );
   BOOST_CHECK_THROW( hash( multicodec::ripemd_160, TEST1, 32 ), multihash_size_mismatch );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( multihash_test )
{ try {
   BOOST_TEST_MESSAGE( "An empty input still yields a full digest" );
   BOOST_CHECK_EQUAL( hash( multicodec::sha2_256, ""s ).digest().size(), 32 );
   BOOST_CHECK( hash( multicodec::sha2_256, ""s ) != hash( multicodec::sha3_256, ""s ) );

   BOOST_TEST_MESSAGE( "Unsupported digest sizes" );
   BOOST_CHECK_THROW( hash( multicodec::sha2_256, TEST1, 20 ), multihash_size_mismatch );
   BOOST_CHECK_THROW( hash( multicodec::keccak_256, TEST1, 64 ), multihash_size_mismatch );
   BOOST_CHECK_THROW( hash( multicodec::blake2b_256, TEST1, 128 ), multihash_size_limit_exceeded );

   BOOST_TEST_MESSAGE( "Unknown multicodecs" );
   BOOST_CHECK_THROW( hash( multicodec( 0x13 ), TEST1 ), unknown_hash_algorithm );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( ecc )
{ try {
   private_key nullkey;
   std::string pass = "foobar";

   for ( uint32_t i = 0; i < 100; ++i )
   {
      multihash h = hash( multicodec::sha2_256, pass );
      private_key priv = private_key::regenerate( h );
      BOOST_CHECK( nullkey != priv );
      public_key pub = priv.get_public_key();

      pass += "1";
      multihash h2 = hash( multicodec::sha2_256, pass );

      auto sig = priv.sign( h2 );
      BOOST_CHECK( public_key::is_canonical( sig ) );
      BOOST_CHECK( pub.verify( sig, h2 ) );
      BOOST_CHECK( !pub.verify( sig, h ) );

      auto compact = priv.sign_compact( h2 );
      BOOST_CHECK( public_key::recover( compact, h2 ) == pub );

      auto cpk = pub.serialize();
      std::string cpk_bytes( reinterpret_cast< const char* >( cpk.data() ), cpk.size() );
      BOOST_CHECK( public_key::deserialize( cpk_bytes ) == pub );
   }
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( ecdsa_verification_test )
{ try {
   auto priv = private_key::regenerate( hash( multicodec::sha2_256, "ecdsa"s ) );
   auto pub = priv.get_public_key().serialize();
   std::string pub_bytes( reinterpret_cast< const char* >( pub.data() ), pub.size() );
   std::string msg = "message";

   BOOST_TEST_MESSAGE( "Non-recoverable verification over sha256" );
   auto sig = priv.sign( message_digest( digest_algorithm::sha256, msg ) );
   std::string sig_bytes( reinterpret_cast< const char* >( sig.data() ), sig.size() );

   BOOST_CHECK( verify_ecdsa( sig_bytes, pub_bytes, msg, digest_algorithm::sha256 ) );
   BOOST_CHECK( !verify_ecdsa( sig_bytes, pub_bytes, msg, digest_algorithm::keccak256 ) );
   BOOST_CHECK( !verify_ecdsa( sig_bytes, pub_bytes, "other message", digest_algorithm::sha256 ) );
   BOOST_CHECK( !verify_ecdsa( sig_bytes.substr( 1 ), pub_bytes, msg, digest_algorithm::sha256 ) );
   BOOST_CHECK_THROW( verify_ecdsa( sig_bytes, pub_bytes.substr( 1 ), msg, digest_algorithm::sha256 ), key_serialization_error );

   BOOST_TEST_MESSAGE( "Recoverable verification over keccak256" );
   auto rsig = priv.sign_compact( message_digest( digest_algorithm::keccak256, msg ) );
   std::string rsig_bytes( reinterpret_cast< const char* >( rsig.data() ), rsig.size() );

   BOOST_CHECK( verify_ecdsa_recoverable( rsig_bytes, msg, digest_algorithm::keccak256 ) );
   BOOST_CHECK( recover_public_key( rsig_bytes, msg, digest_algorithm::keccak256 ) == priv.get_public_key() );
   BOOST_CHECK( recover_public_key( rsig_bytes, "other message", digest_algorithm::keccak256 ) != priv.get_public_key() );

   BOOST_TEST_MESSAGE( "Ethereum style recovery ids" );
   rsig_bytes.back() = char( uint8_t( rsig_bytes.back() ) + 27 );
   BOOST_CHECK( recover_public_key( rsig_bytes, msg, digest_algorithm::keccak256 ) == priv.get_public_key() );

   BOOST_CHECK( !verify_ecdsa_recoverable( rsig_bytes.substr( 0, 64 ), msg, digest_algorithm::keccak256 ) );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( ed25519_test )
{ try {
   BOOST_TEST_MESSAGE( "RFC 8032 test 1" );
   auto pub = keystone::util::from_hex( "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a" );
   auto sig = keystone::util::from_hex(
      "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b" );

   BOOST_CHECK( ed25519::verify( sig, pub, "" ) );
   BOOST_CHECK( !ed25519::verify( sig, pub, "x" ) );

   auto key = ed25519::private_key::regenerate(
      multihash( multicodec::sha2_256, keystone::util::from_hex( "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60" ) ) );
   BOOST_CHECK( key.get_public_key() == pub );
   BOOST_CHECK( key.sign( "" ) == sig );

   BOOST_TEST_MESSAGE( "Malformed inputs do not verify" );
   BOOST_CHECK( !ed25519::verify( sig.substr( 1 ), pub, "" ) );
   BOOST_CHECK( !ed25519::verify( sig, pub.substr( 1 ), "" ) );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
