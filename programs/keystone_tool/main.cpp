#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <google/protobuf/util/json_util.h>

#include <keystone/chain/account.hpp>
#include <keystone/chain/exceptions.hpp>
#include <keystone/chain/resource_account.hpp>
#include <keystone/chain/transaction_validator.hpp>
#include <keystone/chain/validator_registry.hpp>
#include <keystone/crypto/ed25519.hpp>
#include <keystone/crypto/elliptic.hpp>
#include <keystone/crypto/multihash.hpp>
#include <keystone/exception.hpp>
#include <keystone/log.hpp>
#include <keystone/state_db/state_db.hpp>

#include <keystone/chain/chain.pb.h>

#include <keystone/util/hex.hpp>
#include <keystone/util/options.hpp>

#define HELP_OPTION                      "help"
#define BASEDIR_OPTION                   "basedir"
#define BASEDIR_DEFAULT                  "."
#define LOG_LEVEL_OPTION                 "log-level"
#define LOG_LEVEL_DEFAULT                "warning"
#define LOG_DIR_OPTION                   "log-dir"
#define LOG_COLOR_OPTION                 "log-color"
#define LOG_COLOR_DEFAULT                true
#define INSTANCE_ID_OPTION               "instance-id"
#define INSTANCE_ID_DEFAULT              "cli"
#define VERIFY_AUTHENTICATION_KEY_OPTION "verify-authentication-key"

#define DERIVE_ADDRESS_OPTION            "derive-address"
#define RESOURCE_ADDRESS_OPTION          "resource-address"
#define GENERATE_KEY_OPTION              "generate-key"
#define SIGN_OPTION                      "sign"
#define VALIDATE_OPTION                  "validate"

#define SCHEME_OPTION                    "scheme"
#define SCHEME_DEFAULT                   "ecdsa_k1"
#define PUBLIC_KEY_OPTION                "public-key"
#define SOURCE_OPTION                    "source"
#define SEED_OPTION                      "seed"
#define PRIVATE_KEY_OPTION               "private-key"
#define TX_HASH_OPTION                   "tx-hash"
#define PAYLOAD_OPTION                   "payload"
#define SENDER_OPTION                    "sender"

#define SERVICE_NAME                     "keystone"

using namespace keystone;

KEYSTONE_DECLARE_EXCEPTION( tool_exception );
KEYSTONE_DECLARE_DERIVED_EXCEPTION( invalid_argument, tool_exception );

namespace {

chain::scheme parse_scheme( const std::string& s )
{
   if ( s == "ed25519" || s == "0" )
      return chain::scheme::ed25519;
   if ( s == "multi_ed25519" || s == "1" )
      return chain::scheme::multi_ed25519;
   if ( s == "ecdsa_k1" || s == "2" )
      return chain::scheme::ecdsa_k1;
   if ( s == "ethereum" || s == "3" )
      return chain::scheme::ethereum;

   KEYSTONE_THROW( invalid_argument, "unknown scheme '${s}'", ("s", s) );
}

std::string require_hex( const boost::program_options::variables_map& args, const std::string& key )
{
   KEYSTONE_ASSERT( args.count( key ), invalid_argument, "option --${k} is required", ("k", key) );
   return util::from_hex( args[ key ].as< std::string >() );
}

void print_json( const google::protobuf::Message& msg )
{
   google::protobuf::util::JsonPrintOptions jpo;
   jpo.add_whitespace = true;
   jpo.always_print_primitive_fields = true;
   jpo.preserve_proto_field_names = true;

   std::string json;
   auto status = google::protobuf::util::MessageToJsonString( msg, &json, jpo );
   KEYSTONE_ASSERT( status.ok(), tool_exception, "unable to convert ${t} to json", ("t", msg.GetTypeName()) );

   std::cout << json << std::endl;
}

crypto::multihash secret_from_seed( const std::string& seed )
{
   return crypto::hash( crypto::multicodec::sha2_256, seed );
}

void derive_address( const chain::validator_registry& validators, chain::scheme s, const std::string& public_key )
{
   const auto& validator = validators.get_validator( s );
   auto key = validator.authentication_key_from_public_key( public_key );

   chain::address_derivation result;
   result.set_scheme( uint32_t( s ) );
   result.set_public_key( util::to_hex( public_key ) );
   result.set_authentication_key( util::to_hex( key ) );
   result.set_address( chain::address( key ).to_hex() );
   print_json( result );
}

void resource_address( const chain::address& source, const std::optional< std::string >& seed )
{
   state_db::database db;
   db.open();

   chain::account_registry registry( db.get_root() );
   chain::resource_account_deriver deriver( registry );

   auto resource_seed = seed ? *seed : deriver.derive_seed( source );

   chain::resource_address_derivation result;
   result.set_source( source.to_hex() );
   result.set_seed( util::to_hex( resource_seed ) );
   result.set_address( chain::resource_account_deriver::derive_resource_address( source, resource_seed ).to_hex() );
   print_json( result );
}

void generate_key( const chain::validator_registry& validators, chain::scheme s, const std::string& seed )
{
   auto secret = secret_from_seed( seed );
   std::string public_key;

   if ( s == chain::scheme::ed25519 )
   {
      public_key = crypto::ed25519::private_key::regenerate( secret ).get_public_key();
   }
   else
   {
      auto pub = crypto::private_key::regenerate( secret ).get_public_key().serialize();
      public_key = std::string( reinterpret_cast< const char* >( pub.data() ), pub.size() );
   }

   const auto& validator = validators.get_validator( s );

   chain::development_key result;
   result.set_scheme( uint32_t( s ) );
   result.set_private_key( util::to_hex( secret.digest() ) );
   result.set_public_key( util::to_hex( public_key ) );
   result.set_address( chain::address( validator.authentication_key_from_public_key( public_key ) ).to_hex() );
   print_json( result );
}

std::string sign( chain::scheme s, const std::string& private_key, const std::string& tx_hash )
{
   auto secret = crypto::multihash( crypto::multicodec::sha2_256, private_key );
   std::string payload( 1, char( s ) );

   switch ( s )
   {
      case chain::scheme::ed25519:
      {
         auto key = crypto::ed25519::private_key::regenerate( secret );
         payload += key.sign( tx_hash );
         payload += key.get_public_key();
         break;
      }
      case chain::scheme::ecdsa_k1:
      {
         auto key = crypto::private_key::regenerate( secret );
         auto sig = key.sign( crypto::message_digest( crypto::digest_algorithm::sha256, tx_hash ) );
         auto pub = key.get_public_key().serialize();
         payload.append( reinterpret_cast< const char* >( sig.data() ), sig.size() );
         payload.append( reinterpret_cast< const char* >( pub.data() ), pub.size() );
         break;
      }
      case chain::scheme::ethereum:
      {
         auto key = crypto::private_key::regenerate( secret );
         auto sig = key.sign_compact( crypto::message_digest( crypto::digest_algorithm::keccak256, tx_hash ) );
         payload.append( reinterpret_cast< const char* >( sig.data() ), sig.size() );
         break;
      }
      default:
         KEYSTONE_THROW( invalid_argument, "cannot sign for scheme ${s}", ("s", uint32_t( s )) );
   }

   return payload;
}

void validate(
   const std::shared_ptr< chain::validator_registry >& validators,
   const std::string& payload,
   const std::string& tx_hash,
   const std::optional< chain::address >& sender,
   bool verify_authentication_key )
{
   chain::validation_result result;
   result.set_error_code( chain::error_code::success );

   if ( !payload.empty() )
      result.set_scheme( uint8_t( payload[0] ) );

   try
   {
      if ( sender )
      {
         // The tool keeps no state. The sender has no account, sequence number 0.
         state_db::database db;
         db.open();

         chain::transaction_validator tx_validator( db.get_root(), validators, verify_authentication_key );
         tx_validator.validate( *sender, 0, chain::scheme( uint8_t( payload.empty() ? 0 : payload[0] ) ), payload, tx_hash );
      }

      result.set_address( validators->payload_to_address( payload, tx_hash ).to_hex() );
      result.set_valid( true );
   }
   catch ( const chain::reversion_exception& e )
   {
      result.set_valid( false );
      result.set_error_code( e.get_code() );
      result.set_message( e.get_message() );
   }

   print_json( result );
}

} // anonymous

int main( int argc, char** argv )
{
   try
   {
      boost::program_options::options_description options( "Options" );
      options.add_options()
         (HELP_OPTION                     ",h", "Print this help message and exit")
         (BASEDIR_OPTION                  ",d", boost::program_options::value< std::string >()->default_value( BASEDIR_DEFAULT ),
            "Directory holding config.yml")
         (LOG_LEVEL_OPTION                ",l", boost::program_options::value< std::string >(), "The log filtering level")
         (LOG_DIR_OPTION                      , boost::program_options::value< std::string >(), "Directory for log files")
         (LOG_COLOR_OPTION                    , boost::program_options::value< bool >(), "Colorize console log output")
         (INSTANCE_ID_OPTION              ",i", boost::program_options::value< std::string >(), "An ID that uniquely identifies the instance")
         (VERIFY_AUTHENTICATION_KEY_OPTION    , boost::program_options::value< bool >(),
            "Check the authenticator against the sender's stored authentication key")
         (DERIVE_ADDRESS_OPTION               , "Derive the authentication key and address of a public key")
         (RESOURCE_ADDRESS_OPTION             , "Derive a resource account address")
         (GENERATE_KEY_OPTION                 , "Generate a development key from a seed")
         (SIGN_OPTION                         , "Sign a transaction hash into an authenticator payload")
         (VALIDATE_OPTION                     , "Validate an authenticator payload")
         (SCHEME_OPTION                   ",s", boost::program_options::value< std::string >()->default_value( SCHEME_DEFAULT ),
            "Authentication scheme (ed25519, ecdsa_k1, ethereum)")
         (PUBLIC_KEY_OPTION                   , boost::program_options::value< std::string >(), "Hex encoded public key")
         (SOURCE_OPTION                       , boost::program_options::value< std::string >(), "Source address of a resource account")
         (SEED_OPTION                         , boost::program_options::value< std::string >(),
            "Hex encoded resource account seed, or the seed phrase of a development key")
         (PRIVATE_KEY_OPTION                  , boost::program_options::value< std::string >(), "Hex encoded private key")
         (TX_HASH_OPTION                      , boost::program_options::value< std::string >(), "Hex encoded transaction hash")
         (PAYLOAD_OPTION                      , boost::program_options::value< std::string >(), "Hex encoded authenticator payload")
         (SENDER_OPTION                       , boost::program_options::value< std::string >(),
            "Transaction sender address. With --validate the sender is checked against a fresh, empty state, "
            "so the expected sequence number is 0 and its stored authentication key is bcs(sender)");

      boost::program_options::variables_map args;
      boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );

      if ( args.count( HELP_OPTION ) )
      {
         std::cout << options << std::endl;
         return EXIT_SUCCESS;
      }

      auto basedir = std::filesystem::path( args[ BASEDIR_OPTION ].as< std::string >() );
      if ( basedir.is_relative() )
         basedir = std::filesystem::current_path() / basedir;

      YAML::Node config;
      YAML::Node global_config;
      YAML::Node tool_config;

      auto yaml_config = basedir / "config.yml";
      if ( !std::filesystem::exists( yaml_config ) )
      {
         yaml_config = basedir / "config.yaml";
      }

      if ( std::filesystem::exists( yaml_config ) )
      {
         config = YAML::LoadFile( yaml_config.string() );
         global_config = config[ "global" ];
         tool_config = config[ SERVICE_NAME ];
      }

      auto log_level   = util::get_option< std::string >( LOG_LEVEL_OPTION, LOG_LEVEL_DEFAULT, args, tool_config, global_config );
      auto log_dir     = util::get_option< std::string >( LOG_DIR_OPTION, "", args, tool_config, global_config );
      auto log_color   = util::get_option< bool >( LOG_COLOR_OPTION, LOG_COLOR_DEFAULT, args, tool_config, global_config );
      auto instance_id = util::get_option< std::string >( INSTANCE_ID_OPTION, INSTANCE_ID_DEFAULT, args, tool_config, global_config );
      auto verify_key  = util::get_option< bool >( VERIFY_AUTHENTICATION_KEY_OPTION, false, args, tool_config, global_config );

      std::optional< std::filesystem::path > log_directory;
      if ( log_dir.size() )
      {
         log_directory = std::filesystem::path( log_dir );
         if ( log_directory->is_relative() )
            log_directory = basedir / *log_directory;
      }

      initialize_logging( SERVICE_NAME, instance_id, log_level, log_directory, log_color );

      if ( config.IsNull() )
      {
         LOG(debug) << "Could not find config (config.yml or config.yaml expected). Using default values";
      }

      auto scheme = parse_scheme( args[ SCHEME_OPTION ].as< std::string >() );
      auto validators = chain::make_default_validator_registry();

      if ( args.count( DERIVE_ADDRESS_OPTION ) )
      {
         derive_address( *validators, scheme, require_hex( args, PUBLIC_KEY_OPTION ) );
      }
      else if ( args.count( RESOURCE_ADDRESS_OPTION ) )
      {
         KEYSTONE_ASSERT( args.count( SOURCE_OPTION ), invalid_argument, "option --" SOURCE_OPTION " is required" );

         std::optional< std::string > seed;
         if ( args.count( SEED_OPTION ) )
            seed = util::from_hex( args[ SEED_OPTION ].as< std::string >() );

         resource_address( chain::address::from_hex( args[ SOURCE_OPTION ].as< std::string >() ), seed );
      }
      else if ( args.count( GENERATE_KEY_OPTION ) )
      {
         KEYSTONE_ASSERT( args.count( SEED_OPTION ), invalid_argument, "option --" SEED_OPTION " is required" );
         generate_key( *validators, scheme, args[ SEED_OPTION ].as< std::string >() );
      }
      else if ( args.count( SIGN_OPTION ) )
      {
         auto tx_hash = require_hex( args, TX_HASH_OPTION );
         auto payload = sign( scheme, require_hex( args, PRIVATE_KEY_OPTION ), tx_hash );

         chain::signed_payload result;
         result.set_scheme( uint32_t( scheme ) );
         result.set_tx_hash( util::to_hex( tx_hash ) );
         result.set_payload( util::to_hex( payload ) );
         result.set_address( validators->payload_to_address( payload, tx_hash ).to_hex() );
         print_json( result );
      }
      else if ( args.count( VALIDATE_OPTION ) )
      {
         std::optional< chain::address > sender;
         if ( args.count( SENDER_OPTION ) )
            sender = chain::address::from_hex( args[ SENDER_OPTION ].as< std::string >() );

         validate( validators, require_hex( args, PAYLOAD_OPTION ), require_hex( args, TX_HASH_OPTION ), sender, verify_key );
      }
      else
      {
         std::cout << options << std::endl;
         return EXIT_FAILURE;
      }

      return EXIT_SUCCESS;
   }
   catch ( const invalid_argument& e )
   {
      LOG(error) << "Invalid argument: " << e.get_message();
   }
   catch ( const keystone::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
   }
   catch ( const boost::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << boost::diagnostic_information( e );
   }
   catch ( const std::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
   }
   catch ( ... )
   {
      LOG(fatal) << "An unexpected error has occurred";
   }

   return EXIT_FAILURE;
}
