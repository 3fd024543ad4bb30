#include <keystone/crypto/openssl.hpp>
#include <keystone/exception.hpp>

#include <sodium.h>

namespace keystone::crypto
{
   struct openssl_scope
   {
      openssl_scope()
      {
         OPENSSL_init_crypto( OPENSSL_INIT_LOAD_CRYPTO_STRINGS | OPENSSL_INIT_ADD_ALL_DIGESTS, nullptr );
         KEYSTONE_ASSERT( sodium_init() >= 0, keystone::exception, "unable to initialize libsodium" );
      }
   };

   int init_openssl()
   {
      static openssl_scope ossl;
      return 0;
   }

   std::string last_openssl_error()
   {
      unsigned long code = ERR_get_error();
      if ( !code )
         return std::string();

      char buf[256];
      ERR_error_string_n( code, buf, sizeof( buf ) );
      return std::string( buf );
   }

} // keystone::crypto
