#pragma once

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/err.h>

#include <string>

namespace keystone::crypto
{
   /**
    * Owning handle for an OpenSSL object, freed with the matching *_free function.
    */
   template< typename ssl_type, void (*free_function)( ssl_type* ) >
   class ssl_wrapper
   {
      public:
         ssl_wrapper( ssl_type* obj = nullptr ) : obj( obj ) {}
         ssl_wrapper( const ssl_wrapper& ) = delete;
         ssl_wrapper( ssl_wrapper&& other ) : obj( other.obj ) { other.obj = nullptr; }
         ~ssl_wrapper() { if ( obj ) free_function( obj ); }

         ssl_wrapper& operator=( const ssl_wrapper& ) = delete;

         operator ssl_type*() { return obj; }
         operator const ssl_type*() const { return obj; }
         ssl_type* operator->() const { return obj; }
         ssl_type* get() const { return obj; }

      protected:
         ssl_type* obj;
   };

   using evp_pkey   = ssl_wrapper< EVP_PKEY, EVP_PKEY_free >;
   using evp_md_ctx = ssl_wrapper< EVP_MD_CTX, EVP_MD_CTX_free >;

   /**
    * Loads OpenSSL error strings and digests and initializes libsodium. Safe to call repeatedly.
    */
   int init_openssl();

   /**
    * Returns the most recent OpenSSL error as a string, or an empty string when there is none.
    */
   std::string last_openssl_error();

} //  keystone::crypto
