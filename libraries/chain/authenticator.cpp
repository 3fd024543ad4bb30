#include <keystone/chain/authenticator.hpp>

namespace keystone::chain {

std::string authentication_key_from_public_key( scheme s, const std::string& public_key, crypto::multicodec code )
{
   std::string preimage( 1, char( s ) );
   preimage += public_key;

   return crypto::hash( code, preimage, authentication_key_length ).digest();
}

address address_from_public_key( scheme s, const std::string& public_key, crypto::multicodec code )
{
   return address( authentication_key_from_public_key( s, public_key, code ) );
}

} // keystone::chain
