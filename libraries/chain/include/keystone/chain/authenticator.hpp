#pragma once
#include <keystone/chain/address.hpp>
#include <keystone/chain/constants.hpp>
#include <keystone/crypto/multihash.hpp>

#include <string>

namespace keystone::chain {

/**
 * hash( scheme_tag || public_key ), always authentication_key_length bytes.
 */
std::string authentication_key_from_public_key(
   scheme s,
   const std::string& public_key,
   crypto::multicodec code = crypto::multicodec::blake2b_256 );

address address_from_public_key(
   scheme s,
   const std::string& public_key,
   crypto::multicodec code = crypto::multicodec::blake2b_256 );

} // keystone::chain
