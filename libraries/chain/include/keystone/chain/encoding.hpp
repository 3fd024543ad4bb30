#pragma once
#include <keystone/chain/exceptions.hpp>

#include <cstdint>
#include <string>

namespace keystone::chain {

/**
 * A segregated witness program, as carried by a bech32 address.
 */
struct witness_program
{
   std::string hrp;
   uint8_t     version = 0;
   std::string program;
};

namespace encoding {

constexpr uint8_t p2pkh_version = 0x00;

std::string base58( const std::string& bytes );

/**
 * version || bytes || checksum, where the checksum is the first 4 bytes of
 * sha256( sha256( version || bytes ) ).
 */
std::string base58check( const std::string& bytes, uint8_t version );

/**
 * Witness version 0 uses bech32, versions 1 through 16 use bech32m.
 *
 * The program must be 2 to 40 bytes, and exactly 20 or 32 bytes for version 0.
 * Anything else fails with encoding_failure_exception.
 */
std::string bech32( const std::string& program, uint8_t version, const std::string& hrp = "bc" );

/**
 * Pay to public key hash address of a 33 or 65 byte secp256k1 public key.
 */
std::string p2pkh( const std::string& public_key );

} // encoding

namespace decoding {

std::string base58( const std::string& s );

/**
 * Returns the payload. Fails if the version byte or the checksum does not match.
 */
std::string base58check( const std::string& s, uint8_t version );

witness_program bech32( const std::string& s );

} // decoding

} // keystone::chain
