#pragma once

#include <cstdint>
#include <string>

namespace keystone::chain {

/**
 * Authentication schemes, identified by the leading byte of an authenticator payload.
 */
enum class scheme : uint8_t
{
   ed25519       = 0,
   multi_ed25519 = 1,
   ecdsa_k1      = 2,
   ethereum      = 3
};

// Domain separator for resource account addresses
constexpr uint8_t resource_account_scheme = 0xFF;

constexpr std::size_t authentication_key_length = 32;

// Installed on resource accounts, no private key hashes to it
const auto zero_authentication_key = std::string( authentication_key_length, '\0' );

namespace reserved {

// Reserved for the VM
constexpr uint64_t vm_address = 0x0;

// Reserved for the framework
constexpr uint64_t framework_address = 0x3;

// Framework reserved accounts that may be created without the sentinel check
constexpr uint64_t framework_range_min = 0x1;
constexpr uint64_t framework_range_max = 0xa;

} // reserved

} // keystone::chain
