#pragma once
#include <keystone/chain/address.hpp>

namespace keystone::chain {

class account_registry;
class resource_account_deriver;
class transaction_validator;

/**
 * The authority to act as an address within a transaction.
 *
 * The transaction validator issues one for a sender once its authenticator
 * checks out. Account creation and signer_capability are the only other
 * sources.
 */
class signer
{
   public:
      const address& get_address() const { return _address; }

   private:
      friend class account_registry;
      friend class resource_account_deriver;
      friend class transaction_validator;

      explicit signer( const address& a ) : _address( a ) {}

      address _address;
};

/**
 * Lasting control over an address that has no usable private key.
 *
 * Only the account registry and the resource account deriver can issue one.
 * Capabilities cannot be copied, only moved.
 */
class signer_capability
{
   public:
      signer_capability( signer_capability&& ) = default;
      signer_capability& operator=( signer_capability&& ) = default;

      signer_capability( const signer_capability& ) = delete;
      signer_capability& operator=( const signer_capability& ) = delete;

      const address& get_address() const { return _address; }

   private:
      friend class account_registry;
      friend class resource_account_deriver;

      explicit signer_capability( const address& a ) : _address( a ) {}

      address _address;
};

} // keystone::chain
