#pragma once

#include <mollusk/exception.hpp>

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace mollusk::runtime {

MOLLUSK_DECLARE_EXCEPTION( invalid_pubkey_exception );

/**
 * A 32 byte account or program identity. The text form is base58.
 */
class pubkey
{
   public:
      static constexpr std::size_t size = 32;
      using bytes_type = std::array< uint8_t, size >;

      pubkey() = default;
      explicit pubkey( const bytes_type& b ) : _bytes( b ) {}

      static pubkey from_string( const std::string& s );
      static pubkey from_bytes( const uint8_t* data, std::size_t len );

      /**
       * A fresh identity, distinct from every identity returned before in
       * this process. Later identities compare greater than earlier ones.
       */
      static pubkey new_unique();

      std::string to_string() const;

      const bytes_type& bytes() const { return _bytes; }
      const uint8_t* data() const { return _bytes.data(); }

      bool operator==( const pubkey& o ) const { return _bytes == o._bytes; }
      bool operator!=( const pubkey& o ) const { return _bytes != o._bytes; }
      bool operator<( const pubkey& o ) const { return _bytes < o._bytes; }

   private:
      bytes_type _bytes{};
};

std::ostream& operator<<( std::ostream& os, const pubkey& k );

struct account
{
   account() = default;
   account( uint64_t l, std::size_t space, const pubkey& o ) :
      lamports( l ), data( space, 0 ), owner( o ) {}

   uint64_t               lamports   = 0;
   std::vector< uint8_t > data;
   pubkey                 owner;
   bool                   executable = false;
   uint64_t               rent_epoch = 0;

   bool operator==( const account& o ) const
   {
      return lamports == o.lamports && data == o.data && owner == o.owner
         && executable == o.executable && rent_epoch == o.rent_epoch;
   }

   bool operator!=( const account& o ) const { return !( *this == o ); }
};

using keyed_account = std::pair< pubkey, account >;

struct account_meta
{
   pubkey key;
   bool   is_signer   = false;
   bool   is_writable = false;

   static account_meta writable( const pubkey& k, bool signer = false ) { return account_meta{ k, signer, true }; }
   static account_meta readonly( const pubkey& k, bool signer = false ) { return account_meta{ k, signer, false }; }
};

struct instruction
{
   pubkey                      program_id;
   std::vector< account_meta > accounts;
   std::vector< uint8_t >      data;
};

/**
 * Position of one instruction account in the transaction's account table and
 * in the caller's and callee's instruction account lists.
 */
struct instruction_account
{
   uint16_t index_in_transaction = 0;
   uint16_t index_in_caller      = 0;
   uint16_t index_in_callee      = 0;
   bool     is_signer            = false;
   bool     is_writable          = false;

   bool operator==( const instruction_account& o ) const
   {
      return index_in_transaction == o.index_in_transaction && index_in_caller == o.index_in_caller
         && index_in_callee == o.index_in_callee && is_signer == o.is_signer && is_writable == o.is_writable;
   }
};

} // mollusk::runtime
