#pragma once

#include <mollusk/runtime/sysvars.hpp>
#include <mollusk/runtime/types.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace mollusk::runtime {

class transaction_context;

/**
 * A handle to one account as seen by the executing instruction.
 *
 * Every mutation is checked against the privileges of the instruction and
 * the ownership of the account before it is applied.
 */
class borrowed_account
{
   public:
      borrowed_account( transaction_context& tc, uint16_t index_in_transaction, const pubkey& current_program_id, bool is_signer, bool is_writable );

      const pubkey& key() const;
      uint16_t index_in_transaction() const;

      const pubkey& owner() const;
      uint64_t lamports() const;
      const std::vector< uint8_t >& data() const;
      bool executable() const;
      uint64_t rent_epoch() const;

      bool is_signer() const;
      bool is_writable() const;
      bool is_owned_by_current_program() const;

      void set_owner( const pubkey& owner );
      void set_lamports( uint64_t lamports );
      void checked_add_lamports( uint64_t lamports );
      void checked_sub_lamports( uint64_t lamports );
      void set_data( const std::vector< uint8_t >& data );
      void set_data_length( std::size_t len );

      void can_data_be_changed() const;
      void can_data_be_resized( std::size_t new_len ) const;

   private:
      transaction_context& _tc;
      uint16_t             _index_in_transaction;
      pubkey               _current_program_id;
      bool                 _is_signer;
      bool                 _is_writable;
};

/**
 * One frame of the instruction stack.
 *
 * program_accounts holds transaction indices of the program account chain;
 * the last one is the program being executed.
 */
class instruction_context
{
   public:
      instruction_context() = default;
      instruction_context( std::vector< uint16_t > program_accounts, std::vector< instruction_account > instruction_accounts, std::vector< uint8_t > data );

      std::size_t nesting_level() const;
      void set_nesting_level( std::size_t level );

      const std::vector< uint8_t >& data() const;
      const std::vector< instruction_account >& instruction_accounts() const;
      const std::vector< uint16_t >& program_accounts() const;

      std::size_t number_of_instruction_accounts() const;
      void check_number_of_instruction_accounts( std::size_t expected ) const;

      uint16_t index_in_transaction_of_instruction_account( uint16_t index_in_instruction ) const;
      uint16_t last_program_index_in_transaction() const;

      const pubkey& last_program_key( const transaction_context& tc ) const;
      const pubkey& key_of_instruction_account( const transaction_context& tc, uint16_t index_in_instruction ) const;

      std::optional< uint16_t > find_index_of_instruction_account( const transaction_context& tc, const pubkey& key ) const;

      bool is_instruction_account_signer( uint16_t index_in_instruction ) const;
      bool is_instruction_account_writable( uint16_t index_in_instruction ) const;

      borrowed_account borrow_instruction_account( transaction_context& tc, uint16_t index_in_instruction ) const;
      borrowed_account borrow_last_program_account( transaction_context& tc ) const;

      /**
       * Keys of all instruction accounts marked as signers.
       */
      std::vector< pubkey > signers( const transaction_context& tc ) const;

   private:
      std::size_t                        _nesting_level = 0;
      std::vector< uint16_t >            _program_accounts;
      std::vector< instruction_account > _instruction_accounts;
      std::vector< uint8_t >             _data;
};

struct return_data
{
   pubkey                 program_id;
   std::vector< uint8_t > data;
};

/**
 * The account table and instruction stack of a single transaction.
 */
class transaction_context
{
   public:
      transaction_context( std::vector< keyed_account > accounts, const runtime::rent& r, uint64_t max_instruction_stack_depth, uint64_t max_instruction_trace_length );

      std::size_t number_of_accounts() const;
      const pubkey& key_of_account_at_index( uint16_t index ) const;
      account& account_at_index( uint16_t index );
      const account& account_at_index( uint16_t index ) const;
      std::optional< uint16_t > find_index_of_account( const pubkey& key ) const;

      const runtime::rent& rent() const;

      /**
       * Push an instruction onto the stack. Fails with call_depth when the
       * stack is full and with max_instruction_trace_length_exceeded when the
       * trace is.
       */
      void push( instruction_context ctx );

      /**
       * Pop the current instruction. Throws unbalanced_instruction_exception
       * if the lamport sum of its accounts changed; the frame is popped
       * regardless.
       */
      void pop();

      /**
       * Pop the current instruction without checking its balances. Used when
       * the instruction already failed.
       */
      void unwind();

      std::size_t instruction_stack_height() const;
      std::size_t instruction_trace_length() const;
      const instruction_context& current_instruction_context() const;
      const instruction_context& instruction_context_at_nesting_level( std::size_t level ) const;

      void set_return_data( const pubkey& program_id, std::vector< uint8_t > data );
      const runtime::return_data& get_return_data() const;

      /**
       * Release the account table in index order.
       */
      std::vector< keyed_account > deconstruct() &&;

   private:
      boost::multiprecision::uint128_t instruction_accounts_lamport_sum( const instruction_context& ctx ) const;

      std::vector< keyed_account >           _accounts;
      runtime::rent                          _rent;
      uint64_t                               _max_instruction_stack_depth;
      uint64_t                               _max_instruction_trace_length;
      // Frames must stay put while nested instructions are pushed
      std::deque< instruction_context >      _stack;
      std::vector< boost::multiprecision::uint128_t > _stack_lamport_sums;
      std::size_t                            _trace_length = 0;
      runtime::return_data                   _return_data;
};

} // mollusk::runtime
