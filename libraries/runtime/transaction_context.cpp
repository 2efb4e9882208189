#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/transaction_context.hpp>

#include <algorithm>
#include <limits>

using uint128_t = boost::multiprecision::uint128_t;

namespace mollusk::runtime {

/*
 * Borrowed account
 */

borrowed_account::borrowed_account( transaction_context& tc, uint16_t index_in_transaction, const pubkey& current_program_id, bool is_signer, bool is_writable ) :
   _tc( tc ),
   _index_in_transaction( index_in_transaction ),
   _current_program_id( current_program_id ),
   _is_signer( is_signer ),
   _is_writable( is_writable )
{}

const pubkey& borrowed_account::key() const
{
   return _tc.key_of_account_at_index( _index_in_transaction );
}

uint16_t borrowed_account::index_in_transaction() const
{
   return _index_in_transaction;
}

const pubkey& borrowed_account::owner() const
{
   return _tc.account_at_index( _index_in_transaction ).owner;
}

uint64_t borrowed_account::lamports() const
{
   return _tc.account_at_index( _index_in_transaction ).lamports;
}

const std::vector< uint8_t >& borrowed_account::data() const
{
   return _tc.account_at_index( _index_in_transaction ).data;
}

bool borrowed_account::executable() const
{
   return _tc.account_at_index( _index_in_transaction ).executable;
}

uint64_t borrowed_account::rent_epoch() const
{
   return _tc.account_at_index( _index_in_transaction ).rent_epoch;
}

bool borrowed_account::is_signer() const
{
   return _is_signer;
}

bool borrowed_account::is_writable() const
{
   return _is_writable;
}

bool borrowed_account::is_owned_by_current_program() const
{
   return owner() == _current_program_id;
}

void borrowed_account::set_owner( const pubkey& new_owner )
{
   const auto& d = data();

   MOLLUSK_ASSERT( is_owned_by_current_program(), modified_program_id_exception,
      "only the owner may assign account ${a}", ("a", key().to_string()) );
   MOLLUSK_ASSERT( is_writable(), modified_program_id_exception,
      "cannot assign read-only account ${a}", ("a", key().to_string()) );
   MOLLUSK_ASSERT( !executable(), modified_program_id_exception,
      "cannot assign executable account ${a}", ("a", key().to_string()) );
   MOLLUSK_ASSERT( std::all_of( d.begin(), d.end(), []( uint8_t b ) { return b == 0; } ), modified_program_id_exception,
      "cannot assign account ${a} with non-zero data", ("a", key().to_string()) );

   _tc.account_at_index( _index_in_transaction ).owner = new_owner;
}

void borrowed_account::set_lamports( uint64_t new_lamports )
{
   if ( !is_owned_by_current_program() && new_lamports < lamports() )
   {
      MOLLUSK_THROW( external_account_lamport_spend_exception,
         "program ${p} debited account ${a} it does not own", ("p", _current_program_id.to_string())("a", key().to_string()) );
   }

   MOLLUSK_ASSERT( is_writable(), readonly_lamport_change_exception,
      "lamports of read-only account ${a} changed", ("a", key().to_string()) );
   MOLLUSK_ASSERT( !executable(), executable_lamport_change_exception,
      "lamports of executable account ${a} changed", ("a", key().to_string()) );

   _tc.account_at_index( _index_in_transaction ).lamports = new_lamports;
}

void borrowed_account::checked_add_lamports( uint64_t l )
{
   MOLLUSK_ASSERT( std::numeric_limits< uint64_t >::max() - lamports() >= l, arithmetic_overflow_exception,
      "lamport overflow on account ${a}", ("a", key().to_string()) );
   set_lamports( lamports() + l );
}

void borrowed_account::checked_sub_lamports( uint64_t l )
{
   MOLLUSK_ASSERT( lamports() >= l, arithmetic_overflow_exception,
      "lamport underflow on account ${a}", ("a", key().to_string()) );
   set_lamports( lamports() - l );
}

void borrowed_account::can_data_be_changed() const
{
   MOLLUSK_ASSERT( !executable(), executable_data_modified_exception,
      "data of executable account ${a} modified", ("a", key().to_string()) );
   MOLLUSK_ASSERT( is_writable(), readonly_data_modified_exception,
      "data of read-only account ${a} modified", ("a", key().to_string()) );
   MOLLUSK_ASSERT( is_owned_by_current_program(), external_account_data_modified_exception,
      "program ${p} modified data of account ${a} it does not own", ("p", _current_program_id.to_string())("a", key().to_string()) );
}

void borrowed_account::can_data_be_resized( std::size_t new_len ) const
{
   if ( new_len != data().size() && !is_owned_by_current_program() )
   {
      MOLLUSK_THROW( account_data_size_changed_exception,
         "program ${p} resized account ${a} it does not own", ("p", _current_program_id.to_string())("a", key().to_string()) );
   }

   MOLLUSK_ASSERT( new_len <= constants::max_permitted_data_length, invalid_realloc_exception,
      "requested data length ${l} exceeds the maximum of ${m}", ("l", new_len)("m", constants::max_permitted_data_length) );
}

void borrowed_account::set_data( const std::vector< uint8_t >& d )
{
   can_data_be_resized( d.size() );
   can_data_be_changed();
   _tc.account_at_index( _index_in_transaction ).data = d;
}

void borrowed_account::set_data_length( std::size_t len )
{
   can_data_be_resized( len );
   can_data_be_changed();

   auto& d = _tc.account_at_index( _index_in_transaction ).data;
   if ( d.size() != len )
      d.resize( len, 0 );
}

/*
 * Instruction context
 */

instruction_context::instruction_context( std::vector< uint16_t > program_accounts, std::vector< instruction_account > instruction_accounts, std::vector< uint8_t > data ) :
   _program_accounts( std::move( program_accounts ) ),
   _instruction_accounts( std::move( instruction_accounts ) ),
   _data( std::move( data ) )
{}

std::size_t instruction_context::nesting_level() const
{
   return _nesting_level;
}

void instruction_context::set_nesting_level( std::size_t level )
{
   _nesting_level = level;
}

const std::vector< uint8_t >& instruction_context::data() const
{
   return _data;
}

const std::vector< instruction_account >& instruction_context::instruction_accounts() const
{
   return _instruction_accounts;
}

const std::vector< uint16_t >& instruction_context::program_accounts() const
{
   return _program_accounts;
}

std::size_t instruction_context::number_of_instruction_accounts() const
{
   return _instruction_accounts.size();
}

void instruction_context::check_number_of_instruction_accounts( std::size_t expected ) const
{
   MOLLUSK_ASSERT( _instruction_accounts.size() >= expected, not_enough_account_keys_exception,
      "expected at least ${e} accounts, got ${n}", ("e", expected)("n", _instruction_accounts.size()) );
}

uint16_t instruction_context::index_in_transaction_of_instruction_account( uint16_t index_in_instruction ) const
{
   MOLLUSK_ASSERT( index_in_instruction < _instruction_accounts.size(), not_enough_account_keys_exception,
      "instruction account index ${i} out of range", ("i", index_in_instruction) );
   return _instruction_accounts[ index_in_instruction ].index_in_transaction;
}

uint16_t instruction_context::last_program_index_in_transaction() const
{
   MOLLUSK_ASSERT( !_program_accounts.empty(), not_enough_account_keys_exception, "instruction has no program account" );
   return _program_accounts.back();
}

const pubkey& instruction_context::last_program_key( const transaction_context& tc ) const
{
   return tc.key_of_account_at_index( last_program_index_in_transaction() );
}

const pubkey& instruction_context::key_of_instruction_account( const transaction_context& tc, uint16_t index_in_instruction ) const
{
   return tc.key_of_account_at_index( index_in_transaction_of_instruction_account( index_in_instruction ) );
}

std::optional< uint16_t > instruction_context::find_index_of_instruction_account( const transaction_context& tc, const pubkey& key ) const
{
   for ( std::size_t i = 0; i < _instruction_accounts.size(); i++ )
   {
      if ( tc.key_of_account_at_index( _instruction_accounts[ i ].index_in_transaction ) == key )
         return uint16_t( i );
   }

   return std::nullopt;
}

bool instruction_context::is_instruction_account_signer( uint16_t index_in_instruction ) const
{
   MOLLUSK_ASSERT( index_in_instruction < _instruction_accounts.size(), not_enough_account_keys_exception,
      "instruction account index ${i} out of range", ("i", index_in_instruction) );
   return _instruction_accounts[ index_in_instruction ].is_signer;
}

bool instruction_context::is_instruction_account_writable( uint16_t index_in_instruction ) const
{
   MOLLUSK_ASSERT( index_in_instruction < _instruction_accounts.size(), not_enough_account_keys_exception,
      "instruction account index ${i} out of range", ("i", index_in_instruction) );
   return _instruction_accounts[ index_in_instruction ].is_writable;
}

borrowed_account instruction_context::borrow_instruction_account( transaction_context& tc, uint16_t index_in_instruction ) const
{
   auto index_in_transaction = index_in_transaction_of_instruction_account( index_in_instruction );
   return borrowed_account(
      tc,
      index_in_transaction,
      last_program_key( tc ),
      is_instruction_account_signer( index_in_instruction ),
      is_instruction_account_writable( index_in_instruction )
   );
}

borrowed_account instruction_context::borrow_last_program_account( transaction_context& tc ) const
{
   return borrowed_account( tc, last_program_index_in_transaction(), last_program_key( tc ), false, false );
}

std::vector< pubkey > instruction_context::signers( const transaction_context& tc ) const
{
   std::vector< pubkey > result;
   for ( const auto& ia : _instruction_accounts )
   {
      if ( ia.is_signer )
         result.push_back( tc.key_of_account_at_index( ia.index_in_transaction ) );
   }
   return result;
}

/*
 * Transaction context
 */

transaction_context::transaction_context( std::vector< keyed_account > accounts, const runtime::rent& r, uint64_t max_instruction_stack_depth, uint64_t max_instruction_trace_length ) :
   _accounts( std::move( accounts ) ),
   _rent( r ),
   _max_instruction_stack_depth( max_instruction_stack_depth ),
   _max_instruction_trace_length( max_instruction_trace_length )
{
   MOLLUSK_ASSERT( _accounts.size() <= constants::max_transaction_accounts, max_accounts_exceeded_exception,
      "transaction has ${n} accounts, the limit is ${m}", ("n", _accounts.size())("m", constants::max_transaction_accounts) );
}

std::size_t transaction_context::number_of_accounts() const
{
   return _accounts.size();
}

const pubkey& transaction_context::key_of_account_at_index( uint16_t index ) const
{
   MOLLUSK_ASSERT( index < _accounts.size(), not_enough_account_keys_exception,
      "transaction account index ${i} out of range", ("i", index) );
   return _accounts[ index ].first;
}

account& transaction_context::account_at_index( uint16_t index )
{
   MOLLUSK_ASSERT( index < _accounts.size(), not_enough_account_keys_exception,
      "transaction account index ${i} out of range", ("i", index) );
   return _accounts[ index ].second;
}

const account& transaction_context::account_at_index( uint16_t index ) const
{
   MOLLUSK_ASSERT( index < _accounts.size(), not_enough_account_keys_exception,
      "transaction account index ${i} out of range", ("i", index) );
   return _accounts[ index ].second;
}

std::optional< uint16_t > transaction_context::find_index_of_account( const pubkey& key ) const
{
   for ( std::size_t i = 0; i < _accounts.size(); i++ )
   {
      if ( _accounts[ i ].first == key )
         return uint16_t( i );
   }

   return std::nullopt;
}

const runtime::rent& transaction_context::rent() const
{
   return _rent;
}

uint128_t transaction_context::instruction_accounts_lamport_sum( const instruction_context& ctx ) const
{
   uint128_t sum = 0;
   std::vector< uint16_t > seen;

   for ( const auto& ia : ctx.instruction_accounts() )
   {
      if ( std::find( seen.begin(), seen.end(), ia.index_in_transaction ) != seen.end() )
         continue;

      seen.push_back( ia.index_in_transaction );
      sum += account_at_index( ia.index_in_transaction ).lamports;
   }

   return sum;
}

void transaction_context::push( instruction_context ctx )
{
   MOLLUSK_ASSERT( _stack.size() < _max_instruction_stack_depth, call_depth_exception,
      "instruction stack depth of ${d} exceeded", ("d", _max_instruction_stack_depth) );
   MOLLUSK_ASSERT( _trace_length < _max_instruction_trace_length, max_instruction_trace_length_exceeded_exception,
      "instruction trace length of ${l} exceeded", ("l", _max_instruction_trace_length) );

   ctx.set_nesting_level( _stack.size() );
   _stack_lamport_sums.push_back( instruction_accounts_lamport_sum( ctx ) );
   _stack.emplace_back( std::move( ctx ) );
   _trace_length++;
}

void transaction_context::pop()
{
   MOLLUSK_ASSERT( !_stack.empty(), internal_error_exception, "instruction stack is empty" );

   bool unbalanced = instruction_accounts_lamport_sum( _stack.back() ) != _stack_lamport_sums.back();

   _stack.pop_back();
   _stack_lamport_sums.pop_back();

   MOLLUSK_ASSERT( !unbalanced, unbalanced_instruction_exception, "sum of account balances before and after instruction do not match" );
}

void transaction_context::unwind()
{
   MOLLUSK_ASSERT( !_stack.empty(), internal_error_exception, "instruction stack is empty" );

   _stack.pop_back();
   _stack_lamport_sums.pop_back();
}

std::size_t transaction_context::instruction_stack_height() const
{
   return _stack.size();
}

std::size_t transaction_context::instruction_trace_length() const
{
   return _trace_length;
}

const instruction_context& transaction_context::current_instruction_context() const
{
   MOLLUSK_ASSERT( !_stack.empty(), internal_error_exception, "instruction stack is empty" );
   return _stack.back();
}

const instruction_context& transaction_context::instruction_context_at_nesting_level( std::size_t level ) const
{
   MOLLUSK_ASSERT( level < _stack.size(), internal_error_exception, "no instruction at nesting level ${l}", ("l", level) );
   return _stack[ level ];
}

void transaction_context::set_return_data( const pubkey& program_id, std::vector< uint8_t > data )
{
   _return_data.program_id = program_id;
   _return_data.data = std::move( data );
}

const runtime::return_data& transaction_context::get_return_data() const
{
   return _return_data;
}

std::vector< keyed_account > transaction_context::deconstruct() &&
{
   return std::move( _accounts );
}

} // mollusk::runtime
