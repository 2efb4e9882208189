#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/invoke_context.hpp>

#include <mollusk/log.hpp>

#include <algorithm>
#include <chrono>

namespace mollusk::runtime {

invoke_context::invoke_context( transaction_context& tc, const program_cache& cache, const environment_config& env, compute_meter& meter ) :
   _tc( tc ),
   _cache( cache ),
   _env( env ),
   _meter( meter )
{}

void invoke_context::process_instruction(
   const std::vector< uint8_t >& data,
   const std::vector< instruction_account >& instruction_accounts,
   const std::vector< uint16_t >& program_indices,
   uint64_t& compute_units_consumed,
   uint64_t& execute_us )
{
   compute_units_consumed = 0;
   execute_us = 0;

   auto start = std::chrono::steady_clock::now();
   auto record_time = [&]()
   {
      execute_us = uint64_t( std::chrono::duration_cast< std::chrono::microseconds >( std::chrono::steady_clock::now() - start ).count() );
   };

   try
   {
      process( instruction_context( program_indices, instruction_accounts, data ), compute_units_consumed );
   }
   catch ( const instruction_exception& )
   {
      record_time();
      throw;
   }

   record_time();
}

void invoke_context::native_invoke( const instruction& ix, const std::vector< pubkey >& signers )
{
   auto [ instruction_accounts, program_indices ] = prepare_instruction( ix, signers );

   uint64_t compute_units_consumed = 0;
   process( instruction_context( std::move( program_indices ), std::move( instruction_accounts ), ix.data ), compute_units_consumed );
}

std::pair< std::vector< instruction_account >, std::vector< uint16_t > >
invoke_context::prepare_instruction( const instruction& ix, const std::vector< pubkey >& signers ) const
{
   const auto& caller = current_instruction();

   MOLLUSK_ASSERT( ix.accounts.size() < constants::max_transaction_accounts, max_accounts_exceeded_exception,
      "instruction has ${n} accounts, the limit is ${m}", ("n", ix.accounts.size())("m", constants::max_transaction_accounts - 1) );

   std::vector< instruction_account > deduplicated;
   std::vector< std::size_t > duplicate_indices;
   duplicate_indices.reserve( ix.accounts.size() );

   for ( std::size_t i = 0; i < ix.accounts.size(); i++ )
   {
      const auto& meta = ix.accounts[ i ];

      auto index_in_transaction = _tc.find_index_of_account( meta.key );
      MOLLUSK_ASSERT( index_in_transaction, missing_account_exception,
         "instruction references an unknown account ${a}", ("a", meta.key.to_string()) );

      auto dup = std::find_if( deduplicated.begin(), deduplicated.end(), [&]( const instruction_account& ia )
      {
         return ia.index_in_transaction == *index_in_transaction;
      } );

      if ( dup != deduplicated.end() )
      {
         duplicate_indices.push_back( std::size_t( dup - deduplicated.begin() ) );
         dup->is_signer   = dup->is_signer || meta.is_signer;
         dup->is_writable = dup->is_writable || meta.is_writable;
      }
      else
      {
         auto index_in_caller = caller.find_index_of_instruction_account( _tc, meta.key );
         MOLLUSK_ASSERT( index_in_caller, missing_account_exception,
            "instruction references an account ${a} not passed to the caller", ("a", meta.key.to_string()) );

         duplicate_indices.push_back( deduplicated.size() );

         instruction_account ia;
         ia.index_in_transaction = *index_in_transaction;
         ia.index_in_caller      = *index_in_caller;
         ia.index_in_callee      = uint16_t( i );
         ia.is_signer            = meta.is_signer;
         ia.is_writable          = meta.is_writable;
         deduplicated.push_back( ia );
      }
   }

   for ( const auto& ia : deduplicated )
   {
      auto borrowed = caller.borrow_instruction_account( _tc, ia.index_in_caller );

      MOLLUSK_ASSERT( !ia.is_writable || borrowed.is_writable(), privilege_escalation_exception,
         "writable privilege escalated for ${a}", ("a", borrowed.key().to_string()) );

      bool signed_by_caller = borrowed.is_signer()
         || std::find( signers.begin(), signers.end(), borrowed.key() ) != signers.end();
      MOLLUSK_ASSERT( !ia.is_signer || signed_by_caller, privilege_escalation_exception,
         "signer privilege escalated for ${a}", ("a", borrowed.key().to_string()) );
   }

   std::vector< instruction_account > instruction_accounts;
   instruction_accounts.reserve( duplicate_indices.size() );
   for ( auto i : duplicate_indices )
      instruction_accounts.push_back( deduplicated[ i ] );

   auto program_index = caller.find_index_of_instruction_account( _tc, ix.program_id );
   MOLLUSK_ASSERT( program_index, missing_account_exception,
      "program ${p} was not passed to the caller", ("p", ix.program_id.to_string()) );

   auto program_account = caller.borrow_instruction_account( _tc, *program_index );
   MOLLUSK_ASSERT( program_account.executable(), account_not_executable_exception,
      "account ${p} is not executable", ("p", ix.program_id.to_string()) );

   return { std::move( instruction_accounts ), { program_account.index_in_transaction() } };
}

transaction_context& invoke_context::transaction()
{
   return _tc;
}

const instruction_context& invoke_context::current_instruction() const
{
   return _tc.current_instruction_context();
}

const pubkey& invoke_context::current_program_id() const
{
   return current_instruction().last_program_key( _tc );
}

std::size_t invoke_context::stack_height() const
{
   return _tc.instruction_stack_height();
}

const program_cache& invoke_context::programs() const
{
   return _cache;
}

const environment_config& invoke_context::environment() const
{
   return _env;
}

compute_meter& invoke_context::meter()
{
   return _meter;
}

void invoke_context::consume( uint64_t units )
{
   _meter.consume( units );
}

void invoke_context::log( const std::string& msg ) const
{
   LOG(debug) << "Program log: " << msg;
}

void invoke_context::push( instruction_context ctx )
{
   const auto& program_id = ctx.last_program_key( _tc );

   if ( _tc.instruction_stack_height() > 0 )
   {
      bool contains = false;
      for ( std::size_t level = 0; level < _tc.instruction_stack_height(); level++ )
      {
         if ( _tc.instruction_context_at_nesting_level( level ).last_program_key( _tc ) == program_id )
         {
            contains = true;
            break;
         }
      }

      bool is_last = current_program_id() == program_id;
      MOLLUSK_ASSERT( !contains || is_last, reentrancy_not_allowed_exception,
         "program ${p} is already on the instruction stack", ("p", program_id.to_string()) );
   }

   _tc.push( std::move( ctx ) );
}

void invoke_context::process( instruction_context ctx, uint64_t& compute_units_consumed )
{
   push( std::move( ctx ) );

   try
   {
      process_executable_chain( compute_units_consumed );
   }
   catch ( ... )
   {
      _tc.unwind();
      throw;
   }

   _tc.pop();
}

void invoke_context::process_executable_chain( uint64_t& compute_units_consumed )
{
   const auto& ictx = current_instruction();
   auto program_account = ictx.borrow_last_program_account( _tc );
   const pubkey program_id = program_account.key();

   // Programs owned by the native loader are builtins, everything else runs through its loader
   const pubkey builtin_id = program_account.owner() == program_id::native_loader() ? program_id : program_account.owner();

   auto entry = _cache.find( builtin_id );
   MOLLUSK_ASSERT( entry && entry->is_builtin(), unsupported_program_id_exception,
      "program ${p} is not supported", ("p", builtin_id.to_string()) );

   _tc.set_return_data( program_id, {} );

   LOG(debug) << "Program " << program_id.to_string() << " invoke [" << _tc.instruction_stack_height() << "]";

   uint64_t pre_remaining = _meter.remaining();
   auto log_consumed = [&]()
   {
      compute_units_consumed = pre_remaining - _meter.remaining();
      LOG(debug) << "Program " << program_id.to_string() << " consumed " << compute_units_consumed << " of " << pre_remaining << " compute units";
   };

   try
   {
      entry->record_invocation();
      std::get< builtin_program >( entry->program() ).entrypoint( *this );
   }
   catch ( const instruction_exception& e )
   {
      log_consumed();
      LOG(debug) << "Program " << program_id.to_string() << " failed: " << e.get_message();
      throw;
   }

   log_consumed();
   LOG(debug) << "Program " << program_id.to_string() << " success";
}

} // mollusk::runtime
