#include <mollusk/harness/exceptions.hpp>
#include <mollusk/harness/file.hpp>
#include <mollusk/harness/harness.hpp>
#include <mollusk/harness/program.hpp>

#include <mollusk/runtime/compute_meter.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/invoke_context.hpp>
#include <mollusk/runtime/transaction_context.hpp>

#include <mollusk/log.hpp>

#include <tuple>

namespace mollusk {

namespace {

// The program account is the only account ahead of the caller's accounts
constexpr uint16_t program_accounts_len = 1;

program_result to_program_result( const runtime::instruction_exception& e )
{
   auto error = runtime::error_of( e );

   if ( auto pe = runtime::to_program_error( error, runtime::custom_code_of( e ) ) )
      return program_failure{ *pe };

   program_unknown_error unknown;
   unknown.error = error;

   const auto& j = e.get_json();
   auto it = j.find( "vm_error" );
   if ( it != j.end() && it->is_string() )
      unknown.vm_error = it->get< std::string >();

   return unknown;
}

} // anonymous

harness::harness() : harness( harness_config() ) {}

harness::harness( const pubkey& program_id, const std::string& program_name ) :
   harness( harness_config(), program_id, program_name )
{}

harness::harness( const harness_config& config )
{
   initialize_logging( config.log_level, config.log_dir, config.log_color );

   _env.compute_budget = config.compute_budget;
   _env.feature_set    = config.feature_set;
   _env.fee_structure  = config.fee_structure;

   if ( config.slot )
      _env.sysvars.warp_to_slot( *config.slot );

   std::tie( _program_id, _program_account ) = program::system_program();

   _program_paths = config.program_paths;
   for ( auto& p : file::default_search_paths() )
      _program_paths.push_back( std::move( p ) );
}

harness::harness( const harness_config& config, const pubkey& program_id, const std::string& program_name ) :
   harness( config )
{
   _program_id      = program_id;
   _program_account = program::program_account( program_id );
   add_program( program_id, program_name );
}

void harness::add_program( const pubkey& program_id, const std::string& program_name )
{
   auto bytecode = file::load_program_bytecode( program_name, _program_paths );
   add_program_with_bytecode( program_id, runtime::program_id::bpf_loader_upgradeable(), bytecode, program_name );
}

void harness::add_program_with_bytecode(
   const pubkey& program_id,
   const pubkey& loader_id,
   const std::vector< uint8_t >& bytecode,
   const std::string& program_name )
{
   _cache.add_program( program_id, loader_id, bytecode, _env.compute_budget, _env.feature_set, program_name );
}

void harness::add_builtin( const runtime::builtin& b )
{
   _cache.add_builtin( b );
}

void harness::warp_to_slot( uint64_t slot )
{
   _env.sysvars.warp_to_slot( slot );
}

void harness::set_compute_budget( const runtime::compute_budget& budget )
{
   _env.compute_budget = budget;
}

void harness::set_feature_set( const runtime::feature_set& features )
{
   _env.feature_set = features;
}

instruction_result harness::process_instruction( const instruction& ix, const std::vector< keyed_account >& accounts ) const
{
   instruction_result result;
   std::vector< instruction_account > instruction_accounts;

   try
   {
      MOLLUSK_ASSERT( accounts.size() + program_accounts_len <= runtime::constants::max_transaction_accounts,
         runtime::max_accounts_exceeded_exception, "${n} accounts were passed, the limit is ${m}",
         ("n", accounts.size())("m", runtime::constants::max_transaction_accounts - program_accounts_len) );

      instruction_accounts = build_instruction_accounts( ix );
   }
   catch ( const runtime::instruction_exception& e )
   {
      result.program_result = to_program_result( e );
      result.resulting_accounts = accounts;
      return result;
   }

   runtime::transaction_context tc(
      build_transaction_accounts( ix, accounts ),
      _env.sysvars.rent,
      _env.compute_budget.max_instruction_stack_depth,
      _env.compute_budget.max_instruction_trace_length );

   runtime::compute_meter meter( _env.compute_budget.compute_unit_limit );
   runtime::invoke_context ctx( tc, _cache, _env, meter );

   uint64_t compute_units_consumed = 0;

   try
   {
      ctx.process_instruction( ix.data, instruction_accounts, { 0 }, compute_units_consumed, result.execution_time );
      result.program_result = program_success{};
   }
   catch ( const runtime::instruction_exception& e )
   {
      result.program_result = to_program_result( e );
   }

   // Units spent before a failure count as well
   result.compute_units_consumed = meter.used();
   result.return_data = tc.get_return_data().data;

   auto transaction_accounts = std::move( tc ).deconstruct();
   result.resulting_accounts.reserve( accounts.size() );
   for ( std::size_t i = program_accounts_len; i < transaction_accounts.size(); i++ )
      result.resulting_accounts.push_back( std::move( transaction_accounts[ i ] ) );

   return result;
}

instruction_result harness::process_and_validate_instruction(
   const instruction& ix,
   const std::vector< keyed_account >& accounts,
   const std::vector< check >& checks ) const
{
   auto result = process_instruction( ix, accounts );
   run_checks( result, checks );
   return result;
}

std::vector< instruction_account > harness::build_instruction_accounts( const instruction& ix ) const
{
   MOLLUSK_ASSERT( ix.accounts.size() + program_accounts_len <= runtime::constants::max_transaction_accounts,
      runtime::max_accounts_exceeded_exception, "instruction has ${n} accounts, the limit is ${m}",
      ("n", ix.accounts.size())("m", runtime::constants::max_transaction_accounts - program_accounts_len) );

   std::vector< instruction_account > instruction_accounts;
   instruction_accounts.reserve( ix.accounts.size() );

   for ( std::size_t i = 0; i < ix.accounts.size(); i++ )
   {
      instruction_account ia;
      ia.index_in_transaction = uint16_t( i + program_accounts_len );
      ia.index_in_caller      = uint16_t( i );
      ia.index_in_callee      = uint16_t( i );
      ia.is_signer            = ix.accounts[ i ].is_signer;
      ia.is_writable          = ix.accounts[ i ].is_writable;
      instruction_accounts.push_back( ia );
   }

   return instruction_accounts;
}

std::vector< keyed_account > harness::build_transaction_accounts( const instruction& ix, const std::vector< keyed_account >& accounts ) const
{
   std::vector< keyed_account > transaction_accounts;
   transaction_accounts.reserve( accounts.size() + program_accounts_len );

   transaction_accounts.emplace_back( ix.program_id, resolve_program_account( ix.program_id ) );
   transaction_accounts.insert( transaction_accounts.end(), accounts.begin(), accounts.end() );

   return transaction_accounts;
}

account harness::resolve_program_account( const pubkey& program_id ) const
{
   if ( program_id == _program_id )
      return _program_account;

   auto entry = _cache.find( program_id );
   if ( !entry )
   {
      // Dispatch finds no builtin under this id and fails with unsupported_program_id
      account a;
      a.owner = runtime::program_id::native_loader();
      return a;
   }

   if ( entry->is_builtin() )
      return program::create_keyed_account_for_builtin_program( program_id, entry->metrics().program_name ).second;

   if ( entry->loader() == runtime::program_id::bpf_loader_upgradeable() )
      return program::program_account( program_id );

   if ( entry->loader() == runtime::program_id::bpf_loader() )
      return program::program_account_loader_2( {} );

   account a;
   a.owner      = entry->loader();
   a.executable = true;
   a.lamports   = _env.sysvars.rent.minimum_balance( 0 );
   return a;
}

const pubkey& harness::program_id() const
{
   return _program_id;
}

const account& harness::program_account() const
{
   return _program_account;
}

const runtime::environment_config& harness::environment() const
{
   return _env;
}

const runtime::compute_budget& harness::compute_budget() const
{
   return _env.compute_budget;
}

const runtime::feature_set& harness::feature_set() const
{
   return _env.feature_set;
}

const runtime::fee_structure& harness::fee_structure() const
{
   return _env.fee_structure;
}

const runtime::sysvars& harness::sysvars() const
{
   return _env.sysvars;
}

const runtime::program_cache& harness::programs() const
{
   return _cache;
}

} // mollusk
