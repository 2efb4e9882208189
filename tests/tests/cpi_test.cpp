#include <boost/test/unit_test.hpp>

#include "../test_fixtures/harness_fixture.hpp"

#include <mollusk/runtime/address.hpp>
#include <mollusk/runtime/compute_meter.hpp>

#include <mollusk/vm_manager/exceptions.hpp>

using namespace mollusk;
using runtime::pubkey;
using mollusk::tests::code;
using mollusk::tests::module_builder;

struct cpi_fixture : public harness_fixture
{
   // Arguments of sys_invoke
   static std::vector< uint8_t > invoke_args( const runtime::instruction& ix, const std::vector< runtime::seed_list >& signer_seeds = {} )
   {
      util::binary_writer w;
      w.write( ix.program_id.bytes() )
       .write( uint32_t( ix.accounts.size() ) );

      for ( const auto& meta : ix.accounts )
      {
         w.write( meta.key.bytes() )
          .write( uint8_t( meta.is_signer ) )
          .write( uint8_t( meta.is_writable ) );
      }

      w.write( uint32_t( ix.data.size() ) )
       .write( ix.data )
       .write( uint32_t( signer_seeds.size() ) );

      for ( const auto& seeds : signer_seeds )
      {
         w.write( uint32_t( seeds.size() ) );
         for ( const auto& seed : seeds )
         {
            w.write( uint32_t( seed.size() ) )
             .write( seed );
         }
      }

      return std::move( w ).data();
   }

   // A module that performs a single cross-program invocation
   static std::vector< uint8_t > invoke_program( const runtime::instruction& ix, const std::vector< runtime::seed_list >& signer_seeds = {} )
   {
      auto args = invoke_args( ix, signer_seeds );

      module_builder m;
      auto sys_invoke = m.import_system_call( "sys_invoke" );
      m.data( 0, args );

      code c;
      c.system_call( sys_invoke, 0, 0, 0, int32_t( args.size() ) ).drop();
      return m.build( c );
   }

   harness h;
};

BOOST_FIXTURE_TEST_SUITE( cpi_tests, cpi_fixture )

BOOST_AUTO_TEST_CASE( invoke_system_program_test )
{ try {
   auto from = pubkey::new_unique();
   auto to = pubkey::new_unique();
   auto transfer = runtime::system_instruction::transfer( from, to, 250 );

   auto id = add_bytecode( h, invoke_program( transfer ) );
   auto system = program::system_program();

   runtime::instruction ix{ id, {
      runtime::account_meta::writable( from, true ),
      runtime::account_meta::writable( to ),
      runtime::account_meta::readonly( system.first )
   }, {} };

   std::vector< keyed_account > accounts = {
      { from, system_account( 1000 ) },
      { to, system_account( 0 ) },
      system
   };

   auto result = h.process_and_validate_instruction( ix, accounts, {
      checks::success(),
      checks::account( from ).lamports( 750 ).build(),
      checks::account( to ).lamports( 250 ).build(),
      checks::account( system.first ).executable( true ).owner( runtime::program_id::native_loader() ).build()
   } );

   BOOST_CHECK_GE( result.compute_units_consumed,
      runtime::compute_cost::loader + h.compute_budget().syscall_base_cost + h.compute_budget().invoke_units + runtime::compute_cost::system_program );
   BOOST_CHECK_EQUAL( h.programs().find( runtime::program_id::system_program() )->invocation_count(), 1 );

   BOOST_TEST_MESSAGE( "Errors of the callee fail the caller" );
   accounts[0].second.lamports = 100;
   h.process_and_validate_instruction( ix, accounts, {
      checks::err( program_error::custom( uint32_t( runtime::system_program::system_error::result_with_negative_lamports ) ) ),
      checks::account( from ).lamports( 100 ).build()
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( program_derived_signer_test )
{ try {
   auto id = pubkey::new_unique();
   runtime::seed_list seeds = { { 'v', 'a', 'u', 'l', 't' } };
   auto [ vault, bump ] = runtime::find_program_address( seeds, id );
   seeds.push_back( { bump } );

   auto to = pubkey::new_unique();
   auto transfer = runtime::system_instruction::transfer( vault, to, 300 );
   auto system = program::system_program();

   runtime::instruction ix{ id, {
      runtime::account_meta::writable( vault ),
      runtime::account_meta::writable( to ),
      runtime::account_meta::readonly( system.first )
   }, {} };

   std::vector< keyed_account > accounts = {
      { vault, system_account( 1000 ) },
      { to, system_account( 0 ) },
      system
   };

   BOOST_TEST_MESSAGE( "Signing with the program's seeds" );
   h.add_program_with_bytecode( id, runtime::program_id::bpf_loader_upgradeable(), invoke_program( transfer, { seeds } ) );
   h.process_and_validate_instruction( ix, accounts, {
      checks::success(),
      checks::account( vault ).lamports( 700 ).build(),
      checks::account( to ).lamports( 300 ).build()
   } );

   BOOST_TEST_MESSAGE( "Without seeds the signature is an escalation" );
   h.add_program_with_bytecode( id, runtime::program_id::bpf_loader_upgradeable(), invoke_program( transfer ) );
   h.process_and_validate_instruction( ix, accounts, {
      checks::instruction_err( instruction_error::privilege_escalation ),
      checks::account( vault ).lamports( 1000 ).build()
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( writable_escalation_test )
{ try {
   auto from = pubkey::new_unique();
   auto to = pubkey::new_unique();
   auto id = add_bytecode( h, invoke_program( runtime::system_instruction::transfer( from, to, 1 ) ) );
   auto system = program::system_program();

   runtime::instruction ix{ id, {
      runtime::account_meta::writable( from, true ),
      runtime::account_meta::readonly( to ),
      runtime::account_meta::readonly( system.first )
   }, {} };

   h.process_and_validate_instruction( ix, { { from, system_account( 10 ) }, { to, system_account( 0 ) }, system }, {
      checks::instruction_err( instruction_error::privilege_escalation )
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( missing_account_test )
{ try {
   auto from = pubkey::new_unique();
   auto to = pubkey::new_unique();
   auto id = add_bytecode( h, invoke_program( runtime::system_instruction::transfer( from, to, 1 ) ) );
   auto system = program::system_program();

   BOOST_TEST_MESSAGE( "Callee account not passed to the caller" );
   runtime::instruction ix{ id, {
      runtime::account_meta::writable( from, true ),
      runtime::account_meta::readonly( system.first )
   }, {} };

   h.process_and_validate_instruction( ix, { { from, system_account( 10 ) }, system }, {
      checks::instruction_err( instruction_error::missing_account )
   } );

   BOOST_TEST_MESSAGE( "Callee program not passed to the caller" );
   runtime::instruction no_program{ id, {
      runtime::account_meta::writable( from, true ),
      runtime::account_meta::writable( to )
   }, {} };

   h.process_and_validate_instruction( no_program, { { from, system_account( 10 ) }, { to, system_account( 0 ) } }, {
      checks::instruction_err( instruction_error::missing_account )
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( call_depth_test )
{ try {
   auto id = pubkey::new_unique();
   runtime::instruction self_invoke{ id, { runtime::account_meta::readonly( id ) }, {} };

   h.add_program_with_bytecode( id, runtime::program_id::bpf_loader_upgradeable(), invoke_program( self_invoke ) );

   h.process_and_validate_instruction( self_invoke, { { id, program::program_account( id ) } }, {
      checks::instruction_err( instruction_error::call_depth )
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( reentrancy_test )
{ try {
   auto first = pubkey::new_unique();
   auto second = pubkey::new_unique();
   auto marker = pubkey::new_unique();

   // first invokes second, which invokes first again
   h.add_program_with_bytecode( first, runtime::program_id::bpf_loader_upgradeable(),
      invoke_program( runtime::instruction{ second, { runtime::account_meta::readonly( first ) }, {} } ) );
   h.add_program_with_bytecode( second, runtime::program_id::bpf_loader_upgradeable(),
      invoke_program( runtime::instruction{ first, {}, {} } ) );

   runtime::instruction ix{ first, {
      runtime::account_meta::readonly( second ),
      runtime::account_meta::readonly( first ),
      runtime::account_meta::writable( marker )
   }, {} };

   std::vector< keyed_account > accounts = {
      { second, program::program_account( second ) },
      { first, program::program_account( first ) },
      { marker, system_account( 77 ) }
   };

   h.process_and_validate_instruction( ix, accounts, {
      checks::instruction_err( instruction_error::reentrancy_not_allowed ),
      checks::account( marker ).lamports( 77 ).build(),
      checks::account( second ).executable( true ).build()
   } );

   BOOST_CHECK_EQUAL( h.programs().find( first )->invocation_count(), 1 );
   BOOST_CHECK_EQUAL( h.programs().find( second )->invocation_count(), 1 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( account_not_executable_test )
{ try {
   auto callee = pubkey::new_unique();
   auto id = add_bytecode( h, invoke_program( runtime::instruction{ callee, {}, {} } ) );

   runtime::instruction ix{ id, { runtime::account_meta::readonly( callee ) }, {} };

   BOOST_TEST_MESSAGE( "Invoking an account that is not a program" );
   h.process_and_validate_instruction( ix, { { callee, system_account( 10 ) } }, {
      checks::instruction_err( instruction_error::account_not_executable ),
      checks::account( callee ).lamports( 10 ).executable( false ).build()
   } );

   BOOST_TEST_MESSAGE( "Invoking a program account that lost its executable flag" );
   auto program_account = program::program_account( callee );
   program_account.executable = false;
   h.process_and_validate_instruction( ix, { { callee, program_account } }, {
      checks::instruction_err( instruction_error::account_not_executable ),
      checks::account( callee ).lamports( program_account.lamports ).executable( false ).build()
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( invoke_feature_test )
{ try {
   auto bytecode = invoke_program( runtime::system_instruction::transfer( pubkey::new_unique(), pubkey::new_unique(), 1 ) );

   runtime::feature_set features = runtime::feature_set::all_enabled();
   features.deactivate( runtime::feature::cross_program_invocation );
   h.set_feature_set( features );

   BOOST_CHECK_THROW( add_bytecode( h, bytecode ), vm_manager::unresolved_import_exception );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
