#include <boost/test/unit_test.hpp>

#include "../test_fixtures/harness_fixture.hpp"

#include <mollusk/runtime/compute_meter.hpp>

using namespace mollusk;
using runtime::pubkey;
using mollusk::tests::code;
using mollusk::tests::module_builder;

struct bytecode_fixture : public harness_fixture
{
   // Sets the lamports of instruction accounts 0 and 1
   static std::vector< uint8_t > set_lamports_program( uint64_t first, uint64_t second )
   {
      module_builder m;
      auto set_lamports = m.import_system_call( "sys_set_account_lamports" );
      m.data( 0, u32_u64_bytes( 0, first ) );
      m.data( 16, u32_u64_bytes( 1, second ) );

      code c;
      c.system_call( set_lamports, 0, 0, 0, 12 ).drop()
       .system_call( set_lamports, 0, 0, 16, 12 ).drop();
      return m.build( c );
   }

   static runtime::account owned_account( uint64_t lamports, const pubkey& owner )
   {
      return runtime::account( lamports, 0, owner );
   }

   harness h;
};

BOOST_FIXTURE_TEST_SUITE( bytecode_tests, bytecode_fixture )

BOOST_AUTO_TEST_CASE( noop_program_test )
{ try {
   auto id = add_bytecode( h, noop_program() );

   auto result = h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, { checks::success() } );

   BOOST_CHECK_GE( result.compute_units_consumed, runtime::compute_cost::loader );
   BOOST_CHECK( result.resulting_accounts.empty() );
   BOOST_CHECK( result.return_data.empty() );
   BOOST_CHECK_EQUAL( h.programs().find( id )->invocation_count(), 1 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( exit_code_test )
{ try {
   BOOST_TEST_MESSAGE( "Exit code zero is success" );
   auto ok = add_bytecode( h, exit_program( 0 ) );
   h.process_and_validate_instruction( runtime::instruction{ ok, {}, {} }, {}, { checks::success() } );

   BOOST_TEST_MESSAGE( "Non-zero exit code is a custom error" );
   auto failing = add_bytecode( h, exit_program( 42 ) );
   auto result = h.process_and_validate_instruction( runtime::instruction{ failing, {}, {} }, {}, {
      checks::err( program_error::custom( 42 ) )
   } );

   BOOST_CHECK_GE( result.compute_units_consumed, runtime::compute_cost::loader + h.compute_budget().syscall_base_cost );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( trap_test )
{ try {
   code c;
   c.unreachable();
   auto id = add_bytecode( h, module_builder().build( c ) );

   auto result = h.process_instruction( runtime::instruction{ id, {}, {} }, {} );

   BOOST_REQUIRE( std::holds_alternative< program_unknown_error >( result.program_result ) );
   const auto& err = std::get< program_unknown_error >( result.program_result );
   BOOST_CHECK( err.error == instruction_error::program_failed_to_complete );
   BOOST_REQUIRE( err.vm_error.has_value() );
   BOOST_CHECK( !err.vm_error->empty() );
   BOOST_CHECK( !is_success( result.program_result ) );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( compute_budget_exhaustion_test )
{ try {
   runtime::compute_budget budget;
   budget.compute_unit_limit = 10000;
   h.set_compute_budget( budget );

   code c;
   c.loop_forever();
   auto id = add_bytecode( h, module_builder().build( c ) );

   auto result = h.process_instruction( runtime::instruction{ id, {}, {} }, {} );

   BOOST_CHECK( result.program_result == program_result( program_unknown_error{ instruction_error::computational_budget_exceeded, {} } ) );
   BOOST_CHECK_EQUAL( result.compute_units_consumed, 10000 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( return_data_test )
{ try {
   auto id = add_bytecode( h, echo_program() );
   std::vector< uint8_t > payload = { 'm', 'o', 'l', 'l', 'u', 's', 'k' };

   auto result = h.process_and_validate_instruction( runtime::instruction{ id, {}, payload }, {}, {
      checks::success(),
      checks::return_data( payload )
   } );

   BOOST_CHECK( result.return_data == payload );

   BOOST_TEST_MESSAGE( "Empty instruction data leaves empty return data" );
   h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, {
      checks::success(),
      checks::return_data( {} )
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( log_test )
{ try {
   module_builder m;
   auto sys_log = m.import_system_call( "sys_log" );
   m.data( 0, std::string( "hello from bytecode" ) );

   code c;
   c.system_call( sys_log, 0, 0, 0, 19 ).drop();
   auto id = add_bytecode( h, m.build( c ) );

   auto result = h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, { checks::success() } );
   BOOST_CHECK_GE( result.compute_units_consumed, runtime::compute_cost::loader + h.compute_budget().syscall_base_cost );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( clock_test )
{ try {
   module_builder m;
   auto get_clock = m.import_system_call( "sys_get_clock" );
   auto set_return = m.import_system_call( "sys_set_return_data" );

   code c;
   c.system_call( get_clock, 0, int32_t( runtime::constants::clock_size ), 0, 0 ).drop()
    .system_call( set_return, 0, 0, 0, int32_t( runtime::constants::clock_size ) ).drop();
   auto id = add_bytecode( h, m.build( c ) );

   h.warp_to_slot( 1000 );
   auto result = h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, { checks::success() } );

   BOOST_REQUIRE_EQUAL( result.return_data.size(), runtime::constants::clock_size );

   util::binary_reader r( result.return_data );
   BOOST_CHECK_EQUAL( r.read< uint64_t >(), 1000 );
   r.read< int64_t >();
   BOOST_CHECK_EQUAL( r.read< uint64_t >(), h.sysvars().clock.epoch );
   BOOST_CHECK_EQUAL( r.read< uint64_t >(), h.sysvars().clock.leader_schedule_epoch );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( account_lamports_test )
{ try {
   module_builder m;
   auto get_lamports = m.import_system_call( "sys_get_account_lamports" );
   auto set_return = m.import_system_call( "sys_set_return_data" );
   m.data( 0, u32_bytes( 0 ) );

   code c;
   c.system_call( get_lamports, 64, 8, 0, 4 ).drop()
    .system_call( set_return, 0, 0, 64, 8 ).drop();
   auto id = add_bytecode( h, m.build( c ) );

   auto key = pubkey::new_unique();
   runtime::instruction ix{ id, { runtime::account_meta::readonly( key ) }, {} };

   auto result = h.process_and_validate_instruction( ix, { { key, system_account( 123456789 ) } }, { checks::success() } );

   util::binary_reader r( result.return_data );
   BOOST_CHECK_EQUAL( r.read< uint64_t >(), 123456789 );

   BOOST_TEST_MESSAGE( "An account index past the instruction accounts fails" );
   h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, {
      checks::instruction_err( instruction_error::not_enough_account_keys )
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( lamport_rules_test )
{ try {
   auto id = add_bytecode( h, set_lamports_program( 400, 600 ) );
   auto a = pubkey::new_unique();
   auto b = pubkey::new_unique();

   BOOST_TEST_MESSAGE( "Balanced move between owned accounts" );
   runtime::instruction ix{ id, { runtime::account_meta::writable( a ), runtime::account_meta::writable( b ) }, {} };
   std::vector< keyed_account > accounts = {
      { a, owned_account( 500, id ) },
      { b, owned_account( 500, id ) }
   };

   h.process_and_validate_instruction( ix, accounts, {
      checks::success(),
      checks::account( a ).lamports( 400 ).owner( id ).build(),
      checks::account( b ).lamports( 600 ).build()
   } );

   BOOST_TEST_MESSAGE( "Changing lamports of a read-only account" );
   auto readonly_ix = ix;
   readonly_ix.accounts[1].is_writable = false;
   h.process_and_validate_instruction( readonly_ix, accounts, {
      checks::instruction_err( instruction_error::readonly_lamport_change )
   } );

   BOOST_TEST_MESSAGE( "Debiting an account owned by another program" );
   auto external = accounts;
   external[0].second.owner = runtime::program_id::system_program();
   h.process_and_validate_instruction( ix, external, {
      checks::instruction_err( instruction_error::external_account_lamport_spend ),
      checks::account( a ).lamports( 500 ).build()
   } );

   BOOST_TEST_MESSAGE( "Changing lamports of an executable account" );
   auto executable = accounts;
   executable[0].second.executable = true;
   h.process_and_validate_instruction( ix, executable, {
      checks::instruction_err( instruction_error::executable_lamport_change ),
      checks::account( a ).lamports( 500 ).executable( true ).build(),
      checks::account( b ).lamports( 500 ).build()
   } );

   BOOST_TEST_MESSAGE( "Creating lamports" );
   auto minting = add_bytecode( h, set_lamports_program( 500, 700 ) );
   runtime::instruction mint_ix{ minting, ix.accounts, {} };
   std::vector< keyed_account > mint_accounts = {
      { a, owned_account( 500, minting ) },
      { b, owned_account( 500, minting ) }
   };
   h.process_and_validate_instruction( mint_ix, mint_accounts, {
      checks::instruction_err( instruction_error::unbalanced_instruction )
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( account_data_test )
{ try {
   module_builder m;
   auto set_data = m.import_system_call( "sys_set_account_data" );
   std::vector< uint8_t > args = u32_bytes( 0 );
   args.insert( args.end(), { 0xde, 0xad, 0xbe, 0xef } );
   m.data( 0, args );

   code c;
   c.system_call( set_data, 0, 0, 0, int32_t( args.size() ) ).drop();
   auto id = add_bytecode( h, m.build( c ) );

   auto key = pubkey::new_unique();
   runtime::instruction ix{ id, { runtime::account_meta::writable( key ) }, {} };

   h.process_and_validate_instruction( ix, { { key, owned_account( 1000, id ) } }, {
      checks::success(),
      checks::account( key )
         .data( { 0xde, 0xad, 0xbe, 0xef } )
         .space( 4 )
         .predicate( "data starts with 0xde", []( const account& acc ) { return !acc.data.empty() && acc.data[0] == 0xde; } )
         .build()
   } );

   BOOST_TEST_MESSAGE( "Writing data of an account owned by another program" );
   h.process_and_validate_instruction( ix, { { key, system_account( 1000 ) } }, {
      checks::instruction_err( instruction_error::account_data_size_changed ),
      checks::account( key ).space( 0 ).build()
   } );

   BOOST_TEST_MESSAGE( "Writing data of an executable account" );
   auto program_like = owned_account( 1000, id );
   program_like.data = { 0x01, 0x02, 0x03, 0x04 };
   program_like.executable = true;
   h.process_and_validate_instruction( ix, { { key, program_like } }, {
      checks::instruction_err( instruction_error::executable_data_modified ),
      checks::account( key ).data( { 0x01, 0x02, 0x03, 0x04 } ).executable( true ).build()
   } );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
