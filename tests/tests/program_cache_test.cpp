#include <boost/test/unit_test.hpp>

#include "../test_fixtures/harness_fixture.hpp"

#include <mollusk/runtime/builtins.hpp>
#include <mollusk/runtime/invoke_context.hpp>
#include <mollusk/runtime/program_cache.hpp>

#include <mollusk/vm_manager/exceptions.hpp>

#include <atomic>
#include <thread>

using namespace mollusk;
using runtime::pubkey;
using mollusk::tests::code;
using mollusk::tests::module_builder;

struct program_cache_fixture : public harness_fixture
{
   runtime::compute_budget budget;
   runtime::feature_set    features = runtime::feature_set::all_enabled();
};

BOOST_FIXTURE_TEST_SUITE( program_cache_tests, program_cache_fixture )

BOOST_AUTO_TEST_CASE( default_builtins_test )
{ try {
   runtime::program_cache cache;

   BOOST_REQUIRE_EQUAL( cache.size(), 3 );

   for ( const auto& id : { runtime::program_id::system_program(), runtime::program_id::bpf_loader(), runtime::program_id::bpf_loader_upgradeable() } )
   {
      auto entry = cache.find( id );
      BOOST_REQUIRE( entry );
      BOOST_CHECK( entry->is_builtin() );
      BOOST_CHECK( entry->loader() == runtime::program_id::native_loader() );
      BOOST_CHECK_EQUAL( entry->invocation_count(), 0 );
   }

   BOOST_CHECK_EQUAL( cache.find( runtime::program_id::system_program() )->metrics().program_name, runtime::builtin_name::system_program );
   BOOST_CHECK( !cache.find( pubkey::new_unique() ) );

   BOOST_TEST_MESSAGE( "Backend lookup" );
   BOOST_CHECK_EQUAL( cache.backend()->backend_name(), vm_manager::get_default_vm_backend_name() );
   BOOST_CHECK_THROW( vm_manager::get_vm_backend( "no_such_vm" ), vm_manager::unknown_backend_exception );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( add_program_test )
{ try {
   runtime::program_cache cache;
   auto id = pubkey::new_unique();
   auto bytecode = noop_program();

   cache.add_program( id, runtime::program_id::bpf_loader_upgradeable(), bytecode, budget, features, "noop" );

   auto entry = cache.find( id );
   BOOST_REQUIRE( entry );
   BOOST_CHECK( !entry->is_builtin() );
   BOOST_CHECK( entry->loader() == runtime::program_id::bpf_loader_upgradeable() );
   BOOST_CHECK_EQUAL( entry->metrics().program_name, "noop" );
   BOOST_CHECK_EQUAL( entry->metrics().bytecode_size, bytecode.size() );
   BOOST_CHECK_EQUAL( cache.size(), 4 );

   BOOST_TEST_MESSAGE( "An unnamed program is named after its id" );
   auto unnamed = pubkey::new_unique();
   cache.add_program( unnamed, runtime::program_id::bpf_loader(), bytecode, budget, features );
   BOOST_CHECK_EQUAL( cache.find( unnamed )->metrics().program_name, unnamed.to_string() );

   auto ids = cache.program_ids();
   BOOST_CHECK_EQUAL( ids.size(), 5 );
   BOOST_CHECK( std::find( ids.begin(), ids.end(), id ) != ids.end() );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( replace_program_test )
{ try {
   harness h;
   auto id = pubkey::new_unique();

   h.add_program_with_bytecode( id, runtime::program_id::bpf_loader_upgradeable(), exit_program( 1 ) );
   auto first = h.programs().find( id );

   h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, { checks::err( program_error::custom( 1 ) ) } );

   BOOST_TEST_MESSAGE( "The most recent add wins" );
   h.add_program_with_bytecode( id, runtime::program_id::bpf_loader_upgradeable(), exit_program( 2 ) );
   h.process_and_validate_instruction( runtime::instruction{ id, {}, {} }, {}, { checks::err( program_error::custom( 2 ) ) } );

   BOOST_TEST_MESSAGE( "A replaced entry stays usable by its holder" );
   BOOST_CHECK( first != h.programs().find( id ) );
   BOOST_CHECK_EQUAL( first->invocation_count(), 1 );
   BOOST_CHECK_EQUAL( h.programs().find( id )->invocation_count(), 1 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( rejected_bytecode_test )
{ try {
   runtime::program_cache cache;
   auto id = pubkey::new_unique();
   const auto& loader = runtime::program_id::bpf_loader_upgradeable();

   cache.add_program( id, loader, noop_program(), budget, features );
   auto previous = cache.find( id );

   BOOST_TEST_MESSAGE( "Bytecode that does not parse" );
   BOOST_CHECK_THROW( cache.add_program( id, loader, { 0x00, 0x61, 0x73, 0x6d, 0xff }, budget, features ), vm_manager::load_exception );
   BOOST_CHECK( cache.find( id ) == previous );

   BOOST_TEST_MESSAGE( "Empty bytecode" );
   BOOST_CHECK_THROW( cache.add_program( id, loader, {}, budget, features ), vm_manager::bytecode_size_exception );
   BOOST_CHECK( cache.find( id ) == previous );

   BOOST_TEST_MESSAGE( "Missing entrypoint" );
   module_builder m;
   m.export_name( "main" );
   BOOST_CHECK_THROW( cache.add_program( id, loader, m.build( code() ), budget, features ), vm_manager::missing_entrypoint_exception );
   BOOST_CHECK( cache.find( id ) == previous );

   BOOST_TEST_MESSAGE( "Import of an unknown system call" );
   module_builder unknown;
   unknown.import_system_call( "sys_format_disk" );
   BOOST_CHECK_THROW( cache.add_program( id, loader, unknown.build( code() ), budget, features ), vm_manager::unresolved_import_exception );
   BOOST_CHECK( cache.find( id ) == previous );
   BOOST_CHECK_EQUAL( cache.size(), 4 );

   BOOST_TEST_MESSAGE( "A harness keeps executing the previous image" );
   harness h;
   auto exiting = add_bytecode( h, exit_program( 3 ) );
   runtime::instruction ix{ exiting, {}, {} };

   BOOST_CHECK_THROW( h.add_program_with_bytecode( exiting, loader, { 0x00, 0x61, 0x73, 0x6d, 0xff } ), vm_manager::load_exception );
   BOOST_CHECK_THROW( h.add_program_with_bytecode( exiting, loader, unknown.build( code() ) ), vm_manager::unresolved_import_exception );

   h.process_and_validate_instruction( ix, {}, {
      checks::err( program_error::custom( 3 ) )
   } );
   BOOST_CHECK_EQUAL( h.programs().find( exiting )->invocation_count(), 1 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( feature_gated_system_call_test )
{ try {
   module_builder m;
   m.import_system_call( "sys_get_clock" );
   auto bytecode = m.build( code() );

   runtime::program_cache cache;
   auto id = pubkey::new_unique();

   runtime::feature_set without_clock = runtime::feature_set::all_enabled();
   without_clock.deactivate( runtime::feature::clock_sysvar_syscall );

   BOOST_CHECK_THROW( cache.add_program( id, runtime::program_id::bpf_loader(), bytecode, budget, without_clock ), vm_manager::unresolved_import_exception );
   BOOST_CHECK( !cache.find( id ) );

   cache.add_program( id, runtime::program_id::bpf_loader(), bytecode, budget, features );
   BOOST_CHECK( cache.find( id ) );

   BOOST_TEST_MESSAGE( "A harness loads with its own feature set" );
   harness h;
   h.set_feature_set( runtime::feature_set() );
   BOOST_CHECK_THROW( h.add_program_with_bytecode( id, runtime::program_id::bpf_loader(), bytecode ), vm_manager::unresolved_import_exception );
   BOOST_CHECK_NO_THROW( h.add_program_with_bytecode( id, runtime::program_id::bpf_loader(), exit_program( 0 ) ) );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( custom_builtin_test )
{ try {
   harness h;
   auto id = pubkey::new_unique();

   h.add_builtin( runtime::builtin{ id, "echo_builtin", []( runtime::invoke_context& ctx )
   {
      ctx.consume( 7 );
      ctx.transaction().set_return_data( ctx.current_program_id(), ctx.current_instruction().data() );
   } } );

   auto entry = h.programs().find( id );
   BOOST_REQUIRE( entry );
   BOOST_CHECK( entry->is_builtin() );

   std::vector< uint8_t > payload = { 9, 8, 7 };
   h.process_and_validate_instruction( runtime::instruction{ id, {}, payload }, {}, {
      checks::success(),
      checks::compute_units( 7 ),
      checks::return_data( payload )
   } );

   BOOST_CHECK_EQUAL( entry->invocation_count(), 1 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( concurrent_processing_test )
{ try {
   harness h;
   auto id = add_bytecode( h, echo_program() );

   const std::size_t num_threads = 8;
   const std::size_t iterations = 25;
   std::atomic< std::size_t > failures{ 0 };
   std::vector< std::thread > threads;

   for ( std::size_t t = 0; t < num_threads; t++ )
   {
      threads.emplace_back( [&, t]()
      {
         std::vector< uint8_t > payload = { uint8_t( t ), uint8_t( t + 1 ) };
         for ( std::size_t i = 0; i < iterations; i++ )
         {
            auto result = h.process_instruction( runtime::instruction{ id, {}, payload }, {} );
            if ( !is_success( result.program_result ) || result.return_data != payload )
               failures++;
         }
      } );
   }

   for ( auto& th : threads )
      th.join();

   BOOST_CHECK_EQUAL( failures.load(), 0 );
   BOOST_CHECK_EQUAL( h.programs().find( id )->invocation_count(), num_threads * iterations );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
