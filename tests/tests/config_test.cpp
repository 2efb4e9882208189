#include <boost/test/unit_test.hpp>

#include "../test_fixtures/harness_fixture.hpp"

#include <mollusk/harness/config.hpp>
#include <mollusk/harness/exceptions.hpp>

#include <mollusk/runtime/compute_meter.hpp>

#include <mollusk/vm_manager/exceptions.hpp>

#include <filesystem>
#include <fstream>

using namespace mollusk;
using runtime::pubkey;

BOOST_FIXTURE_TEST_SUITE( config_tests, harness_fixture )

BOOST_AUTO_TEST_CASE( default_config_test )
{ try {
   auto cfg = parse_config( "" );
   harness_config defaults;

   BOOST_CHECK_EQUAL( cfg.log_level, LOG_LEVEL_DEFAULT );
   BOOST_CHECK( !cfg.log_dir );
   BOOST_CHECK_EQUAL( cfg.log_color, LOG_COLOR_DEFAULT );
   BOOST_CHECK_EQUAL( cfg.compute_budget.compute_unit_limit, defaults.compute_budget.compute_unit_limit );
   BOOST_CHECK_EQUAL( cfg.fee_structure.lamports_per_signature, defaults.fee_structure.lamports_per_signature );
   BOOST_CHECK( cfg.feature_set.active() == runtime::feature_set::all_enabled().active() );
   BOOST_CHECK( !cfg.slot );
   BOOST_CHECK( cfg.program_paths.empty() );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( parse_config_test )
{ try {
   auto cfg = parse_config(
      "log-level: debug\n"
      "log-color: false\n"
      "compute-unit-limit: 1400000\n"
      "max-instruction-stack-depth: 8\n"
      "max-instruction-trace-length: 128\n"
      "lamports-per-signature: 10000\n"
      "slot: 4242\n"
      "features:\n"
      "  - return_data_syscalls\n"
      "program-path:\n"
      "  - target/wasm\n"
      "  - /opt/programs\n" );

   BOOST_CHECK_EQUAL( cfg.log_level, "debug" );
   BOOST_CHECK( !cfg.log_color );
   BOOST_CHECK_EQUAL( cfg.compute_budget.compute_unit_limit, 1400000 );
   BOOST_CHECK_EQUAL( cfg.compute_budget.max_instruction_stack_depth, 8 );
   BOOST_CHECK_EQUAL( cfg.compute_budget.max_instruction_trace_length, 128 );
   BOOST_CHECK_EQUAL( cfg.fee_structure.lamports_per_signature, 10000 );
   BOOST_REQUIRE( cfg.slot );
   BOOST_CHECK_EQUAL( *cfg.slot, 4242 );

   BOOST_CHECK( cfg.feature_set.is_active( runtime::feature::return_data_syscalls ) );
   BOOST_CHECK( !cfg.feature_set.is_active( runtime::feature::clock_sysvar_syscall ) );
   BOOST_CHECK( !cfg.feature_set.is_active( runtime::feature::cross_program_invocation ) );

   BOOST_REQUIRE_EQUAL( cfg.program_paths.size(), 2 );
   BOOST_CHECK( cfg.program_paths[0] == std::filesystem::path( "target/wasm" ) );
   BOOST_CHECK( cfg.program_paths[1] == std::filesystem::path( "/opt/programs" ) );

   BOOST_TEST_MESSAGE( "An empty feature list disables every feature" );
   auto none = parse_config( "features: []\n" );
   BOOST_CHECK( none.feature_set.active().empty() );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( invalid_config_test )
{ try {
   BOOST_CHECK_THROW( parse_config( "features:\n  - warp_drive\n" ), config_exception );
   BOOST_CHECK_THROW( parse_config( "compute-unit-limit: plenty\n" ), config_exception );
   BOOST_CHECK_THROW( parse_config( "slot: [1, 2\n" ), config_exception );
   BOOST_CHECK_THROW( parse_config( "- just\n- a list\n" ), config_exception );
   BOOST_CHECK_THROW( load_config( std::filesystem::temp_directory_path() / "mollusk_no_such_config.yml" ), config_exception );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( load_config_test )
{ try {
   auto path = std::filesystem::temp_directory_path() / ( "mollusk_config_" + pubkey::new_unique().to_string() + ".yml" );

   {
      std::ofstream ofs( path );
      ofs << "compute-unit-limit: 300\n"
          << "slot: 1000\n";
   }

   auto cfg = load_config( path );
   std::filesystem::remove( path );

   BOOST_CHECK_EQUAL( cfg.compute_budget.compute_unit_limit, 300 );
   BOOST_REQUIRE( cfg.slot );
   BOOST_CHECK_EQUAL( *cfg.slot, 1000 );

   BOOST_TEST_MESSAGE( "A harness built from the config uses its settings" );
   harness h( cfg );

   BOOST_CHECK_EQUAL( h.compute_budget().compute_unit_limit, 300 );
   BOOST_CHECK_EQUAL( h.sysvars().clock.slot, 1000 );
   BOOST_CHECK( h.program_id() == runtime::program_id::system_program() );

   auto from = pubkey::new_unique();
   auto to = pubkey::new_unique();
   h.process_and_validate_instruction( runtime::system_instruction::transfer( from, to, 5 ),
      { { from, system_account( 10 ) }, { to, system_account( 0 ) } }, {
      checks::success(),
      checks::compute_units( runtime::compute_cost::system_program )
   } );

   BOOST_TEST_MESSAGE( "Features from the config gate system calls" );
   harness restricted( parse_config( "features: []\n" ) );
   mollusk::tests::module_builder m;
   m.import_system_call( "sys_set_return_data" );
   BOOST_CHECK_THROW( add_bytecode( restricted, m.build( mollusk::tests::code() ) ), vm_manager::unresolved_import_exception );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
