#include <boost/test/unit_test.hpp>

#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/transaction_context.hpp>

#include <limits>

using namespace mollusk;
using namespace mollusk::runtime;

struct transaction_context_fixture
{
   transaction_context_fixture() :
      program_key( pubkey::new_unique() ),
      owned_key( pubkey::new_unique() ),
      foreign_key( pubkey::new_unique() ),
      readonly_key( pubkey::new_unique() )
   {}

   transaction_context make_context( uint64_t max_depth = 5, uint64_t max_trace = 64 )
   {
      account program( 1, 0, program_id::bpf_loader_upgradeable() );
      program.executable = true;

      std::vector< keyed_account > accounts = {
         { program_key, program },
         { owned_key, account( 100, 4, program_key ) },
         { foreign_key, account( 100, 4, program_id::system_program() ) },
         { readonly_key, account( 100, 4, program_key ) }
      };

      return transaction_context( std::move( accounts ), rent(), max_depth, max_trace );
   }

   instruction_context make_instruction()
   {
      std::vector< instruction_account > ias;
      for ( uint16_t i = 0; i < 3; i++ )
      {
         instruction_account ia;
         ia.index_in_transaction = i + 1;
         ia.index_in_caller      = i;
         ia.index_in_callee      = i;
         ia.is_writable          = i < 2;
         ias.push_back( ia );
      }

      return instruction_context( { 0 }, ias, {} );
   }

   pubkey program_key;
   pubkey owned_key;
   pubkey foreign_key;
   pubkey readonly_key;
};

BOOST_FIXTURE_TEST_SUITE( transaction_context_tests, transaction_context_fixture )

BOOST_AUTO_TEST_CASE( lamport_rules_test )
{ try {
   auto tc = make_context();
   tc.push( make_instruction() );
   const auto& ictx = tc.current_instruction_context();

   BOOST_TEST_MESSAGE( "The owner may debit and anyone may credit a writable account" );
   auto owned = ictx.borrow_instruction_account( tc, 0 );
   owned.set_lamports( 50 );
   BOOST_CHECK_EQUAL( owned.lamports(), 50 );

   auto foreign = ictx.borrow_instruction_account( tc, 1 );
   foreign.set_lamports( 150 );
   BOOST_CHECK_EQUAL( foreign.lamports(), 150 );

   BOOST_TEST_MESSAGE( "Debiting an account owned by another program fails" );
   BOOST_CHECK_THROW( foreign.set_lamports( 10 ), external_account_lamport_spend_exception );

   BOOST_TEST_MESSAGE( "Read-only accounts cannot change" );
   auto readonly = ictx.borrow_instruction_account( tc, 2 );
   BOOST_CHECK_THROW( readonly.set_lamports( 101 ), readonly_lamport_change_exception );
   BOOST_CHECK_THROW( readonly.set_data( { 1, 2, 3, 4 } ), readonly_data_modified_exception );

   BOOST_TEST_MESSAGE( "Arithmetic is checked" );
   BOOST_CHECK_THROW( owned.checked_sub_lamports( 51 ), arithmetic_overflow_exception );
   BOOST_CHECK_THROW( owned.checked_add_lamports( std::numeric_limits< uint64_t >::max() ), arithmetic_overflow_exception );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( data_rules_test )
{ try {
   auto tc = make_context();
   tc.push( make_instruction() );
   const auto& ictx = tc.current_instruction_context();

   auto owned = ictx.borrow_instruction_account( tc, 0 );
   owned.set_data( { 9, 9, 9, 9, 9, 9 } );
   BOOST_CHECK( owned.data() == std::vector< uint8_t >( 6, 9 ) );

   owned.set_data_length( 2 );
   BOOST_CHECK( owned.data() == std::vector< uint8_t >( 2, 9 ) );

   BOOST_CHECK_THROW( owned.set_data_length( std::size_t( constants::max_permitted_data_length ) + 1 ), invalid_realloc_exception );

   auto foreign = ictx.borrow_instruction_account( tc, 1 );
   BOOST_CHECK_THROW( foreign.set_data( { 1, 2, 3, 4 } ), external_account_data_modified_exception );
   BOOST_CHECK_THROW( foreign.set_data( { 1 } ), account_data_size_changed_exception );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( owner_rules_test )
{ try {
   auto tc = make_context();
   tc.push( make_instruction() );
   const auto& ictx = tc.current_instruction_context();

   auto foreign = ictx.borrow_instruction_account( tc, 1 );
   BOOST_CHECK_THROW( foreign.set_owner( program_key ), modified_program_id_exception );

   auto readonly = ictx.borrow_instruction_account( tc, 2 );
   BOOST_CHECK_THROW( readonly.set_owner( program_id::system_program() ), modified_program_id_exception );

   BOOST_TEST_MESSAGE( "Only accounts with zeroed data may be assigned" );
   auto owned = ictx.borrow_instruction_account( tc, 0 );
   owned.set_data( { 1, 0, 0, 0 } );
   BOOST_CHECK_THROW( owned.set_owner( program_id::system_program() ), modified_program_id_exception );

   owned.set_data( { 0, 0, 0, 0 } );
   owned.set_owner( program_id::system_program() );
   BOOST_CHECK( owned.owner() == program_id::system_program() );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( instruction_stack_test )
{ try {
   BOOST_TEST_MESSAGE( "The stack depth is limited" );
   auto tc = make_context( 2 );
   tc.push( make_instruction() );
   tc.push( make_instruction() );
   BOOST_CHECK_EQUAL( tc.instruction_stack_height(), 2 );
   BOOST_CHECK_EQUAL( tc.current_instruction_context().nesting_level(), 1 );
   BOOST_CHECK_THROW( tc.push( make_instruction() ), call_depth_exception );

   tc.pop();
   tc.pop();
   BOOST_CHECK_EQUAL( tc.instruction_stack_height(), 0 );

   BOOST_TEST_MESSAGE( "The trace length is limited" );
   auto traced = make_context( 5, 2 );
   traced.push( make_instruction() );
   traced.pop();
   traced.push( make_instruction() );
   traced.pop();
   BOOST_CHECK_EQUAL( traced.instruction_trace_length(), 2 );
   BOOST_CHECK_THROW( traced.push( make_instruction() ), max_instruction_trace_length_exceeded_exception );

   BOOST_TEST_MESSAGE( "Lamports created or destroyed by an instruction are detected on pop" );
   auto unbalanced = make_context();
   unbalanced.push( make_instruction() );
   unbalanced.current_instruction_context().borrow_instruction_account( unbalanced, 0 ).set_lamports( 99 );
   BOOST_CHECK_THROW( unbalanced.pop(), unbalanced_instruction_exception );
   BOOST_CHECK_EQUAL( unbalanced.instruction_stack_height(), 0 );

   BOOST_TEST_MESSAGE( "Accounts are released in index order" );
   auto accounts = std::move( unbalanced ).deconstruct();
   BOOST_REQUIRE_EQUAL( accounts.size(), 4 );
   BOOST_CHECK( accounts[0].first == program_key );
   BOOST_CHECK( accounts[1].first == owned_key );
   BOOST_CHECK_EQUAL( accounts[1].second.lamports, 99 );
} MOLLUSK_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
