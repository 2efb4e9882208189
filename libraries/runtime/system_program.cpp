#include <mollusk/runtime/compute_meter.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/invoke_context.hpp>
#include <mollusk/runtime/system_program.hpp>

#include <mollusk/util/binary.hpp>

#include <algorithm>

namespace mollusk::runtime {

namespace system_program {

namespace {

using signer_list = std::vector< pubkey >;

bool contains( const signer_list& signers, const pubkey& key )
{
   return std::find( signers.begin(), signers.end(), key ) != signers.end();
}

[[noreturn]] void throw_system_error( system_error err, const std::string& msg )
{
   MOLLUSK_THROW( custom_program_exception, "${msg}", ("msg", msg)("custom_code", uint32_t( err )) );
}

void allocate( borrowed_account& account, const pubkey& address, uint64_t space, const signer_list& signers )
{
   MOLLUSK_ASSERT( contains( signers, address ), missing_required_signature_exception,
      "Allocate: 'to' account ${a} must sign", ("a", address.to_string()) );

   if ( !account.data().empty() || account.owner() != program_id::system_program() )
      throw_system_error( system_error::account_already_in_use, "Allocate: account " + address.to_string() + " already in use" );

   if ( space > constants::max_permitted_data_length )
      throw_system_error( system_error::invalid_account_data_length,
         "Allocate: requested " + std::to_string( space ) + ", max allowed " + std::to_string( constants::max_permitted_data_length ) );

   account.set_data_length( std::size_t( space ) );
}

void assign( borrowed_account& account, const pubkey& address, const pubkey& owner, const signer_list& signers )
{
   // No-op when the owner does not change
   if ( account.owner() == owner )
      return;

   MOLLUSK_ASSERT( contains( signers, address ), missing_required_signature_exception,
      "Assign: account ${a} must sign", ("a", address.to_string()) );

   account.set_owner( owner );
}

void transfer_verified( invoke_context& ctx, uint16_t from_index, uint16_t to_index, uint64_t lamports )
{
   auto& tc = ctx.transaction();
   const auto& ictx = ctx.current_instruction();

   auto from = ictx.borrow_instruction_account( tc, from_index );
   MOLLUSK_ASSERT( from.data().empty(), invalid_argument_exception, "Transfer: `from` must not carry data" );

   if ( lamports > from.lamports() )
      throw_system_error( system_error::result_with_negative_lamports,
         "Transfer: insufficient lamports " + std::to_string( from.lamports() ) + ", need " + std::to_string( lamports ) );

   from.checked_sub_lamports( lamports );

   auto to = ictx.borrow_instruction_account( tc, to_index );
   to.checked_add_lamports( lamports );
}

void transfer( invoke_context& ctx, uint16_t from_index, uint16_t to_index, uint64_t lamports )
{
   const auto& ictx = ctx.current_instruction();

   MOLLUSK_ASSERT( ictx.is_instruction_account_signer( from_index ), missing_required_signature_exception,
      "Transfer: `from` account ${a} must sign", ("a", ictx.key_of_instruction_account( ctx.transaction(), from_index ).to_string()) );

   transfer_verified( ctx, from_index, to_index, lamports );
}

void create_account( invoke_context& ctx, uint64_t lamports, uint64_t space, const pubkey& owner, const signer_list& signers )
{
   auto& tc = ctx.transaction();
   const auto& ictx = ctx.current_instruction();
   const auto& to_address = ictx.key_of_instruction_account( tc, 1 );

   {
      auto to = ictx.borrow_instruction_account( tc, 1 );
      if ( to.lamports() > 0 )
         throw_system_error( system_error::account_already_in_use, "Create Account: account " + to_address.to_string() + " already in use" );

      allocate( to, to_address, space, signers );
      assign( to, to_address, owner, signers );
   }

   transfer( ctx, 0, 1, lamports );
}

} // anonymous

void process_instruction( invoke_context& ctx )
{
   ctx.consume( compute_cost::system_program );

   auto& tc = ctx.transaction();
   const auto& ictx = ctx.current_instruction();
   const auto signers = ictx.signers( tc );

   util::binary_reader reader( ictx.data() );
   uint32_t tag = 0;

   try
   {
      tag = reader.read< uint32_t >();

      switch ( instruction_tag( tag ) )
      {
         case instruction_tag::create_account:
         {
            auto lamports = reader.read< uint64_t >();
            auto space    = reader.read< uint64_t >();
            auto owner    = pubkey( reader.read_array< pubkey::size >() );

            ictx.check_number_of_instruction_accounts( 2 );
            create_account( ctx, lamports, space, owner, signers );
            break;
         }
         case instruction_tag::assign:
         {
            auto owner = pubkey( reader.read_array< pubkey::size >() );

            ictx.check_number_of_instruction_accounts( 1 );
            auto account = ictx.borrow_instruction_account( tc, 0 );
            assign( account, account.key(), owner, signers );
            break;
         }
         case instruction_tag::transfer:
         {
            auto lamports = reader.read< uint64_t >();

            ictx.check_number_of_instruction_accounts( 2 );
            transfer( ctx, 0, 1, lamports );
            break;
         }
         case instruction_tag::allocate:
         {
            auto space = reader.read< uint64_t >();

            ictx.check_number_of_instruction_accounts( 1 );
            auto account = ictx.borrow_instruction_account( tc, 0 );
            allocate( account, account.key(), space, signers );
            break;
         }
         default:
            MOLLUSK_THROW( invalid_instruction_data_exception, "unsupported system instruction ${t}", ("t", tag) );
      }
   }
   catch ( const util::binary_exception& e )
   {
      MOLLUSK_THROW( invalid_instruction_data_exception, "malformed system instruction: ${e}", ("e", e.get_message()) );
   }
}

} // system_program

namespace system_instruction {

instruction create_account( const pubkey& from, const pubkey& to, uint64_t lamports, uint64_t space, const pubkey& owner )
{
   util::binary_writer w;
   w.write( uint32_t( system_program::instruction_tag::create_account ) )
    .write( lamports )
    .write( space )
    .write( owner.bytes() );

   return instruction{
      program_id::system_program(),
      { account_meta::writable( from, true ), account_meta::writable( to, true ) },
      std::move( w ).data()
   };
}

instruction assign( const pubkey& account, const pubkey& owner )
{
   util::binary_writer w;
   w.write( uint32_t( system_program::instruction_tag::assign ) )
    .write( owner.bytes() );

   return instruction{
      program_id::system_program(),
      { account_meta::writable( account, true ) },
      std::move( w ).data()
   };
}

instruction transfer( const pubkey& from, const pubkey& to, uint64_t lamports )
{
   util::binary_writer w;
   w.write( uint32_t( system_program::instruction_tag::transfer ) )
    .write( lamports );

   return instruction{
      program_id::system_program(),
      { account_meta::writable( from, true ), account_meta::writable( to, false ) },
      std::move( w ).data()
   };
}

instruction allocate( const pubkey& account, uint64_t space )
{
   util::binary_writer w;
   w.write( uint32_t( system_program::instruction_tag::allocate ) )
    .write( space );

   return instruction{
      program_id::system_program(),
      { account_meta::writable( account, true ) },
      std::move( w ).data()
   };
}

} // system_instruction

} // mollusk::runtime
