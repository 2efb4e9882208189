#include <mollusk/runtime/address.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/system_call_dispatcher.hpp>

#include <mollusk/util/binary.hpp>

#include <algorithm>
#include <cstring>

namespace mollusk::runtime {

namespace {

util::binary_reader make_reader( const char* arg_ptr, uint32_t arg_len )
{
   return util::binary_reader( reinterpret_cast< const uint8_t* >( arg_ptr ), arg_len );
}

void require_return_buffer( uint32_t ret_len, std::size_t needed, const char* name )
{
   MOLLUSK_ASSERT( ret_len >= needed, syscall_argument_exception,
      "${name} requires a return buffer of ${n} bytes, got ${l}", ("name", name)("n", needed)("l", ret_len) );
}

// Copies as much of src as fits and returns the full length of src
int32_t copy_out( const std::vector< uint8_t >& src, char* ret_ptr, uint32_t ret_len )
{
   std::size_t n = std::min< std::size_t >( src.size(), ret_len );
   if ( n )
      std::memcpy( ret_ptr, src.data(), n );
   return int32_t( src.size() );
}

uint16_t read_account_index( util::binary_reader& r, const instruction_context& ictx )
{
   auto index = r.read< uint32_t >();
   MOLLUSK_ASSERT( index < ictx.number_of_instruction_accounts(), not_enough_account_keys_exception,
      "instruction account index ${i} out of range", ("i", index) );
   return uint16_t( index );
}

int32_t sys_log( invoke_context& ctx, char*, uint32_t, const char* arg_ptr, uint32_t arg_len )
{
   ctx.log( std::string( arg_ptr, arg_len ) );
   return 0;
}

int32_t sys_exit( invoke_context&, char*, uint32_t, const char* arg_ptr, uint32_t arg_len )
{
   auto r = make_reader( arg_ptr, arg_len );
   auto code = r.read< uint32_t >();
   BOOST_THROW_EXCEPTION( program_exit_exception( "program exited", int64_t( code ) ) );
}

int32_t sys_get_instruction_data( invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char*, uint32_t )
{
   return copy_out( ctx.current_instruction().data(), ret_ptr, ret_len );
}

int32_t sys_get_account_key( invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len )
{
   const auto& ictx = ctx.current_instruction();
   auto r = make_reader( arg_ptr, arg_len );
   auto index = read_account_index( r, ictx );

   require_return_buffer( ret_len, pubkey::size, "sys_get_account_key" );
   const auto& key = ictx.key_of_instruction_account( ctx.transaction(), index );
   std::memcpy( ret_ptr, key.data(), pubkey::size );
   return 0;
}

int32_t sys_get_account_lamports( invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len )
{
   const auto& ictx = ctx.current_instruction();
   auto r = make_reader( arg_ptr, arg_len );
   auto index = read_account_index( r, ictx );

   require_return_buffer( ret_len, sizeof( uint64_t ), "sys_get_account_lamports" );
   auto account = ictx.borrow_instruction_account( ctx.transaction(), index );

   util::binary_writer w;
   w.write( account.lamports() );
   std::memcpy( ret_ptr, w.data().data(), sizeof( uint64_t ) );
   return 0;
}

int32_t sys_set_account_lamports( invoke_context& ctx, char*, uint32_t, const char* arg_ptr, uint32_t arg_len )
{
   const auto& ictx = ctx.current_instruction();
   auto r = make_reader( arg_ptr, arg_len );
   auto index = read_account_index( r, ictx );
   auto lamports = r.read< uint64_t >();

   auto account = ictx.borrow_instruction_account( ctx.transaction(), index );
   account.set_lamports( lamports );
   return 0;
}

int32_t sys_get_account_data( invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len )
{
   const auto& ictx = ctx.current_instruction();
   auto r = make_reader( arg_ptr, arg_len );
   auto index = read_account_index( r, ictx );

   auto account = ictx.borrow_instruction_account( ctx.transaction(), index );
   return copy_out( account.data(), ret_ptr, ret_len );
}

int32_t sys_set_account_data( invoke_context& ctx, char*, uint32_t, const char* arg_ptr, uint32_t arg_len )
{
   const auto& ictx = ctx.current_instruction();
   auto r = make_reader( arg_ptr, arg_len );
   auto index = read_account_index( r, ictx );
   auto data = r.read_bytes( r.remaining() );

   auto account = ictx.borrow_instruction_account( ctx.transaction(), index );
   account.set_data( data );
   return 0;
}

int32_t sys_set_return_data( invoke_context& ctx, char*, uint32_t, const char* arg_ptr, uint32_t arg_len )
{
   MOLLUSK_ASSERT( arg_len <= constants::max_return_data, syscall_argument_exception,
      "return data of ${l} bytes exceeds the maximum of ${m}", ("l", arg_len)("m", constants::max_return_data) );

   std::vector< uint8_t > data( arg_ptr, arg_ptr + arg_len );
   ctx.transaction().set_return_data( ctx.current_program_id(), std::move( data ) );
   return 0;
}

// Writes the setting program id followed by as much of the data as fits
int32_t sys_get_return_data( invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char*, uint32_t )
{
   require_return_buffer( ret_len, pubkey::size, "sys_get_return_data" );

   const auto& rd = ctx.transaction().get_return_data();
   std::memcpy( ret_ptr, rd.program_id.data(), pubkey::size );
   return copy_out( rd.data, ret_ptr + pubkey::size, ret_len - uint32_t( pubkey::size ) );
}

int32_t sys_get_clock( invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char*, uint32_t )
{
   require_return_buffer( ret_len, constants::clock_size, "sys_get_clock" );

   const auto& c = ctx.environment().sysvars.clock;
   util::binary_writer w;
   w.write( c.slot )
    .write( c.epoch_start_timestamp )
    .write( c.epoch )
    .write( c.leader_schedule_epoch )
    .write( c.unix_timestamp );

   std::memcpy( ret_ptr, w.data().data(), constants::clock_size );
   return 0;
}

/*
 * Arguments: program id, u32 account count, per account (pubkey, u8 is_signer,
 * u8 is_writable), u32 data length, data, u32 signer seed set count, per set
 * (u32 seed count, per seed (u32 length, bytes)).
 */
int32_t sys_invoke( invoke_context& ctx, char*, uint32_t, const char* arg_ptr, uint32_t arg_len )
{
   auto r = make_reader( arg_ptr, arg_len );

   instruction ix;
   ix.program_id = pubkey( r.read_array< pubkey::size >() );

   auto num_accounts = r.read< uint32_t >();
   for ( uint32_t i = 0; i < num_accounts; i++ )
   {
      account_meta meta;
      meta.key         = pubkey( r.read_array< pubkey::size >() );
      meta.is_signer   = r.read< uint8_t >() != 0;
      meta.is_writable = r.read< uint8_t >() != 0;
      ix.accounts.push_back( meta );
   }

   auto data_len = r.read< uint32_t >();
   ix.data = r.read_bytes( data_len );

   const pubkey caller_id = ctx.current_program_id();
   std::vector< pubkey > signers;

   auto num_seed_sets = r.read< uint32_t >();
   for ( uint32_t i = 0; i < num_seed_sets; i++ )
   {
      seed_list seeds;
      auto num_seeds = r.read< uint32_t >();
      for ( uint32_t j = 0; j < num_seeds; j++ )
      {
         auto seed_len = r.read< uint32_t >();
         seeds.push_back( r.read_bytes( seed_len ) );
      }

      signers.push_back( create_program_address( seeds, caller_id ) );
   }

   ctx.consume( ctx.environment().compute_budget.invoke_units );
   ctx.native_invoke( ix, signers );
   return 0;
}

} // anonymous

system_call_dispatcher::system_call_dispatcher()
{
   register_system_call( system_call_id::log, sys_log );
   register_system_call( system_call_id::exit, sys_exit );
   register_system_call( system_call_id::get_instruction_data, sys_get_instruction_data );
   register_system_call( system_call_id::get_account_key, sys_get_account_key );
   register_system_call( system_call_id::get_account_lamports, sys_get_account_lamports );
   register_system_call( system_call_id::set_account_lamports, sys_set_account_lamports );
   register_system_call( system_call_id::get_account_data, sys_get_account_data );
   register_system_call( system_call_id::set_account_data, sys_set_account_data );
   register_system_call( system_call_id::set_return_data, sys_set_return_data );
   register_system_call( system_call_id::get_return_data, sys_get_return_data );
   register_system_call( system_call_id::get_clock, sys_get_clock );
   register_system_call( system_call_id::invoke, sys_invoke );
}

const system_call_dispatcher& system_call_dispatcher::instance()
{
   static const system_call_dispatcher scd;
   return scd;
}

void system_call_dispatcher::register_system_call( system_call_id id, handler h )
{
   _dispatch_map.emplace( uint32_t( id ), std::move( h ) );
}

int32_t system_call_dispatcher::call( uint32_t id, invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len ) const
{
   auto it = _dispatch_map.find( id );
   MOLLUSK_ASSERT( it != _dispatch_map.end(), unknown_system_call_exception, "system call ${id} not found", ("id", id) );
   return it->second( ctx, ret_ptr, ret_len, arg_ptr, arg_len );
}

bool system_call_dispatcher::exists( uint32_t id ) const
{
   return _dispatch_map.count( id );
}

} // mollusk::runtime
