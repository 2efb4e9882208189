#include <mollusk/harness/program.hpp>

#include <mollusk/runtime/address.hpp>
#include <mollusk/runtime/builtins.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/sysvars.hpp>

#include <mollusk/util/binary.hpp>

namespace mollusk::program {

namespace {

account make_account( std::vector< uint8_t > data, const pubkey& owner, bool executable )
{
   account a;
   a.lamports   = runtime::rent().minimum_balance( data.size() );
   a.data       = std::move( data );
   a.owner      = owner;
   a.executable = executable;
   return a;
}

} // anonymous

keyed_account create_keyed_account_for_builtin_program( const pubkey& program_id, const std::string& name )
{
   std::vector< uint8_t > data( name.begin(), name.end() );
   return { program_id, make_account( std::move( data ), runtime::program_id::native_loader(), true ) };
}

keyed_account system_program()
{
   return create_keyed_account_for_builtin_program( runtime::program_id::system_program(), runtime::builtin_name::system_program );
}

keyed_account bpf_loader_program()
{
   return create_keyed_account_for_builtin_program( runtime::program_id::bpf_loader(), runtime::builtin_name::bpf_loader );
}

keyed_account bpf_loader_upgradeable_program()
{
   return create_keyed_account_for_builtin_program( runtime::program_id::bpf_loader_upgradeable(), runtime::builtin_name::bpf_loader_upgradeable );
}

pubkey program_data_address( const pubkey& program_id )
{
   runtime::seed_list seeds{ std::vector< uint8_t >( program_id.bytes().begin(), program_id.bytes().end() ) };
   return runtime::find_program_address( seeds, runtime::program_id::bpf_loader_upgradeable() ).first;
}

account program_account( const pubkey& program_id )
{
   util::binary_writer w;
   w.write( loader_state::program )
    .write( program_data_address( program_id ).bytes() );

   return make_account( std::move( w ).data(), runtime::program_id::bpf_loader_upgradeable(), true );
}

account program_data_account( const std::vector< uint8_t >& bytecode )
{
   // slot 0 and no upgrade authority
   util::binary_writer w;
   w.write( loader_state::program_data )
    .write( uint64_t( 0 ) )
    .write( uint8_t( 0 ) );

   std::vector< uint8_t > data = std::move( w ).data();
   data.resize( runtime::constants::program_data_metadata_size, 0 );
   data.insert( data.end(), bytecode.begin(), bytecode.end() );

   return make_account( std::move( data ), runtime::program_id::bpf_loader_upgradeable(), false );
}

account program_account_loader_2( const std::vector< uint8_t >& bytecode )
{
   return make_account( bytecode, runtime::program_id::bpf_loader(), true );
}

std::pair< account, account > program_accounts( const pubkey& program_id, const std::vector< uint8_t >& bytecode )
{
   return { program_account( program_id ), program_data_account( bytecode ) };
}

} // mollusk::program
