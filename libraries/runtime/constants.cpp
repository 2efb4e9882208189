#include <mollusk/runtime/constants.hpp>

namespace mollusk::runtime::program_id {

const pubkey& system_program()
{
   static const pubkey id = pubkey::from_string( "11111111111111111111111111111111" );
   return id;
}

const pubkey& bpf_loader()
{
   static const pubkey id = pubkey::from_string( "BPFLoader2111111111111111111111111111111111" );
   return id;
}

const pubkey& bpf_loader_upgradeable()
{
   static const pubkey id = pubkey::from_string( "BPFLoaderUpgradeab1e11111111111111111111111" );
   return id;
}

const pubkey& native_loader()
{
   static const pubkey id = pubkey::from_string( "NativeLoader1111111111111111111111111111111" );
   return id;
}

} // mollusk::runtime::program_id
