#include <mollusk/runtime/builtins.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/loader.hpp>
#include <mollusk/runtime/system_program.hpp>

namespace mollusk::runtime {

const std::vector< builtin >& default_builtins()
{
   static const std::vector< builtin > builtins = {
      { program_id::system_program(),         builtin_name::system_program,         &system_program::process_instruction },
      { program_id::bpf_loader(),             builtin_name::bpf_loader,             &loader::process_instruction },
      { program_id::bpf_loader_upgradeable(), builtin_name::bpf_loader_upgradeable, &loader::process_instruction }
   };

   return builtins;
}

} // mollusk::runtime
