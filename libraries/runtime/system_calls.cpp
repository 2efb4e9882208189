#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/system_calls.hpp>

namespace mollusk::runtime {

const std::vector< system_call_descriptor >& system_call_table()
{
   static const std::vector< system_call_descriptor > table = {
      { "sys_log",                  system_call_id::log,                  "" },
      { "sys_exit",                 system_call_id::exit,                 "" },
      { "sys_get_instruction_data", system_call_id::get_instruction_data, "" },
      { "sys_get_account_key",      system_call_id::get_account_key,      "" },
      { "sys_get_account_lamports", system_call_id::get_account_lamports, "" },
      { "sys_set_account_lamports", system_call_id::set_account_lamports, "" },
      { "sys_get_account_data",     system_call_id::get_account_data,     "" },
      { "sys_set_account_data",     system_call_id::set_account_data,     "" },
      { "sys_set_return_data",      system_call_id::set_return_data,      feature::return_data_syscalls },
      { "sys_get_return_data",      system_call_id::get_return_data,      feature::return_data_syscalls },
      { "sys_get_clock",            system_call_id::get_clock,            feature::clock_sysvar_syscall },
      { "sys_invoke",               system_call_id::invoke,               feature::cross_program_invocation }
   };

   return table;
}

vm_manager::runtime_environment make_runtime_environment( const compute_budget& budget, const feature_set& features )
{
   vm_manager::runtime_environment env;
   env.max_call_depth    = budget.max_call_depth;
   env.max_memory_pages  = budget.max_memory_pages;
   env.max_bytecode_size = constants::max_permitted_data_length;

   for ( const auto& sc : system_call_table() )
   {
      if ( sc.feature.empty() || features.is_active( sc.feature ) )
         env.system_calls.emplace( sc.name, uint32_t( sc.id ) );
   }

   return env;
}

} // mollusk::runtime
