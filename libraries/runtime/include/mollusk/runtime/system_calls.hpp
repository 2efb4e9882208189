#pragma once

#include <mollusk/runtime/compute_budget.hpp>
#include <mollusk/runtime/feature_set.hpp>

#include <mollusk/vm_manager/vm_backend.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mollusk::runtime {

enum class system_call_id : uint32_t
{
   log = 1,
   exit,
   get_instruction_data,
   get_account_key,
   get_account_lamports,
   set_account_lamports,
   get_account_data,
   set_account_data,
   set_return_data,
   get_return_data,
   get_clock,
   invoke
};

struct system_call_descriptor
{
   std::string    name;
   system_call_id id;
   // Feature gating the import, empty when always available
   std::string    feature;
};

const std::vector< system_call_descriptor >& system_call_table();

/**
 * The VM environment bytecode is verified and run under. Only system calls
 * whose feature is active are importable.
 */
vm_manager::runtime_environment make_runtime_environment( const compute_budget& budget, const feature_set& features );

namespace constants {

constexpr std::size_t max_return_data = 1024;
constexpr std::size_t clock_size      = 40;

} // constants

} // mollusk::runtime
