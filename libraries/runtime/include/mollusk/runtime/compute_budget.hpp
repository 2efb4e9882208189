#pragma once

#include <cstdint>

namespace mollusk::runtime {

struct compute_budget
{
   // Units available to the whole instruction, including nested invocations
   uint64_t compute_unit_limit          = 200000;
   // Depth of the instruction stack, the top level instruction included
   uint64_t max_instruction_stack_depth = 5;
   uint64_t max_instruction_trace_length = 64;
   uint64_t invoke_units                = 1000;
   uint64_t syscall_base_cost           = 100;
   // Limits handed to the VM for bytecode programs
   uint32_t max_call_depth              = 64;
   uint32_t max_memory_pages            = 16;
};

struct fee_structure
{
   uint64_t lamports_per_signature = 5000;
};

} // mollusk::runtime
