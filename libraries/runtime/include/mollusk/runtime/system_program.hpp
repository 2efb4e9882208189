#pragma once

#include <mollusk/runtime/types.hpp>

#include <cstdint>

namespace mollusk::runtime {

class invoke_context;

namespace system_program {

enum class instruction_tag : uint32_t
{
   create_account = 0,
   assign         = 1,
   transfer       = 2,
   allocate       = 8
};

// Custom error codes
enum class system_error : uint32_t
{
   account_already_in_use        = 0,
   result_with_negative_lamports = 1,
   invalid_program_id            = 2,
   invalid_account_data_length   = 3
};

void process_instruction( invoke_context& ctx );

} // system_program

namespace system_instruction {

instruction create_account( const pubkey& from, const pubkey& to, uint64_t lamports, uint64_t space, const pubkey& owner );
instruction assign( const pubkey& account, const pubkey& owner );
instruction transfer( const pubkey& from, const pubkey& to, uint64_t lamports );
instruction allocate( const pubkey& account, uint64_t space );

} // system_instruction

} // mollusk::runtime
