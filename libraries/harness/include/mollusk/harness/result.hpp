#pragma once

#include <mollusk/runtime/errors.hpp>
#include <mollusk/runtime/types.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace mollusk {

using runtime::account;
using runtime::instruction_error;
using runtime::keyed_account;
using runtime::program_error;
using runtime::pubkey;

struct program_success
{
   bool operator==( const program_success& ) const { return true; }
};

// The program returned an error it is allowed to return
struct program_failure
{
   program_error error;

   bool operator==( const program_failure& o ) const { return error == o.error; }
};

// The runtime failed the instruction with an error a program cannot return
struct program_unknown_error
{
   instruction_error            error = instruction_error::generic_error;
   std::optional< std::string > vm_error;

   bool operator==( const program_unknown_error& o ) const { return error == o.error; }
};

using program_result = std::variant< program_success, program_failure, program_unknown_error >;

bool is_success( const program_result& r );
std::string to_string( const program_result& r );
std::ostream& operator<<( std::ostream& os, const program_result& r );

/**
 * The outcome of processing one instruction.
 *
 * resulting_accounts holds the post-execution copy of every account passed
 * in, in the order they were passed.
 */
struct instruction_result
{
   uint64_t                     compute_units_consumed = 0;
   uint64_t                     execution_time         = 0;
   mollusk::program_result      program_result         = program_success{};
   std::vector< uint8_t >       return_data;
   std::vector< keyed_account > resulting_accounts;

   /**
    * Returns the resulting account for key, or nullptr when it was not passed
    * to the instruction.
    */
   const account* get_account( const pubkey& key ) const;
};

} // mollusk
