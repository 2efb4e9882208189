#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace mollusk::runtime {

/**
 * Reasons an instruction can fail. The numbering follows the order errors are
 * reported on the wire and must not be rearranged.
 */
enum class instruction_error : uint32_t
{
   generic_error,
   invalid_argument,
   invalid_instruction_data,
   invalid_account_data,
   account_data_too_small,
   insufficient_funds,
   incorrect_program_id,
   missing_required_signature,
   account_already_initialized,
   uninitialized_account,
   unbalanced_instruction,
   modified_program_id,
   external_account_lamport_spend,
   external_account_data_modified,
   readonly_lamport_change,
   readonly_data_modified,
   duplicate_account_index,
   executable_modified,
   rent_epoch_modified,
   not_enough_account_keys,
   account_data_size_changed,
   account_not_executable,
   account_borrow_failed,
   account_borrow_outstanding,
   duplicate_account_out_of_sync,
   custom,
   invalid_error,
   executable_data_modified,
   executable_lamport_change,
   executable_account_not_rent_exempt,
   unsupported_program_id,
   call_depth,
   missing_account,
   reentrancy_not_allowed,
   max_seed_length_exceeded,
   invalid_seeds,
   invalid_realloc,
   computational_budget_exceeded,
   privilege_escalation,
   program_environment_setup_failure,
   program_failed_to_complete,
   program_failed_to_compile,
   immutable,
   incorrect_authority,
   borsh_io_error,
   account_not_rent_exempt,
   invalid_account_owner,
   arithmetic_overflow,
   unsupported_sysvar,
   illegal_owner,
   max_accounts_data_allocations_exceeded,
   max_accounts_exceeded,
   max_instruction_trace_length_exceeded,
   builtin_programs_must_consume_compute_units
};

std::string to_string( instruction_error e );
std::ostream& operator<<( std::ostream& os, instruction_error e );

/**
 * The subset of instruction errors a program itself can return.
 *
 * custom_code is only meaningful when kind is instruction_error::custom.
 */
struct program_error
{
   instruction_error kind        = instruction_error::custom;
   uint32_t          custom_code = 0;

   static program_error custom( uint32_t code ) { return program_error{ instruction_error::custom, code }; }

   bool operator==( const program_error& o ) const
   {
      return kind == o.kind && ( kind != instruction_error::custom || custom_code == o.custom_code );
   }

   bool operator!=( const program_error& o ) const { return !( *this == o ); }
};

std::string to_string( const program_error& e );
std::ostream& operator<<( std::ostream& os, const program_error& e );

/**
 * Returns the program error equivalent of an instruction error, or nothing
 * when the error can only be raised by the runtime.
 */
std::optional< program_error > to_program_error( instruction_error e, uint32_t custom_code = 0 );

} // mollusk::runtime
