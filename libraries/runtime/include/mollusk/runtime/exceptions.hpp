#pragma once

#include <mollusk/exception.hpp>
#include <mollusk/runtime/errors.hpp>

namespace mollusk::runtime {

// Root of exception hierarchy for the runtime library
MOLLUSK_DECLARE_EXCEPTION_WITH_CODE( runtime_exception, mollusk::unknown_error_code );

MOLLUSK_DECLARE_DERIVED_EXCEPTION( unknown_feature_exception, runtime_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( duplicate_builtin_exception, runtime_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( unknown_system_call_exception, runtime_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( internal_error_exception, runtime_exception );

/*
 * Instruction exceptions end the current instruction. The exception code is
 * the instruction_error. Custom program errors carry their value under the
 * "custom_code" key of the exception json and VM faults carry their message
 * under "vm_error".
 */
MOLLUSK_DECLARE_DERIVED_EXCEPTION_WITH_CODE( instruction_exception, runtime_exception, instruction_error::generic_error );

#define MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( exc_name, error ) \
   MOLLUSK_DECLARE_DERIVED_EXCEPTION_WITH_CODE( exc_name, instruction_exception, instruction_error::error )

MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( invalid_argument_exception, invalid_argument );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( invalid_instruction_data_exception, invalid_instruction_data );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( invalid_account_data_exception, invalid_account_data );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( incorrect_program_id_exception, incorrect_program_id );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( missing_required_signature_exception, missing_required_signature );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( unbalanced_instruction_exception, unbalanced_instruction );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( modified_program_id_exception, modified_program_id );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( external_account_lamport_spend_exception, external_account_lamport_spend );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( external_account_data_modified_exception, external_account_data_modified );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( readonly_lamport_change_exception, readonly_lamport_change );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( readonly_data_modified_exception, readonly_data_modified );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( not_enough_account_keys_exception, not_enough_account_keys );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( account_data_size_changed_exception, account_data_size_changed );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( account_not_executable_exception, account_not_executable );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( custom_program_exception, custom );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( executable_data_modified_exception, executable_data_modified );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( executable_lamport_change_exception, executable_lamport_change );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( unsupported_program_id_exception, unsupported_program_id );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( call_depth_exception, call_depth );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( missing_account_exception, missing_account );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( reentrancy_not_allowed_exception, reentrancy_not_allowed );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( max_seed_length_exceeded_exception, max_seed_length_exceeded );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( invalid_seeds_exception, invalid_seeds );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( invalid_realloc_exception, invalid_realloc );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( computational_budget_exceeded_exception, computational_budget_exceeded );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( privilege_escalation_exception, privilege_escalation );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( program_failed_to_complete_exception, program_failed_to_complete );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( arithmetic_overflow_exception, arithmetic_overflow );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( max_instruction_trace_length_exceeded_exception, max_instruction_trace_length_exceeded );
MOLLUSK_DECLARE_INSTRUCTION_EXCEPTION( max_accounts_exceeded_exception, max_accounts_exceeded );

// A system call was made with arguments the host cannot honor
MOLLUSK_DECLARE_DERIVED_EXCEPTION( syscall_argument_exception, program_failed_to_complete_exception );

// Unwinds a program from sys_exit. The exception code is the exit code.
MOLLUSK_DECLARE_DERIVED_EXCEPTION_WITH_CODE( program_exit_exception, runtime_exception, 0 );

/**
 * Extract the instruction error and custom code from an instruction exception.
 */
instruction_error error_of( const instruction_exception& e );
uint32_t custom_code_of( const instruction_exception& e );

} // mollusk::runtime
