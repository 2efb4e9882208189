#include <mollusk/runtime/errors.hpp>

#include <sstream>

namespace mollusk::runtime {

std::string to_string( instruction_error e )
{
   switch( e )
   {
      case instruction_error::generic_error:
         return "generic instruction error";
      case instruction_error::invalid_argument:
         return "invalid program argument";
      case instruction_error::invalid_instruction_data:
         return "invalid instruction data";
      case instruction_error::invalid_account_data:
         return "invalid account data for instruction";
      case instruction_error::account_data_too_small:
         return "account data too small for instruction";
      case instruction_error::insufficient_funds:
         return "insufficient funds for instruction";
      case instruction_error::incorrect_program_id:
         return "incorrect program id for instruction";
      case instruction_error::missing_required_signature:
         return "missing required signature for instruction";
      case instruction_error::account_already_initialized:
         return "instruction requires an uninitialized account";
      case instruction_error::uninitialized_account:
         return "instruction requires an initialized account";
      case instruction_error::unbalanced_instruction:
         return "sum of account balances before and after instruction do not match";
      case instruction_error::modified_program_id:
         return "instruction illegally modified the program id of an account";
      case instruction_error::external_account_lamport_spend:
         return "instruction spent from the balance of an account it does not own";
      case instruction_error::external_account_data_modified:
         return "instruction modified data of an account it does not own";
      case instruction_error::readonly_lamport_change:
         return "instruction changed the balance of a read-only account";
      case instruction_error::readonly_data_modified:
         return "instruction modified data of a read-only account";
      case instruction_error::duplicate_account_index:
         return "instruction contains duplicate accounts";
      case instruction_error::executable_modified:
         return "instruction changed executable bit of an account";
      case instruction_error::rent_epoch_modified:
         return "instruction modified rent epoch of an account";
      case instruction_error::not_enough_account_keys:
         return "insufficient account keys for instruction";
      case instruction_error::account_data_size_changed:
         return "program other than the account's owner changed the size of the account data";
      case instruction_error::account_not_executable:
         return "instruction expected an executable account";
      case instruction_error::account_borrow_failed:
         return "instruction tries to borrow reference for an account which is already borrowed";
      case instruction_error::account_borrow_outstanding:
         return "instruction left account with an outstanding borrowed reference";
      case instruction_error::duplicate_account_out_of_sync:
         return "instruction modifications of multiply-passed account differ";
      case instruction_error::custom:
         return "custom program error";
      case instruction_error::invalid_error:
         return "program returned invalid error code";
      case instruction_error::executable_data_modified:
         return "instruction changed executable accounts data";
      case instruction_error::executable_lamport_change:
         return "instruction changed the balance of an executable account";
      case instruction_error::executable_account_not_rent_exempt:
         return "executable accounts must be rent exempt";
      case instruction_error::unsupported_program_id:
         return "unsupported program id";
      case instruction_error::call_depth:
         return "cross-program invocation call depth too deep";
      case instruction_error::missing_account:
         return "an account required by the instruction is missing";
      case instruction_error::reentrancy_not_allowed:
         return "cross-program invocation reentrancy not allowed for this instruction";
      case instruction_error::max_seed_length_exceeded:
         return "length of the seed is too long for address generation";
      case instruction_error::invalid_seeds:
         return "provided seeds do not result in a valid address";
      case instruction_error::invalid_realloc:
         return "failed to reallocate account data";
      case instruction_error::computational_budget_exceeded:
         return "computational budget exceeded";
      case instruction_error::privilege_escalation:
         return "cross-program invocation with unauthorized signer or writable account";
      case instruction_error::program_environment_setup_failure:
         return "failed to create program execution environment";
      case instruction_error::program_failed_to_complete:
         return "program failed to complete";
      case instruction_error::program_failed_to_compile:
         return "program failed to compile";
      case instruction_error::immutable:
         return "account is immutable";
      case instruction_error::incorrect_authority:
         return "incorrect authority provided";
      case instruction_error::borsh_io_error:
         return "failed to serialize or deserialize account data";
      case instruction_error::account_not_rent_exempt:
         return "an account does not have enough lamports to be rent-exempt";
      case instruction_error::invalid_account_owner:
         return "invalid account owner";
      case instruction_error::arithmetic_overflow:
         return "program arithmetic overflowed";
      case instruction_error::unsupported_sysvar:
         return "unsupported sysvar";
      case instruction_error::illegal_owner:
         return "provided owner is not allowed";
      case instruction_error::max_accounts_data_allocations_exceeded:
         return "accounts data allocations exceeded the maximum allowed per transaction";
      case instruction_error::max_accounts_exceeded:
         return "max accounts exceeded";
      case instruction_error::max_instruction_trace_length_exceeded:
         return "max instruction trace length exceeded";
      case instruction_error::builtin_programs_must_consume_compute_units:
         return "builtin programs must consume compute units";
   }

   return "unknown instruction error";
}

std::ostream& operator<<( std::ostream& os, instruction_error e )
{
   return os << to_string( e );
}

std::string to_string( const program_error& e )
{
   if ( e.kind == instruction_error::custom )
   {
      std::stringstream ss;
      ss << "custom program error: 0x" << std::hex << e.custom_code;
      return ss.str();
   }

   return to_string( e.kind );
}

std::ostream& operator<<( std::ostream& os, const program_error& e )
{
   return os << to_string( e );
}

std::optional< program_error > to_program_error( instruction_error e, uint32_t custom_code )
{
   switch( e )
   {
      case instruction_error::custom:
         return program_error::custom( custom_code );
      case instruction_error::invalid_argument:
      case instruction_error::invalid_instruction_data:
      case instruction_error::invalid_account_data:
      case instruction_error::account_data_too_small:
      case instruction_error::insufficient_funds:
      case instruction_error::incorrect_program_id:
      case instruction_error::missing_required_signature:
      case instruction_error::account_already_initialized:
      case instruction_error::uninitialized_account:
      case instruction_error::not_enough_account_keys:
      case instruction_error::account_borrow_failed:
      case instruction_error::max_seed_length_exceeded:
      case instruction_error::invalid_seeds:
      case instruction_error::borsh_io_error:
      case instruction_error::account_not_rent_exempt:
      case instruction_error::unsupported_sysvar:
      case instruction_error::illegal_owner:
      case instruction_error::max_accounts_data_allocations_exceeded:
      case instruction_error::invalid_realloc:
      case instruction_error::max_instruction_trace_length_exceeded:
      case instruction_error::builtin_programs_must_consume_compute_units:
      case instruction_error::invalid_account_owner:
      case instruction_error::arithmetic_overflow:
      case instruction_error::immutable:
      case instruction_error::incorrect_authority:
         return program_error{ e, 0 };
      default:
         return std::nullopt;
   }
}

} // mollusk::runtime
