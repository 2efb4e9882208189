#pragma once

#include <mollusk/harness/check.hpp>
#include <mollusk/harness/config.hpp>
#include <mollusk/harness/result.hpp>

#include <mollusk/runtime/environment.hpp>
#include <mollusk/runtime/program_cache.hpp>
#include <mollusk/runtime/types.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mollusk {

using runtime::instruction;
using runtime::instruction_account;

/**
 * Executes single instructions against an in-memory runtime.
 *
 * A harness owns the environment (compute budget, features, fees, sysvars),
 * the default program and a program cache. Configuration goes through the
 * setters; once configured, process_instruction may be called concurrently.
 * Caller accounts are never modified: every call works on copies and returns
 * the post-execution copies in its result.
 */
class harness
{
   public:
      /**
       * A harness whose default program is the system program.
       */
      harness();

      /**
       * A harness whose default program is program_name, loaded from the
       * program search paths under the upgradeable loader.
       */
      harness( const pubkey& program_id, const std::string& program_name );

      explicit harness( const harness_config& config );
      harness( const harness_config& config, const pubkey& program_id, const std::string& program_name );

      harness( const harness& ) = delete;
      harness& operator=( const harness& ) = delete;

      /**
       * Load program_name from the program search paths and add it to the
       * cache under the upgradeable loader.
       */
      void add_program( const pubkey& program_id, const std::string& program_name );

      /**
       * Verify bytecode and add it to the cache. Throws a
       * vm_manager::load_exception when the bytecode is rejected.
       */
      void add_program_with_bytecode(
         const pubkey& program_id,
         const pubkey& loader_id,
         const std::vector< uint8_t >& bytecode,
         const std::string& program_name = std::string() );

      void add_builtin( const runtime::builtin& b );

      void warp_to_slot( uint64_t slot );

      // Programs already in the cache keep the budget and features they were loaded with
      void set_compute_budget( const runtime::compute_budget& budget );
      void set_feature_set( const runtime::feature_set& features );

      /**
       * Process an instruction. Execution failures are reported in the
       * result's program_result; only misuse of the harness throws.
       */
      instruction_result process_instruction( const instruction& ix, const std::vector< keyed_account >& accounts ) const;

      /**
       * Process an instruction and run checks on the result. Throws
       * check_failure_exception listing every failing check.
       */
      instruction_result process_and_validate_instruction(
         const instruction& ix,
         const std::vector< keyed_account >& accounts,
         const std::vector< check >& checks ) const;

      /**
       * Instruction accounts of ix: the meta at position i is account i + 1 of
       * the transaction, with its privileges copied.
       */
      std::vector< instruction_account > build_instruction_accounts( const instruction& ix ) const;

      /**
       * The program account of ix followed by accounts.
       */
      std::vector< keyed_account > build_transaction_accounts( const instruction& ix, const std::vector< keyed_account >& accounts ) const;

      const pubkey& program_id() const;
      const account& program_account() const;

      const runtime::environment_config& environment() const;
      const runtime::compute_budget& compute_budget() const;
      const runtime::feature_set& feature_set() const;
      const runtime::fee_structure& fee_structure() const;
      const runtime::sysvars& sysvars() const;

      const runtime::program_cache& programs() const;

   private:
      account resolve_program_account( const pubkey& program_id ) const;

      runtime::environment_config            _env;
      pubkey                                 _program_id;
      account                                _program_account;
      runtime::program_cache                 _cache;
      std::vector< std::filesystem::path >   _program_paths;
};

} // mollusk
