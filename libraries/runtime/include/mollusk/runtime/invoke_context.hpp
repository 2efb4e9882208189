#pragma once

#include <mollusk/runtime/compute_meter.hpp>
#include <mollusk/runtime/environment.hpp>
#include <mollusk/runtime/program_cache.hpp>
#include <mollusk/runtime/transaction_context.hpp>
#include <mollusk/runtime/types.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mollusk::runtime {

/**
 * Drives the execution of an instruction and the instructions it invokes.
 *
 * An invoke context borrows the transaction context, program cache,
 * environment and compute meter for the duration of one top level
 * instruction. Instruction failures are reported as instruction_exception.
 */
class invoke_context
{
   public:
      invoke_context( transaction_context& tc, const program_cache& cache, const environment_config& env, compute_meter& meter );

      invoke_context( const invoke_context& ) = delete;
      invoke_context& operator=( const invoke_context& ) = delete;

      /**
       * Execute a top level instruction.
       *
       * compute_units_consumed and execute_us are written even when the
       * instruction fails.
       */
      void process_instruction(
         const std::vector< uint8_t >& data,
         const std::vector< instruction_account >& instruction_accounts,
         const std::vector< uint16_t >& program_indices,
         uint64_t& compute_units_consumed,
         uint64_t& execute_us );

      /**
       * Invoke another program from the current instruction. Accounts of the
       * callee must be passed to the caller; signers lists the addresses the
       * caller signs for in addition to its own signers.
       */
      void native_invoke( const instruction& ix, const std::vector< pubkey >& signers );

      /**
       * Map a cross-program instruction onto the caller's accounts and check
       * that no privilege is escalated. Returns the callee instruction
       * accounts and its program index in the transaction.
       */
      std::pair< std::vector< instruction_account >, std::vector< uint16_t > >
      prepare_instruction( const instruction& ix, const std::vector< pubkey >& signers ) const;

      transaction_context& transaction();
      const instruction_context& current_instruction() const;
      const pubkey& current_program_id() const;
      std::size_t stack_height() const;

      const program_cache& programs() const;
      const environment_config& environment() const;

      compute_meter& meter();
      void consume( uint64_t units );

      /**
       * Emit a message to the program log.
       */
      void log( const std::string& msg ) const;

   private:
      void push( instruction_context ctx );
      void process( instruction_context ctx, uint64_t& compute_units_consumed );
      void process_executable_chain( uint64_t& compute_units_consumed );

      transaction_context&      _tc;
      const program_cache&      _cache;
      const environment_config& _env;
      compute_meter&            _meter;
};

} // mollusk::runtime
