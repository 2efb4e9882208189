#include <mollusk/runtime/compute_meter.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/host_api.hpp>
#include <mollusk/runtime/invoke_context.hpp>
#include <mollusk/runtime/loader.hpp>

#include <mollusk/vm_manager/exceptions.hpp>

namespace mollusk::runtime::loader {

void process_instruction( invoke_context& ctx )
{
   auto& tc = ctx.transaction();
   auto program_account = ctx.current_instruction().borrow_last_program_account( tc );
   const pubkey program_id = program_account.key();

   MOLLUSK_ASSERT( program_account.owner() != program_id::native_loader(), incorrect_program_id_exception,
      "loader management instructions are not supported" );
   MOLLUSK_ASSERT( program_account.executable(), incorrect_program_id_exception,
      "program ${p} is not executable", ("p", program_id.to_string()) );

   auto entry = ctx.programs().find( program_id );
   MOLLUSK_ASSERT( entry && !entry->is_builtin(), unsupported_program_id_exception,
      "program ${p} is not deployed", ("p", program_id.to_string()) );

   ctx.consume( compute_cost::loader );

   const auto& program = std::get< bytecode_program >( entry->program() );
   entry->record_invocation();

   host_api hapi( ctx );

   try
   {
      program.backend->run( hapi, *program.executable );
   }
   catch ( const program_exit_exception& e )
   {
      // Exit code zero is a successful return
      if ( e.get_code() != 0 )
      {
         MOLLUSK_THROW( custom_program_exception, "program ${p} exited with code ${custom_code}",
            ("p", program_id.to_string())("custom_code", uint32_t( e.get_code() )) );
      }
   }
   catch ( const vm_manager::meter_exhausted_exception& )
   {
      MOLLUSK_THROW( computational_budget_exceeded_exception, "compute budget of ${l} units exceeded", ("l", ctx.meter().limit()) );
   }
   catch ( const vm_manager::vm_backend_exception& e )
   {
      MOLLUSK_THROW( program_failed_to_complete_exception, "program ${p} failed to complete: ${vm_error}",
         ("p", program_id.to_string())("vm_error", e.get_message()) );
   }
}

} // mollusk::runtime::loader
