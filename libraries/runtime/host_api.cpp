#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/host_api.hpp>
#include <mollusk/runtime/system_call_dispatcher.hpp>

#include <mollusk/util/binary.hpp>

namespace mollusk::runtime {

host_api::host_api( invoke_context& ctx ) : _ctx( ctx ) {}
host_api::~host_api() {}

int32_t host_api::invoke_system_call( uint32_t sid, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len )
{
   _ctx.consume( _ctx.environment().compute_budget.syscall_base_cost );

   try
   {
      return system_call_dispatcher::instance().call( sid, _ctx, ret_ptr, ret_len, arg_ptr, arg_len );
   }
   catch ( const util::binary_exception& e )
   {
      MOLLUSK_THROW( syscall_argument_exception, "malformed arguments to system call ${sid}: ${e}", ("sid", sid)("e", e.get_message()) );
   }
}

int64_t host_api::get_meter_ticks() const
{
   return int64_t( _ctx.meter().remaining() );
}

void host_api::use_meter_ticks( uint64_t meter_ticks )
{
   _ctx.consume( meter_ticks );
}

} // mollusk::runtime
