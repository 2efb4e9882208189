#pragma once

#include <mollusk/runtime/invoke_context.hpp>

#include <mollusk/vm_manager/host_api.hpp>

namespace mollusk::runtime {

/**
 * Bridges system calls made by bytecode to the invoke context running it.
 * Every system call costs syscall_base_cost compute units and one compute
 * unit is charged per VM tick.
 */
class host_api final : public vm_manager::abstract_host_api
{
   public:
      host_api( invoke_context& ctx );
      virtual ~host_api() override;

      invoke_context& _ctx;

      virtual int32_t invoke_system_call( uint32_t sid, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len ) override;
      virtual int64_t get_meter_ticks() const override;
      virtual void use_meter_ticks( uint64_t meter_ticks ) override;
};

} // mollusk::runtime
