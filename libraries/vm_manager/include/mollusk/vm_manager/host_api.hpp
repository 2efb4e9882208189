#pragma once

#include <cstdint>

namespace mollusk::vm_manager {

/**
 * The host side of a running program.
 *
 * A backend calls invoke_system_call for every imported system call and keeps
 * the host's compute meter in step with the ticks the VM has executed. The
 * runtime provides the implementation.
 */
class abstract_host_api
{
   public:
      abstract_host_api();
      virtual ~abstract_host_api();

      virtual int32_t invoke_system_call( uint32_t sid, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len ) = 0;
      // Ticks the program may still execute
      virtual int64_t get_meter_ticks() const = 0;
      virtual void use_meter_ticks( uint64_t meter_ticks ) = 0;
};

} // mollusk::vm_manager
