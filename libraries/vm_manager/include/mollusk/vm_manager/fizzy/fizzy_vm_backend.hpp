#pragma once

#include <mollusk/vm_manager/vm_backend.hpp>

#include <string>
#include <vector>

namespace mollusk::vm_manager::fizzy {

/**
 * Implementation of vm_backend for Fizzy.
 *
 * Bytecode is a WebAssembly module exporting `_start`. Every import must be a
 * function from module `env` named in the runtime environment's system call
 * table, with signature (i32 ret_ptr, i32 ret_len, i32 arg_ptr, i32 arg_len) -> i32.
 */
class fizzy_vm_backend : public vm_backend
{
   public:
      fizzy_vm_backend();
      virtual ~fizzy_vm_backend();

      virtual std::string backend_name();
      virtual void initialize();

      virtual executable_ptr load( const std::vector< uint8_t >& bytecode, const runtime_environment& env );
      virtual void run( abstract_host_api& hapi, const executable& exe );
};

} // mollusk::vm_manager::fizzy
