#pragma once

#include <mollusk/vm_manager/host_api.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mollusk::vm_manager {

/**
 * The parameters an executable is verified and run under.
 *
 * system_calls maps every import name a program may use to the id passed to
 * abstract_host_api::invoke_system_call. Imports outside this map are rejected
 * at load time.
 */
struct runtime_environment
{
   std::map< std::string, uint32_t > system_calls;
   uint32_t                          max_call_depth    = 64;
   uint32_t                          max_memory_pages  = 16;
   std::size_t                       max_bytecode_size = 10 * 1024 * 1024;
};

/**
 * A verified, loadable program image. Immutable once built.
 */
class executable
{
   public:
      executable();
      virtual ~executable();

      virtual std::size_t bytecode_size() const = 0;
      virtual const runtime_environment& environment() const = 0;
};

using executable_ptr = std::shared_ptr< const executable >;

/**
 * Abstract class for WebAssembly virtual machines.
 *
 * To add a new WebAssembly VM, you need to implement this class
 * and return it in get_vm_backends().
 */
class vm_backend
{
   public:
      vm_backend();
      virtual ~vm_backend();

      virtual std::string backend_name() = 0;

      /**
       * Initialize the backend.  Should only be called once.
       */
      virtual void initialize() = 0;

      /**
       * Parse and verify bytecode. Throws a load_exception on rejection.
       */
      virtual executable_ptr load( const std::vector< uint8_t >& bytecode, const runtime_environment& env ) = 0;

      /**
       * Run an executable's entrypoint to completion.
       */
      virtual void run( abstract_host_api& hapi, const executable& exe ) = 0;
};

/**
 * Get a list of available VM backends.
 */
std::vector< std::shared_ptr< vm_backend > > get_vm_backends();

std::string get_default_vm_backend_name();

/**
 * Get a shared_ptr to the named VM backend, initialized. Throws
 * unknown_backend_exception when no backend has that name.
 */
std::shared_ptr< vm_backend > get_vm_backend( const std::string& name = get_default_vm_backend_name() );

} // mollusk::vm_manager
