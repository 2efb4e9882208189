#pragma once

#include <mollusk/runtime/invoke_context.hpp>
#include <mollusk/runtime/system_calls.hpp>

#include <boost/container/flat_map.hpp>

#include <cstdint>
#include <functional>

namespace mollusk::runtime {

/**
 * A registry of system call implementations.
 *
 * A system call reads its arguments from the arg buffer, writes its result
 * to the ret buffer and returns a non-negative value whose meaning depends on
 * the call. Failures are thrown as instruction exceptions.
 */
class system_call_dispatcher
{
   public:
      using handler = std::function< int32_t( invoke_context&, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len ) >;

      int32_t call( uint32_t id, invoke_context& ctx, char* ret_ptr, uint32_t ret_len, const char* arg_ptr, uint32_t arg_len ) const;
      bool exists( uint32_t id ) const;

      static const system_call_dispatcher& instance();

   private:
      system_call_dispatcher();

      void register_system_call( system_call_id id, handler h );

      boost::container::flat_map< uint32_t, handler > _dispatch_map;
};

} // mollusk::runtime
