#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mollusk::tests {

/**
 * Instruction sequence of a WebAssembly function body.
 */
class code
{
   public:
      code& i32_const( int32_t v );
      code& i64_const( int64_t v );
      code& call( uint32_t func_index );
      code& drop();
      code& unreachable();
      code& loop_forever();

      /**
       * Push the four system call arguments and call it.
       */
      code& system_call( uint32_t func_index, int32_t ret_ptr, int32_t ret_len, int32_t arg_ptr, int32_t arg_len );

      const std::vector< uint8_t >& bytes() const { return _bytes; }

   private:
      std::vector< uint8_t > _bytes;
};

/**
 * Builds minimal modules: system call imports from "env", one page of memory,
 * active data segments and a single exported function.
 */
class module_builder
{
   public:
      /**
       * Import a system call and return its function index.
       */
      uint32_t import_system_call( const std::string& name );

      /**
       * Index of an imported system call.
       */
      uint32_t system_call( const std::string& name ) const;

      module_builder& data( uint32_t offset, const std::vector< uint8_t >& bytes );
      module_builder& data( uint32_t offset, const std::string& text );

      // Defaults to "_start"
      module_builder& export_name( const std::string& name );

      std::vector< uint8_t > build( const code& body ) const;

   private:
      struct data_segment
      {
         uint32_t               offset = 0;
         std::vector< uint8_t > bytes;
      };

      std::vector< std::string >        _imports;
      std::map< std::string, uint32_t > _import_index;
      std::vector< data_segment >       _data;
      std::string                       _export_name = "_start";
};

} // mollusk::tests
