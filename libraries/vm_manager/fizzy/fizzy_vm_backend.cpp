
#include <fizzy/fizzy.h>

#include <mollusk/exception.hpp>

#include <mollusk/vm_manager/fizzy/exceptions.hpp>
#include <mollusk/vm_manager/fizzy/fizzy_vm_backend.hpp>

#include <exception>
#include <string>
#include <utility>

namespace mollusk::vm_manager::fizzy {

namespace constants {
   constexpr const char* entrypoint_name     = "_start";
   constexpr const char* system_call_module  = "env";
   constexpr std::size_t system_call_num_args = 4;
}

std::string fizzy_error_code_name( FizzyErrorCode code ) noexcept
{
   switch( code )
   {
      case FizzySuccess:
         return "FizzySuccess";
      case FizzyErrorMalformedModule:
         return "FizzyErrorMalformedModule";
      case FizzyErrorInvalidModule:
         return "FizzyErrorInvalidModule";
      case FizzyErrorInstantiationFailed:
         return "FizzyErrorInstantiationFailed";
      case FizzyErrorMemoryAllocationFailed:
         return "FizzyErrorMemoryAllocationFailed";
      case FizzyErrorOther:
         return "FizzyErrorOther";
      default:
         return "UnknownFizzyError";
   }
}

/**
 * A parsed module together with its resolved system call imports.
 */
class fizzy_executable : public executable
{
   public:
      struct import_binding
      {
         std::string name;
         uint32_t    sid = 0;
      };

      fizzy_executable( const FizzyModule* m, std::size_t size, const runtime_environment& env ) :
         _module( m ), _bytecode_size( size ), _environment( env ) {}

      ~fizzy_executable()
      {
         if ( _module != nullptr )
            fizzy_free_module( _module );
      }

      fizzy_executable( const fizzy_executable& ) = delete;
      fizzy_executable& operator=( const fizzy_executable& ) = delete;

      virtual std::size_t bytecode_size() const { return _bytecode_size; }
      virtual const runtime_environment& environment() const { return _environment; }

      const FizzyModule* module() const { return _module; }
      const std::vector< import_binding >& imports() const { return _imports; }
      uint32_t entrypoint_index() const { return _entrypoint_index; }

      void add_import( std::string name, uint32_t sid ) { _imports.push_back( import_binding{ std::move( name ), sid } ); }
      void set_entrypoint_index( uint32_t idx ) { _entrypoint_index = idx; }

   private:
      const FizzyModule*            _module = nullptr;
      std::size_t                   _bytecode_size = 0;
      runtime_environment           _environment;
      std::vector< import_binding > _imports;
      uint32_t                      _entrypoint_index = 0;
};

/**
 * Convert a pointer from inside the VM to a native pointer.
 */
char* resolve_ptr( FizzyInstance* fizzy_instance, uint32_t ptr, uint32_t size )
{
   static char empty_region = 0;

   MOLLUSK_ASSERT( fizzy_instance != nullptr, null_argument_exception, "fizzy_instance was unexpectedly null pointer" );
   size_t mem_size = fizzy_get_instance_memory_size( fizzy_instance );
   char* mem_data = (char *) fizzy_get_instance_memory_data( fizzy_instance );

   // Modules without a memory may still pass empty buffers
   if( mem_data == nullptr )
      return size == 0 ? &empty_region : nullptr;

   if( ptr == mem_size )
   {
      if( size == 0 )
         return mem_data + mem_size;
   }
   else if( ptr > mem_size )
   {
      return nullptr;
   }

   // How much memory exists between pointer and end of memory?
   uint64_t mem_at_ptr = uint64_t( mem_size ) - ptr;
   if( mem_at_ptr < uint64_t(size) )
      return nullptr;

   return mem_data + ptr;
}

class fizzy_runner
{
   public:
      fizzy_runner( abstract_host_api& h, const fizzy_executable& e ) : _hapi(h), _exe(e) {}
      ~fizzy_runner();

      void instantiate_module();
      void call_start();

      FizzyExecutionResult _invoke_system_call( uint32_t sid, const FizzyValue* args, FizzyExecutionContext* fizzy_context ) noexcept;

   private:
      struct system_call_binding
      {
         fizzy_runner* runner = nullptr;
         uint32_t      sid    = 0;
      };

      abstract_host_api&                  _hapi;
      const fizzy_executable&             _exe;
      FizzyInstance*                      _instance = nullptr;
      FizzyExecutionContext*              _fizzy_context = nullptr;
      int64_t                             _previous_ticks = 0;
      std::exception_ptr                  _exception;
      std::vector< system_call_binding >  _bindings;
};

fizzy_runner::~fizzy_runner()
{
   // The instance owns its module copy
   if( _instance != nullptr )
      fizzy_free_instance( _instance );

   if( _fizzy_context != nullptr )
      fizzy_free_execution_context( _fizzy_context );
}

void fizzy_runner::instantiate_module()
{
   static const FizzyValueType system_call_arg_types[] = { FizzyValueTypeI32, FizzyValueTypeI32, FizzyValueTypeI32, FizzyValueTypeI32 };

   FizzyExternalFn invoke_system_call = [](void* voidptr_context, FizzyInstance* fizzy_instance, const FizzyValue* args, FizzyExecutionContext* fizzy_context) noexcept -> FizzyExecutionResult
   {
      auto binding = static_cast< system_call_binding* >( voidptr_context );
      return binding->runner->_invoke_system_call( binding->sid, args, fizzy_context );
   };

   const auto& imports = _exe.imports();

   // Bindings must not move once their addresses are handed to fizzy
   _bindings.resize( imports.size() );
   std::vector< FizzyImportedFunction > host_funcs;
   host_funcs.reserve( imports.size() );

   for ( std::size_t i = 0; i < imports.size(); i++ )
   {
      _bindings[ i ] = system_call_binding{ this, imports[ i ].sid };

      FizzyExternalFunction fn = {
         { FizzyValueTypeI32, system_call_arg_types, constants::system_call_num_args },
         invoke_system_call,
         &_bindings[ i ]
      };

      host_funcs.push_back( FizzyImportedFunction{ constants::system_call_module, imports[ i ].name.c_str(), fn } );
   }

   MOLLUSK_ASSERT( _instance == nullptr, runner_state_exception, "_instance was unexpectedly non-null" );

   // fizzy takes ownership of the module passed to instantiate, even on failure
   const FizzyModule* module_copy = fizzy_clone_module( _exe.module() );
   MOLLUSK_ASSERT( module_copy != nullptr, fizzy_returned_null_exception, "fizzy_clone_module() unexpectedly returned null pointer" );

   FizzyError fizzy_err;
   _instance = fizzy_resolve_instantiate(
      module_copy,
      host_funcs.data(),
      host_funcs.size(),
      nullptr,
      nullptr,
      nullptr,
      0,
      _exe.environment().max_memory_pages,
      &fizzy_err );

   if( _instance == nullptr )
   {
      std::string error_code = fizzy_error_code_name( fizzy_err.code );
      std::string error_message = fizzy_err.message;
      MOLLUSK_THROW( module_instantiate_exception, "could not instantiate module - ${code}: ${msg}", ("code", error_code)("msg", error_message) );
   }
}

FizzyExecutionResult fizzy_runner::_invoke_system_call( uint32_t sid, const FizzyValue* args, FizzyExecutionContext* fizzy_context ) noexcept
{
   FizzyExecutionResult result;
   result.has_value = false;
   result.value.i64 = 0;

   _exception = std::exception_ptr();

   try
   {
      uint32_t ret_len = args[1].i32;
      char* ret_ptr = resolve_ptr(_instance, args[0].i32, ret_len);
      uint32_t arg_len = args[3].i32;
      const char* arg_ptr = resolve_ptr(_instance, args[2].i32, arg_len);

      MOLLUSK_ASSERT( ret_ptr != nullptr, wasm_memory_exception, "invalid ret_ptr in system call ${sid}", ("sid", sid) );
      MOLLUSK_ASSERT( arg_ptr != nullptr, wasm_memory_exception, "invalid arg_ptr in system call ${sid}", ("sid", sid) );

      int64_t* ticks = fizzy_get_execution_context_ticks(_fizzy_context);
      MOLLUSK_ASSERT( ticks != nullptr, fizzy_returned_null_exception, "fizzy_get_execution_context_ticks() unexpectedly returned null pointer" );
      _hapi.use_meter_ticks( uint64_t( _previous_ticks - *ticks ) );

      try
      {
         result.value.i32 = uint32_t( _hapi.invoke_system_call( sid, ret_ptr, ret_len, arg_ptr, arg_len ) );
         result.has_value = true;
      }
      catch ( ... )
      {
         _exception = std::current_exception();
      }

      _previous_ticks = _hapi.get_meter_ticks();
      *ticks = _previous_ticks;
   }
   catch ( ... )
   {
      _exception = std::current_exception();
   }

   result.trapped = !!_exception;
   return result;
}

void fizzy_runner::call_start()
{
   MOLLUSK_ASSERT( _fizzy_context == nullptr, runner_state_exception, "_fizzy_context was unexpectedly non-null" );
   _previous_ticks = _hapi.get_meter_ticks();
   _fizzy_context = fizzy_create_metered_execution_context( int( _exe.environment().max_call_depth ), _previous_ticks );
   MOLLUSK_ASSERT( _fizzy_context != nullptr, create_context_exception, "could not create execution context" );

   FizzyExecutionResult result = fizzy_execute( _instance, _exe.entrypoint_index(), nullptr, _fizzy_context );

   int64_t* ticks = fizzy_get_execution_context_ticks(_fizzy_context);
   MOLLUSK_ASSERT( ticks != nullptr, fizzy_returned_null_exception, "fizzy_get_execution_context_ticks() unexpectedly returned null pointer" );

   // Exhausting the meter also traps, so charge the ticks before looking at the result
   bool meter_exhausted = *ticks < 0;
   _hapi.use_meter_ticks( uint64_t( _previous_ticks - *ticks ) );

   if( _exception )
   {
      std::exception_ptr exc = _exception;
      _exception = std::exception_ptr();
      std::rethrow_exception( exc );
   }

   if( meter_exhausted )
   {
      MOLLUSK_THROW( meter_exhausted_exception, "module exhausted its ${t} ticks", ("t", _previous_ticks) );
   }

   if( result.trapped )
   {
      MOLLUSK_THROW( wasm_trap_exception, "module exited due to trap" );
   }
}

fizzy_vm_backend::fizzy_vm_backend() {}
fizzy_vm_backend::~fizzy_vm_backend() {}

std::string fizzy_vm_backend::backend_name()
{
   return "fizzy";
}

void fizzy_vm_backend::initialize()
{
}

executable_ptr fizzy_vm_backend::load( const std::vector< uint8_t >& bytecode, const runtime_environment& env )
{
   MOLLUSK_ASSERT( !bytecode.empty(), bytecode_size_exception, "bytecode is empty" );
   MOLLUSK_ASSERT(
      bytecode.size() <= env.max_bytecode_size,
      bytecode_size_exception,
      "bytecode size ${size} exceeds the limit of ${max}", ("size", bytecode.size())("max", env.max_bytecode_size)
   );

   FizzyError fizzy_err;
   auto module_ptr = fizzy_parse( bytecode.data(), bytecode.size(), &fizzy_err );
   if ( module_ptr == nullptr )
   {
      std::string error_code = fizzy_error_code_name( fizzy_err.code );
      std::string error_message = fizzy_err.message;
      MOLLUSK_THROW( module_parse_exception, "could not parse fizzy module - ${code}: ${msg}", ("code", error_code)("msg", error_message) );
   }

   auto exe = std::make_shared< fizzy_executable >( module_ptr, bytecode.size(), env );

   uint32_t import_count = fizzy_get_import_count( module_ptr );
   for ( uint32_t i = 0; i < import_count; i++ )
   {
      auto desc = fizzy_get_import_description( module_ptr, i );
      std::string module_name = desc.module;
      std::string name = desc.name;

      MOLLUSK_ASSERT(
         desc.kind == FizzyExternalKindFunction && module_name == constants::system_call_module,
         unresolved_import_exception,
         "unsupported import ${module}.${name}", ("module", module_name)("name", name)
      );

      auto itr = env.system_calls.find( name );
      MOLLUSK_ASSERT( itr != env.system_calls.end(), unresolved_import_exception, "unresolved system call ${name}", ("name", name) );

      const auto& type = desc.desc.function_type;
      bool signature_ok = type.output == FizzyValueTypeI32 && type.inputs_size == constants::system_call_num_args;
      for ( std::size_t j = 0; signature_ok && j < type.inputs_size; j++ )
         signature_ok = type.inputs[ j ] == FizzyValueTypeI32;

      MOLLUSK_ASSERT( signature_ok, unresolved_import_exception, "system call ${name} has an unexpected signature", ("name", name) );

      exe->add_import( name, itr->second );
   }

   uint32_t start_func_idx = 0;
   bool found = fizzy_find_exported_function_index( module_ptr, constants::entrypoint_name, &start_func_idx );
   MOLLUSK_ASSERT( found, missing_entrypoint_exception, "module does not have ${name} function", ("name", constants::entrypoint_name) );
   exe->set_entrypoint_index( start_func_idx );

   return exe;
}

void fizzy_vm_backend::run( abstract_host_api& hapi, const executable& exe )
{
   const auto* fizzy_exe = dynamic_cast< const fizzy_executable* >( &exe );
   MOLLUSK_ASSERT( fizzy_exe != nullptr, runner_state_exception, "executable was not built by the fizzy backend" );

   fizzy_runner runner( hapi, *fizzy_exe );
   runner.instantiate_module();
   runner.call_start();
}

} // mollusk::vm_manager::fizzy
