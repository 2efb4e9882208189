#pragma once

#include <mollusk/exception.hpp>
#include <mollusk/vm_manager/exceptions.hpp>

namespace mollusk::vm_manager::fizzy {

MOLLUSK_DECLARE_DERIVED_EXCEPTION( fizzy_vm_exception, vm_backend_exception );

// Module loading exceptions
MOLLUSK_DECLARE_DERIVED_EXCEPTION( module_parse_exception, load_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( module_instantiate_exception, fizzy_vm_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( create_context_exception, fizzy_vm_exception );

// Runtime exceptions
MOLLUSK_DECLARE_DERIVED_EXCEPTION( wasm_trap_exception, fizzy_vm_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( wasm_memory_exception, fizzy_vm_exception );

// These exceptions should never happen, if they do it's a programming bug
MOLLUSK_DECLARE_DERIVED_EXCEPTION( fizzy_returned_null_exception, fizzy_vm_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( null_argument_exception, fizzy_vm_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( runner_state_exception, fizzy_vm_exception );

} // mollusk::vm_manager::fizzy
