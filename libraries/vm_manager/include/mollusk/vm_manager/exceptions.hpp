#pragma once

#include <mollusk/exception.hpp>

namespace mollusk::vm_manager {

// Root of exception hierarchy for vm_manager library
MOLLUSK_DECLARE_EXCEPTION( vm_exception );

// Exceptions thrown by vm_manager
MOLLUSK_DECLARE_DERIVED_EXCEPTION( vm_manager_exception, vm_exception );
// Any particular backend should subclass all its exceptions from vm_backend_exception
MOLLUSK_DECLARE_DERIVED_EXCEPTION( vm_backend_exception, vm_exception );
// The program executed more ticks than the host allowed
MOLLUSK_DECLARE_DERIVED_EXCEPTION( meter_exhausted_exception, vm_backend_exception );

// Bytecode rejected while building an executable. The program cache is never
// modified when one of these escapes a load.
MOLLUSK_DECLARE_DERIVED_EXCEPTION( load_exception, vm_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( bytecode_size_exception, load_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( unresolved_import_exception, load_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( missing_entrypoint_exception, load_exception );

MOLLUSK_DECLARE_DERIVED_EXCEPTION( unknown_backend_exception, vm_manager_exception );

} // mollusk::vm_manager
