#pragma once

#include <mollusk/exception.hpp>

namespace mollusk {

// Root of exception hierarchy for the harness library
MOLLUSK_DECLARE_EXCEPTION( harness_exception );

MOLLUSK_DECLARE_DERIVED_EXCEPTION( check_failure_exception, harness_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( program_file_not_found_exception, harness_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( config_exception, harness_exception );

} // mollusk
