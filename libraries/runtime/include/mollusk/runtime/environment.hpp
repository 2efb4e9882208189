#pragma once

#include <mollusk/runtime/compute_budget.hpp>
#include <mollusk/runtime/feature_set.hpp>
#include <mollusk/runtime/sysvars.hpp>

namespace mollusk::runtime {

/**
 * Everything an invocation reads from its surroundings. Fixed for the duration
 * of one process_instruction call.
 */
struct environment_config
{
   runtime::compute_budget compute_budget;
   runtime::feature_set    feature_set = feature_set::all_enabled();
   runtime::fee_structure  fee_structure;
   runtime::sysvars        sysvars;
};

} // mollusk::runtime
