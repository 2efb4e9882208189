#pragma once

#include <mollusk/runtime/program_cache.hpp>

#include <vector>

namespace mollusk::runtime {

namespace builtin_name {

constexpr const char* system_program         = "system_program";
constexpr const char* bpf_loader             = "solana_bpf_loader_program";
constexpr const char* bpf_loader_upgradeable = "solana_bpf_loader_upgradeable_program";

} // builtin_name

/**
 * Builtins registered in every new program cache: the system program and the
 * two bytecode loaders.
 */
const std::vector< builtin >& default_builtins();

} // mollusk::runtime
