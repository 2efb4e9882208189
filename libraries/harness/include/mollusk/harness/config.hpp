#pragma once

#include <mollusk/runtime/compute_budget.hpp>
#include <mollusk/runtime/feature_set.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#define LOG_LEVEL_OPTION                    "log-level"
#define LOG_LEVEL_DEFAULT                   "info"
#define LOG_DIR_OPTION                      "log-dir"
#define LOG_COLOR_OPTION                    "log-color"
#define LOG_COLOR_DEFAULT                   true
#define COMPUTE_UNIT_LIMIT_OPTION           "compute-unit-limit"
#define MAX_INSTRUCTION_STACK_DEPTH_OPTION  "max-instruction-stack-depth"
#define MAX_INSTRUCTION_TRACE_LENGTH_OPTION "max-instruction-trace-length"
#define LAMPORTS_PER_SIGNATURE_OPTION       "lamports-per-signature"
#define SLOT_OPTION                         "slot"
#define FEATURES_OPTION                     "features"
#define PROGRAM_PATH_OPTION                 "program-path"

namespace mollusk {

/**
 * Settings a harness is constructed from. Defaults match a default
 * constructed harness.
 */
struct harness_config
{
   std::string                            log_level = LOG_LEVEL_DEFAULT;
   std::optional< std::filesystem::path > log_dir;
   bool                                   log_color = LOG_COLOR_DEFAULT;

   runtime::compute_budget                compute_budget;
   runtime::feature_set                   feature_set = runtime::feature_set::all_enabled();
   runtime::fee_structure                 fee_structure;
   // The clock is warped to this slot when set
   std::optional< uint64_t >              slot;

   // Searched before the default program search paths
   std::vector< std::filesystem::path >   program_paths;
};

/**
 * Read a YAML config file. Keys that are absent keep their defaults. Throws
 * config_exception when the file cannot be read or a value is invalid.
 */
harness_config load_config( const std::filesystem::path& path );

/**
 * Parse a YAML config document.
 */
harness_config parse_config( const std::string& yaml );

} // mollusk
