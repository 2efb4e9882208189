#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mollusk::file {

constexpr const char* program_path_env  = "MOLLUSK_PROGRAM_PATH";
constexpr const char* bytecode_extension = ".wasm";

/**
 * Directories searched for program bytecode, in order: the entries of
 * MOLLUSK_PROGRAM_PATH (colon separated), tests/fixtures, target/deploy and
 * the working directory.
 */
std::vector< std::filesystem::path > default_search_paths();

/**
 * Read a whole file. Throws program_file_not_found_exception when it cannot
 * be opened.
 */
std::vector< uint8_t > read_file( const std::filesystem::path& path );

/**
 * Find <name>.wasm in the search paths and return its contents.
 */
std::vector< uint8_t > load_program_bytecode( const std::string& name );
std::vector< uint8_t > load_program_bytecode( const std::string& name, const std::vector< std::filesystem::path >& search_paths );

} // mollusk::file
