#pragma once

namespace mollusk::runtime {

class invoke_context;

namespace loader {

/**
 * Entrypoint of the bytecode loaders.
 *
 * Runs the cached executable of the program being invoked. Invoking a loader
 * directly fails with incorrect_program_id. A program that exits with a
 * non-zero code fails with that custom error, and a VM fault fails with
 * program_failed_to_complete.
 */
void process_instruction( invoke_context& ctx );

} // loader

} // mollusk::runtime
