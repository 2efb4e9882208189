#pragma once

#include <mollusk/runtime/types.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mollusk::program {

using runtime::account;
using runtime::keyed_account;
using runtime::pubkey;

namespace loader_state {

// Tags of the upgradeable loader account states
constexpr uint32_t program      = 2;
constexpr uint32_t program_data = 3;

} // loader_state

/**
 * An executable account owned by the native loader holding the builtin's name.
 */
keyed_account create_keyed_account_for_builtin_program( const pubkey& program_id, const std::string& name );

keyed_account system_program();
keyed_account bpf_loader_program();
keyed_account bpf_loader_upgradeable_program();

/**
 * Address of the program data account of an upgradeable program.
 */
pubkey program_data_address( const pubkey& program_id );

/**
 * An upgradeable loader program account pointing at its program data account.
 */
account program_account( const pubkey& program_id );

/**
 * An upgradeable loader program data account: the program data header
 * followed by the bytecode.
 */
account program_data_account( const std::vector< uint8_t >& bytecode );

/**
 * A BPF loader program account holding the bytecode.
 */
account program_account_loader_2( const std::vector< uint8_t >& bytecode );

/**
 * The program account and program data account of an upgradeable program.
 */
std::pair< account, account > program_accounts( const pubkey& program_id, const std::vector< uint8_t >& bytecode );

} // mollusk::program
