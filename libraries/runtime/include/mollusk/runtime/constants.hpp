#pragma once

#include <mollusk/runtime/types.hpp>

#include <cstdint>

namespace mollusk::runtime {

namespace program_id {

const pubkey& system_program();
const pubkey& bpf_loader();
const pubkey& bpf_loader_upgradeable();
const pubkey& native_loader();

} // program_id

namespace constants {

// Largest account data allowed after any resize
constexpr uint64_t max_permitted_data_length = 10 * 1024 * 1024;

// Account storage overhead charged by rent on top of the data length
constexpr uint64_t account_storage_overhead = 128;

// Accounts are addressed by 16 bit indices
constexpr std::size_t max_transaction_accounts = 0xffff;

constexpr std::size_t max_seeds       = 16;
constexpr std::size_t max_seed_length = 32;

// Size of the upgradeable loader's program data header
constexpr std::size_t program_data_metadata_size = 45;

} // constants

} // mollusk::runtime
