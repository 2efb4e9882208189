#pragma once

#include <mollusk/runtime/types.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace mollusk::runtime {

using seed_list = std::vector< std::vector< uint8_t > >;

/**
 * Derive a program address from seeds.
 *
 * Throws max_seed_length_exceeded_exception when there are too many seeds or
 * a seed is too long, and invalid_seeds_exception when the derived address
 * lies on the ed25519 curve.
 */
pubkey create_program_address( const seed_list& seeds, const pubkey& program_id );

/**
 * Find the first valid program address, trying bump seeds from 255 down to 0.
 * Returns the address and the bump seed appended to the seeds.
 */
std::pair< pubkey, uint8_t > find_program_address( const seed_list& seeds, const pubkey& program_id );

} // mollusk::runtime
