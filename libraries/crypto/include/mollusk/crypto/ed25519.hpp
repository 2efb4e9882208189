#pragma once

#include <array>
#include <cstdint>

namespace mollusk::crypto {

/**
 * Returns true if the 32 bytes decompress to a point on the ed25519 curve.
 *
 * The encoding is the little-endian y coordinate with the sign of x in the top
 * bit. Decompression succeeds iff (y^2 - 1) / (d*y^2 + 1) is a square mod p.
 */
bool is_on_ed25519_curve( const std::array< uint8_t, 32 >& compressed );

} // mollusk::crypto
