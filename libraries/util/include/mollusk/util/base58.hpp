#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mollusk::util {

std::string encode_base58( const uint8_t* begin, const uint8_t* end );
std::string encode_base58( const std::vector< uint8_t >& v );

/**
 * Decode a base58 string. Returns false on an invalid character.
 */
bool decode_base58( const std::string& s, std::vector< uint8_t >& out );

} // mollusk::util
