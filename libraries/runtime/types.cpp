#include <mollusk/runtime/types.hpp>

#include <mollusk/util/base58.hpp>

#include <atomic>
#include <cstring>

namespace mollusk::runtime {

pubkey pubkey::from_string( const std::string& s )
{
   std::vector< uint8_t > decoded;
   MOLLUSK_ASSERT( util::decode_base58( s, decoded ), invalid_pubkey_exception, "invalid base58 pubkey '${s}'", ("s", s) );
   MOLLUSK_ASSERT( decoded.size() == size, invalid_pubkey_exception,
      "pubkey '${s}' decodes to ${n} bytes", ("s", s)("n", decoded.size()) );

   bytes_type b;
   std::memcpy( b.data(), decoded.data(), size );
   return pubkey( b );
}

pubkey pubkey::from_bytes( const uint8_t* data, std::size_t len )
{
   MOLLUSK_ASSERT( len == size, invalid_pubkey_exception, "pubkey must be ${s} bytes, got ${n}", ("s", size)("n", len) );

   bytes_type b;
   std::memcpy( b.data(), data, size );
   return pubkey( b );
}

pubkey pubkey::new_unique()
{
   static std::atomic< uint64_t > counter{ 1 };
   uint64_t i = counter.fetch_add( 1 );

   // Big endian so that the bytewise ordering follows creation order
   bytes_type b{};
   for ( std::size_t j = 0; j < sizeof( uint64_t ); j++ )
      b[ j ] = uint8_t( i >> ( 8 * ( sizeof( uint64_t ) - 1 - j ) ) );

   return pubkey( b );
}

std::string pubkey::to_string() const
{
   return util::encode_base58( _bytes.data(), _bytes.data() + _bytes.size() );
}

std::ostream& operator<<( std::ostream& os, const pubkey& k )
{
   return os << k.to_string();
}

} // mollusk::runtime
