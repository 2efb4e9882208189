#include <mollusk/crypto/hash.hpp>

namespace mollusk::crypto {

encoder::encoder()
{
   mdctx = EVP_MD_CTX_create();
   MOLLUSK_ASSERT( mdctx, openssl_failure, "could not create digest context" );
   MOLLUSK_ASSERT( EVP_DigestInit_ex( mdctx, EVP_sha256(), NULL ) == 1, openssl_failure, "could not initialize sha256 digest" );
}

encoder::~encoder()
{
   if( mdctx ) EVP_MD_CTX_destroy( mdctx );
}

void encoder::write( const uint8_t* d, std::size_t len )
{
   MOLLUSK_ASSERT( EVP_DigestUpdate( mdctx, d, len ) == 1, openssl_failure, "sha256 update failed" );
}

void encoder::write( const std::vector< uint8_t >& v )
{
   write( v.data(), v.size() );
}

void encoder::write( const std::string& s )
{
   write( reinterpret_cast< const uint8_t* >( s.data() ), s.size() );
}

void encoder::reset()
{
   MOLLUSK_ASSERT( EVP_DigestInit_ex( mdctx, EVP_sha256(), NULL ) == 1, openssl_failure, "could not initialize sha256 digest" );
}

sha256_digest encoder::get_result()
{
   sha256_digest digest;
   unsigned int size = 0;
   MOLLUSK_ASSERT( EVP_DigestFinal_ex( mdctx, digest.data(), &size ) == 1, openssl_failure, "sha256 finalization failed" );
   MOLLUSK_ASSERT( size == digest.size(), openssl_failure, "unexpected sha256 digest size ${s}", ("s", size) );
   return digest;
}

sha256_digest sha256( const std::vector< std::vector< uint8_t > >& slices )
{
   encoder enc;
   for ( const auto& s : slices )
      enc.write( s );
   return enc.get_result();
}

} // mollusk::crypto
