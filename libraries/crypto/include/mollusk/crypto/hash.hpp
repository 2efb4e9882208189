#pragma once
#include <mollusk/exception.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mollusk::crypto {

MOLLUSK_DECLARE_EXCEPTION( crypto_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( openssl_failure, crypto_exception );

using sha256_digest = std::array< uint8_t, 32 >;

/**
 * Incremental SHA-256 over OpenSSL's EVP interface.
 */
class encoder
{
   public:
      encoder();
      ~encoder();

      encoder( const encoder& ) = delete;
      encoder& operator=( const encoder& ) = delete;

      void write( const uint8_t* d, std::size_t len );
      void write( const std::vector< uint8_t >& v );
      void write( const std::string& s );

      template< std::size_t N >
      void write( const std::array< uint8_t, N >& a )
      {
         write( a.data(), N );
      }

      void reset();
      sha256_digest get_result();

   private:
      EVP_MD_CTX* mdctx = nullptr;
};

sha256_digest sha256( const std::vector< std::vector< uint8_t > >& slices );

} // mollusk::crypto
