#pragma once

#include <mollusk/exception.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace mollusk::util {

MOLLUSK_DECLARE_EXCEPTION( binary_exception );
MOLLUSK_DECLARE_DERIVED_EXCEPTION( unexpected_end_of_data, binary_exception );

/**
 * Sequential little-endian reader over a byte range.
 */
class binary_reader
{
   public:
      binary_reader( const uint8_t* data, std::size_t size ) : _data( data ), _size( size ) {}
      binary_reader( const std::vector< uint8_t >& v ) : binary_reader( v.data(), v.size() ) {}

      template< typename T >
      T read()
      {
         static_assert( std::is_integral_v< T >, "binary_reader only reads integral types" );
         MOLLUSK_ASSERT( remaining() >= sizeof( T ), unexpected_end_of_data,
            "expected ${n} bytes at offset ${o}", ("n", sizeof( T ))("o", _pos) );

         std::make_unsigned_t< T > v = 0;
         for ( std::size_t i = 0; i < sizeof( T ); i++ )
            v |= std::make_unsigned_t< T >( _data[ _pos + i ] ) << ( 8 * i );

         _pos += sizeof( T );
         return T( v );
      }

      template< std::size_t N >
      std::array< uint8_t, N > read_array()
      {
         MOLLUSK_ASSERT( remaining() >= N, unexpected_end_of_data,
            "expected ${n} bytes at offset ${o}", ("n", N)("o", _pos) );

         std::array< uint8_t, N > a;
         std::memcpy( a.data(), _data + _pos, N );
         _pos += N;
         return a;
      }

      std::vector< uint8_t > read_bytes( std::size_t n )
      {
         MOLLUSK_ASSERT( remaining() >= n, unexpected_end_of_data,
            "expected ${n} bytes at offset ${o}", ("n", n)("o", _pos) );

         std::vector< uint8_t > v( _data + _pos, _data + _pos + n );
         _pos += n;
         return v;
      }

      std::size_t remaining() const { return _size - _pos; }
      std::size_t position() const { return _pos; }

   private:
      const uint8_t* _data;
      std::size_t    _size;
      std::size_t    _pos = 0;
};

/**
 * Little-endian writer appending to a byte vector.
 */
class binary_writer
{
   public:
      template< typename T >
      binary_writer& write( T t )
      {
         static_assert( std::is_integral_v< T >, "binary_writer only writes integral types" );
         auto v = std::make_unsigned_t< T >( t );
         for ( std::size_t i = 0; i < sizeof( T ); i++ )
            _buf.push_back( uint8_t( v >> ( 8 * i ) ) );
         return *this;
      }

      template< std::size_t N >
      binary_writer& write( const std::array< uint8_t, N >& a )
      {
         _buf.insert( _buf.end(), a.begin(), a.end() );
         return *this;
      }

      binary_writer& write( const std::vector< uint8_t >& v )
      {
         _buf.insert( _buf.end(), v.begin(), v.end() );
         return *this;
      }

      const std::vector< uint8_t >& data() const & { return _buf; }
      std::vector< uint8_t > data() && { return std::move( _buf ); }

   private:
      std::vector< uint8_t > _buf;
};

std::string to_hex( const std::vector< uint8_t >& v );

} // mollusk::util
